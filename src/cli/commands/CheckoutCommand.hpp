#pragma once

#include "cli/ICommand.hpp"

namespace oops {

class CheckoutCommand : public ICommand {
public:
    Expected<void> execute(const AppContext& ctx, const std::vector<std::string>& args) override;
    const char* name() const override { return "checkout"; }
    const char* description() const override { return "Switch branches or check out a commit"; }
    const char* helpNameLine() const override { return "checkout -  Move HEAD to a branch or commit"; }
    const char* helpSynopsis() const override { return "oops checkout <branch|commit>"; }
    const char* helpDescription() const override { return "Point HEAD at the commit a branch refers to, or directly at a commit hash (detached HEAD). The working tree is not modified."; }
    std::vector<std::pair<std::string, std::string>> helpOptions() const override {
        return { {"<branch|commit>", "Branch name or full commit hash."} };
    }
};

}
