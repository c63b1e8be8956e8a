#pragma once

#include "cli/ICommand.hpp"

namespace oops {

class BranchCommand : public ICommand {
public:
    Expected<void> execute(const AppContext& ctx, const std::vector<std::string>& args) override;
    const char* name() const override { return "branch"; }
    const char* description() const override { return "List or create branches"; }
    const char* helpNameLine() const override { return "branch -  List or create branches"; }
    const char* helpSynopsis() const override { return "oops branch [<name>]"; }
    const char* helpDescription() const override { return "Without arguments, list branches, marking the current one with '*'. With a name, create a branch pointing at the HEAD commit."; }
    std::vector<std::pair<std::string, std::string>> helpOptions() const override {
        return { {"<name>", "Name of the branch to create."} };
    }
};

}
