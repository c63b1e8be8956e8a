#pragma once

#include "cli/ICommand.hpp"

namespace oops {

class StatusCommand : public ICommand {
public:
    Expected<void> execute(const AppContext& ctx, const std::vector<std::string>& args) override;
    const char* name() const override { return "status"; }
    const char* description() const override { return "Show the working tree status"; }
    const char* helpNameLine() const override { return "status -  Show the working tree status"; }
    const char* helpSynopsis() const override { return "oops status"; }
    const char* helpDescription() const override { return "Show the current branch, changes staged relative to HEAD, tracked paths modified or deleted in the working tree, and untracked top-level paths."; }
    std::vector<std::pair<std::string, std::string>> helpOptions() const override { return {}; }
};

}
