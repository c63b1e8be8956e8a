#pragma once

#include "cli/ICommand.hpp"

namespace oops {

class LogCommand : public ICommand {
public:
    Expected<void> execute(const AppContext& ctx, const std::vector<std::string>& args) override;
    const char* name() const override { return "log"; }
    const char* description() const override { return "Show commit history"; }
    const char* helpNameLine() const override { return "log -  Show commit logs"; }
    const char* helpSynopsis() const override { return "oops log [--branch <name>] [--page-size <n>] [--page <n>]"; }
    const char* helpDescription() const override { return "Show commits reachable from HEAD (or a branch), newest first, one page at a time."; }
    std::vector<std::pair<std::string, std::string>> helpOptions() const override {
        return {
            {"--branch <name>", "Start from the given branch instead of HEAD."},
            {"--page-size <n>", "Commits per page (default 10)."},
            {"--page <n>", "Page to show, starting at 1 (default 1)."},
        };
    }
};

}
