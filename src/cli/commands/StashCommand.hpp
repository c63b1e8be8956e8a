#pragma once

#include "cli/ICommand.hpp"

namespace oops {

class StashCommand : public ICommand {
public:
    Expected<void> execute(const AppContext& ctx, const std::vector<std::string>& args) override;
    const char* name() const override { return "stash"; }
    const char* description() const override { return "Record a bookmark of HEAD"; }
    const char* helpNameLine() const override { return "stash -  Record a bookmark object for the current HEAD"; }
    const char* helpSynopsis() const override { return "oops stash"; }
    const char* helpDescription() const override { return "Write an object naming the current HEAD commit and the time, and print its hash. The working tree and index are not touched."; }
    std::vector<std::pair<std::string, std::string>> helpOptions() const override { return {}; }
};

}
