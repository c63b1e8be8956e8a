#pragma once

#include "cli/ICommand.hpp"

namespace oops {

class RestoreCommand : public ICommand {
public:
    Expected<void> execute(const AppContext& ctx, const std::vector<std::string>& args) override;
    const char* name() const override { return "restore"; }
    const char* description() const override { return "Restore working tree files"; }
    const char* helpNameLine() const override { return "restore -  Restore working tree files"; }
    const char* helpSynopsis() const override { return "oops restore [--staged] [--source=<commit>] <path>"; }
    const char* helpDescription() const override { return "Overwrite a tracked working-tree path with the content recorded in HEAD, in the index (--staged), or in a given commit (--source)."; }
    std::vector<std::pair<std::string, std::string>> helpOptions() const override {
        return {
            {"--staged", "Restore the content recorded in the index."},
            {"--source=<commit>", "Restore the content recorded in <commit>."},
            {"<path>", "Tracked path to restore."},
        };
    }
};

}
