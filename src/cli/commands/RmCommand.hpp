#pragma once

#include "cli/ICommand.hpp"

namespace oops {

class RmCommand : public ICommand {
public:
    Expected<void> execute(const AppContext& ctx, const std::vector<std::string>& args) override;
    const char* name() const override { return "rm"; }
    const char* description() const override { return "Remove files from the index"; }
    const char* helpNameLine() const override { return "rm -  Remove files from the working tree and from the index"; }
    const char* helpSynopsis() const override { return "oops rm [--cached] [-r] [-n] <pattern>"; }
    const char* helpDescription() const override { return "Remove index entries matching a glob pattern, deleting the working-tree copies unless --cached is given."; }
    std::vector<std::pair<std::string, std::string>> helpOptions() const override {
        return {
            {"--cached", "Only remove from the index; keep working-tree files."},
            {"-r, --recursive", "Allow removing directory entries."},
            {"-n, --dry-run", "Show what would be removed without changing anything."},
            {"<pattern>", "Path or glob pattern matched against index paths."},
        };
    }
};

}
