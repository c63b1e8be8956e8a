#pragma once

#include "cli/ICommand.hpp"

namespace oops {

class CommitCommand : public ICommand {
public:
    Expected<void> execute(const AppContext& ctx, const std::vector<std::string>& args) override;
    const char* name() const override { return "commit"; }
    const char* description() const override { return "Commit staged changes"; }
    const char* helpNameLine() const override { return "commit -  Record changes to the repository"; }
    const char* helpSynopsis() const override { return "oops commit -m <msg> [-m <msg>]... [--meta <key> <value>]..."; }
    const char* helpDescription() const override { return "Create a new commit recording the current index, with HEAD as its parent, and move HEAD (and the current branch) to it."; }
    std::vector<std::pair<std::string, std::string>> helpOptions() const override {
        return {
            {"-m <msg>", "Use <msg> as the commit message; multiple -m concatenate paragraphs."},
            {"--meta <key> <value>", "Attach a metadata header to the commit."},
        };
    }
};

}
