#pragma once

#include "cli/ICommand.hpp"

namespace oops {

class AddCommand : public ICommand {
public:
    Expected<void> execute(const AppContext& ctx, const std::vector<std::string>& args) override;
    const char* name() const override { return "add"; }
    const char* description() const override { return "Add file(s) to the staging area"; }
    const char* helpNameLine() const override { return "add -  Add file contents to the index"; }
    const char* helpSynopsis() const override { return "oops add <pathspec> [<pathspec> ...]"; }
    const char* helpDescription() const override { return "Store the current content of matching working-tree paths as objects and record them in the index. Paths matched by .oopsignore are skipped."; }
    std::vector<std::pair<std::string, std::string>> helpOptions() const override {
        return { {"<pathspec>", "File, directory, or glob pattern (e.g., *.txt, src/*, test?.py). Use '.' for the whole working tree."} };
    }
};

}
