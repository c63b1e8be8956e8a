#pragma once

#include "cli/ICommand.hpp"

namespace oops {

class InitCommand : public ICommand {
public:
    Expected<void> execute(const AppContext& ctx, const std::vector<std::string>& args) override;
    const char* name() const override { return "init"; }
    const char* description() const override { return "Create an empty repository"; }
    const char* helpNameLine() const override { return "init -  Create an empty oops repository"; }
    const char* helpSynopsis() const override { return "oops init [<directory>]"; }
    const char* helpDescription() const override { return "Create the .oops directory with an empty object database, a refs directory and the branch pointer set to main. Fails if the directory is already a repository."; }
    std::vector<std::pair<std::string, std::string>> helpOptions() const override {
        return { {"<directory>", "Directory to initialize (defaults to the current directory)."} };
    }
};

}
