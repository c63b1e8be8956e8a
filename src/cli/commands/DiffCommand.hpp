#pragma once

#include "cli/ICommand.hpp"

namespace oops {

class DiffCommand : public ICommand {
public:
    Expected<void> execute(const AppContext& ctx, const std::vector<std::string>& args) override;
    const char* name() const override { return "diff"; }
    const char* description() const override { return "Show changes between two objects"; }
    const char* helpNameLine() const override { return "diff -  Show line changes between two stored objects"; }
    const char* helpSynopsis() const override { return "oops diff <hash1> <hash2> [--context-lines <n>] [--generate-patch]"; }
    const char* helpDescription() const override { return "Compare two objects line by line using their longest common subsequence and print removed ('-') and added ('+') lines."; }
    std::vector<std::pair<std::string, std::string>> helpOptions() const override {
        return {
            {"--context-lines <n>", "Accepted for compatibility; the full diff is always shown."},
            {"--generate-patch", "Include unchanged lines and a ---/+++ header."},
        };
    }
};

}
