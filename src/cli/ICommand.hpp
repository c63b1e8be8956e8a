#pragma once

#include <filesystem>
#include <string>
#include <utility>
#include <vector>

#include "util/Expected.hpp"

namespace oops {

/**
 * @brief Per-invocation state handed to every command
 *
 * Commands resolve relative paths and locate the repository from
 * workingDir(). An empty cwd means the process working directory.
 */
struct AppContext {
    std::filesystem::path cwd;

    std::filesystem::path workingDir() const {
        return cwd.empty() ? std::filesystem::current_path() : cwd;
    }
};

class ICommand {
public:
    virtual ~ICommand() = default;
    virtual Expected<void> execute(const AppContext& ctx, const std::vector<std::string>& args) = 0;
    virtual const char* name() const = 0;
    virtual const char* description() const = 0;                                        // one line for the command list
    virtual const char* helpNameLine() const = 0;                                       // "<cmd> - <one line>"
    virtual const char* helpSynopsis() const = 0;
    virtual const char* helpDescription() const = 0;
    virtual std::vector<std::pair<std::string, std::string>> helpOptions() const = 0;  // flag -> description
};

}
