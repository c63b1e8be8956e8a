#pragma once

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "cli/ICommand.hpp"

namespace oops {

/**
 * @brief Name-keyed registry of command creators
 *
 * Commands are kept ordered by name so listings need no sorting.
 * Registering a name twice replaces the earlier creator.
 */
class CommandFactory {
public:
    using Creator = std::function<std::unique_ptr<ICommand>()>;

    static CommandFactory& instance();

    void registerCreator(const std::string& name, Creator creator);

    /// Register a default-constructible command under its own name()
    template <typename Command>
    void registerCommand() {
        Command probe;
        registerCreator(probe.name(), [] { return std::make_unique<Command>(); });
    }

    bool contains(const std::string& name) const;
    std::unique_ptr<ICommand> create(const std::string& name) const;

    /// One fresh instance of every registered command, in name order
    std::vector<std::unique_ptr<ICommand>> createAll() const;

private:
    CommandFactory() = default;
    std::map<std::string, Creator> creators;
};

}
