#pragma once

#include <string>
#include <vector>

#include "cli/ICommand.hpp"

namespace oops {

/**
 * @brief Runs a command and reports its failure
 *
 * Errors are logged once here so individual commands only return them.
 * Filesystem exceptions escaping a command become IoError.
 */
class CommandInvoker {
public:
    Expected<void> invoke(ICommand& cmd, const AppContext& ctx, const std::vector<std::string>& args);

    /// Look up @p name in the factory and run it; unknown names are InvalidArgs
    Expected<void> invoke(const std::string& name, const AppContext& ctx, const std::vector<std::string>& args);
};

}
