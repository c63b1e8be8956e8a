#include "cli/CommandInvoker.hpp"

#include <filesystem>

#include "cli/CommandFactory.hpp"
#include "util/Logger.hpp"

namespace oops {

Expected<void> CommandInvoker::invoke(ICommand& cmd, const AppContext& ctx, const std::vector<std::string>& args) {
    Logger::instance().debug(std::string("Executing command: ") + cmd.name());

    Expected<void> res;
    try {
        res = cmd.execute(ctx, args);
    } catch (const std::filesystem::filesystem_error& e) {
        res = Error{ErrorCode::IoError, e.what()};
    }

    if (!res) {
        Logger::instance().error(std::string(cmd.name()) + ": " + res.error().message +
                                 " [" + errorCodeName(res.error().code) + "]");
    }
    return res;
}

Expected<void> CommandInvoker::invoke(const std::string& name, const AppContext& ctx,
                                      const std::vector<std::string>& args) {
    auto cmd = CommandFactory::instance().create(name);
    if (!cmd) {
        Error err{ErrorCode::InvalidArgs, "'" + name + "' is not an oops command. See 'oops help'."};
        Logger::instance().error(err.message);
        return err;
    }
    return invoke(*cmd, ctx, args);
}

}
