#include "cli/commands/InitCommand.hpp"

#include <filesystem>
#include <iostream>

#include "core/Repository.hpp"

namespace fs = std::filesystem;

namespace oops {

Expected<void> InitCommand::execute(const AppContext& ctx, const std::vector<std::string>& args) {
    if (args.size() > 1) {
        return Error{ErrorCode::InvalidArgs, "init: too many arguments"};
    }
    fs::path target = args.empty() ? ctx.workingDir() : ctx.workingDir() / args.front();

    auto res = Repository::instance().init(target);
    if (!res) return res;

    std::cout << "Initialized empty oops repository in "
              << (fs::absolute(target) / ".oops").lexically_normal().string() << "\n";
    return {};
}

}
