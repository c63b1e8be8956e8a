#include "cli/commands/RmCommand.hpp"

#include <filesystem>
#include <iostream>
#include <string>

#include "core/Index.hpp"
#include "core/ObjectStore.hpp"
#include "core/Repository.hpp"
#include "core/StagingArea.hpp"

namespace fs = std::filesystem;

namespace oops {

Expected<void> RmCommand::execute(const AppContext& ctx, const std::vector<std::string>& args) {
    RmOptions options;
    std::string pattern;

    for (const auto& arg : args) {
        if (arg == "--cached") {
            options.cached = true;
        } else if (arg == "--recursive" || arg == "-r") {
            options.recursive = true;
        } else if (arg == "--dry-run" || arg == "-n") {
            options.dryRun = true;
        } else if (!arg.empty() && arg[0] == '-') {
            return Error{ErrorCode::InvalidArgs, "rm: unknown option '" + arg + "'"};
        } else if (pattern.empty()) {
            pattern = arg;
        } else {
            return Error{ErrorCode::InvalidArgs, "rm: only one <pattern> is accepted"};
        }
    }
    if (pattern.empty()) {
        return Error{ErrorCode::InvalidArgs, "rm: missing <pattern>"};
    }

    auto rootRes = Repository::instance().discoverRoot(ctx.workingDir());
    if (!rootRes) return rootRes.error();
    fs::path root = rootRes.value();

    ObjectStore store(root);
    Index index;
    auto loaded = index.load(root);
    if (!loaded) return loaded;

    StagingArea staging(root, store, index);
    auto removed = staging.remove(Repository::toRepoRelative(root, ctx.workingDir(), pattern), options);
    if (!removed) return removed.error();

    std::cout << (options.dryRun ? "Would remove " : "Removed ") << removed.value()
              << (removed.value() == 1 ? " entry" : " entries") << "\n";
    return {};
}

}
