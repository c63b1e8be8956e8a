#include "cli/commands/RestoreCommand.hpp"

#include <filesystem>
#include <string>

#include "core/Index.hpp"
#include "core/ObjectStore.hpp"
#include "core/Repository.hpp"
#include "core/Restore.hpp"

namespace fs = std::filesystem;

namespace oops {

/**
 * @brief Execute 'oops restore' command
 *
 * Usage:
 *   oops restore <path>                   - Content from HEAD
 *   oops restore --staged <path>          - Content recorded in the index
 *   oops restore --source=<commit> <path> - Content from a specific commit
 */
Expected<void> RestoreCommand::execute(const AppContext& ctx, const std::vector<std::string>& args) {
    RestoreOptions options;
    std::string path;

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if (arg == "--staged") {
            options.staged = true;
        } else if (arg.rfind("--source=", 0) == 0) {
            options.source = arg.substr(9);
        } else if (arg == "--source") {
            if (i + 1 >= args.size()) {
                return Error{ErrorCode::InvalidArgs, "restore: --source requires a commit"};
            }
            options.source = args[++i];
        } else if (!arg.empty() && arg[0] == '-') {
            return Error{ErrorCode::InvalidArgs, "restore: unknown option '" + arg + "'"};
        } else if (path.empty()) {
            path = arg;
        } else {
            return Error{ErrorCode::InvalidArgs, "restore: only one <path> is accepted"};
        }
    }
    if (path.empty()) {
        return Error{ErrorCode::InvalidArgs, "restore: missing <path>"};
    }

    auto rootRes = Repository::instance().discoverRoot(ctx.workingDir());
    if (!rootRes) return rootRes.error();
    fs::path root = rootRes.value();

    ObjectStore store(root);
    Index index;
    auto loaded = index.load(root);
    if (!loaded) return loaded;

    return restorePath(root, store, index, Repository::toRepoRelative(root, ctx.workingDir(), path), options);
}

}
