#include "cli/commands/AddCommand.hpp"

#include <filesystem>
#include <string>
#include <vector>

#include "core/IgnoreMatcher.hpp"
#include "core/Index.hpp"
#include "core/ObjectStore.hpp"
#include "core/Repository.hpp"
#include "core/StagingArea.hpp"

namespace fs = std::filesystem;

namespace oops {

/**
 * @brief Execute 'oops add' command
 *
 * Each pathspec is taken relative to the current directory and staged
 * through StagingArea::addTree:
 *   - Current directory: oops add .
 *   - Files and directories: oops add src/ README
 *   - Glob patterns: oops add "*.txt"
 *
 * Ignored paths are reported and skipped.
 */
Expected<void> AddCommand::execute(const AppContext& ctx, const std::vector<std::string>& args) {
    if (args.empty()) {
        return Error{ErrorCode::InvalidArgs, "add: missing <pathspec>"};
    }

    auto rootRes = Repository::instance().discoverRoot(ctx.workingDir());
    if (!rootRes) return rootRes.error();
    fs::path root = rootRes.value();

    ObjectStore store(root);
    Index index;
    auto loaded = index.load(root);
    if (!loaded) return loaded;

    auto ignore = IgnoreMatcher::load(root);
    if (!ignore) return ignore.error();

    StagingArea staging(root, store, index);
    fs::path cwd = ctx.workingDir();
    for (const auto& arg : args) {
        std::string pathspec = Repository::toRepoRelative(root, cwd, arg);
        auto res = staging.addTree(pathspec, ignore.value());
        if (!res) return res.error();
    }
    return {};
}

}
