#include "cli/commands/StatusCommand.hpp"

#include <filesystem>
#include <iostream>

#include "core/IgnoreMatcher.hpp"
#include "core/Index.hpp"
#include "core/ObjectStore.hpp"
#include "core/Repository.hpp"
#include "core/Status.hpp"

namespace fs = std::filesystem;

namespace oops {

/**
 * @brief Execute 'oops status' command
 *
 * Shows:
 *   1. Current branch (or the detached HEAD)
 *   2. Changes to be committed (index vs HEAD snapshot)
 *   3. Changes not staged for commit (working tree vs index)
 *   4. Untracked top-level entries
 */
Expected<void> StatusCommand::execute(const AppContext& ctx, const std::vector<std::string>& args) {
    if (!args.empty()) {
        return Error{ErrorCode::InvalidArgs, "status: takes no arguments"};
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

    auto report = Status::collect(root, store, index, ignore.value());
    if (!report) return report.error();

    std::cout << Status::format(report.value());
    return {};
}

}
