#include "cli/commands/StashCommand.hpp"

#include <filesystem>
#include <iostream>

#include "core/History.hpp"
#include "core/ObjectStore.hpp"
#include "core/Repository.hpp"

namespace fs = std::filesystem;

namespace oops {

Expected<void> StashCommand::execute(const AppContext& ctx, const std::vector<std::string>& args) {
    if (!args.empty()) {
        return Error{ErrorCode::InvalidArgs, "stash: takes no arguments"};
    }

    auto rootRes = Repository::instance().discoverRoot(ctx.workingDir());
    if (!rootRes) return rootRes.error();
    fs::path root = rootRes.value();

    ObjectStore store(root);
    auto hash = History::stash(root, store, History::now());
    if (!hash) return hash.error();

    std::cout << "Saved stash " << hash.value() << "\n";
    return {};
}

}
