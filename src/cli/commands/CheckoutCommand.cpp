#include "cli/commands/CheckoutCommand.hpp"

#include <filesystem>
#include <iostream>

#include "core/ObjectStore.hpp"
#include "core/Repository.hpp"

namespace fs = std::filesystem;

namespace oops {

/**
 * @brief Execute 'oops checkout' command
 *
 * Only HEAD and the branch pointer move. A name without a ref is taken
 * as a commit hash and leaves HEAD detached.
 */
Expected<void> CheckoutCommand::execute(const AppContext& ctx, const std::vector<std::string>& args) {
    if (args.size() != 1) {
        return Error{ErrorCode::InvalidArgs, "checkout: expected exactly one <branch|commit>"};
    }
    const std::string& target = args.front();

    auto rootRes = Repository::instance().discoverRoot(ctx.workingDir());
    if (!rootRes) return rootRes.error();
    fs::path root = rootRes.value();

    ObjectStore store(root);
    auto head = Repository::checkout(root, store, target);
    if (!head) return head.error();

    auto detached = Repository::isDetached(root);
    if (!detached) return detached.error();
    if (detached.value()) {
        std::cout << "HEAD is now at " << head.value().substr(0, 7) << " (detached)\n";
    } else {
        std::cout << "Switched to branch '" << target << "'\n";
    }
    return {};
}

}
