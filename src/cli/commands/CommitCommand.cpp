#include "cli/commands/CommitCommand.hpp"

#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

#include "core/History.hpp"
#include "core/Index.hpp"
#include "core/ObjectStore.hpp"
#include "core/Repository.hpp"

namespace oops {

namespace fs = std::filesystem;

/**
 * @brief Execute 'oops commit' command
 *
 * Records the current index as a new commit on top of HEAD.
 *
 * Supports:
 *   -m <msg>              : Commit message (required, multiple allowed)
 *   --meta <key> <value>  : Extra header stored with the commit
 *
 * Multiple -m flags create multi-paragraph messages separated by blank lines.
 * Example: `-m "First line" -m "Second paragraph"` creates:
 *   First line
 *
 *   Second paragraph
 */
Expected<void> CommitCommand::execute(const AppContext& ctx, const std::vector<std::string>& args) {
    std::vector<std::string> messageParts;
    History::Metadata metadata;

    for (size_t i = 0; i < args.size(); ++i) {
        if (args[i] == "-m") {
            if (i + 1 >= args.size()) {
                return Error{ErrorCode::InvalidArgs, "commit: -m requires a message"};
            }
            messageParts.push_back(args[++i]);
        } else if (args[i] == "--meta") {
            if (i + 2 >= args.size()) {
                return Error{ErrorCode::InvalidArgs, "commit: --meta requires <key> <value>"};
            }
            metadata[args[i + 1]] = args[i + 2];
            i += 2;
        } else {
            return Error{ErrorCode::InvalidArgs, "commit: unknown argument '" + args[i] + "'"};
        }
    }

    if (messageParts.empty()) {
        return Error{ErrorCode::InvalidArgs, "commit: no commit message provided (-m required)"};
    }

    std::string message;
    for (size_t i = 0; i < messageParts.size(); ++i) {
        if (i > 0) {
            message += "\n\n";
        }
        message += messageParts[i];
    }

    auto rootRes = Repository::instance().discoverRoot(ctx.workingDir());
    if (!rootRes) return rootRes.error();
    fs::path root = rootRes.value();

    Index index;
    auto loaded = index.load(root);
    if (!loaded) return loaded;

    ObjectStore store(root);
    auto hash = History::commit(root, store, index.entries(), message, metadata);
    if (!hash) return hash.error();

    auto branch = Repository::getCurrentBranch(root);
    if (!branch) return branch.error();

    std::string firstLine = message.substr(0, message.find('\n'));
    std::cout << "[" << branch.value() << " " << hash.value().substr(0, 7) << "] " << firstLine << "\n";
    return {};
}

}
