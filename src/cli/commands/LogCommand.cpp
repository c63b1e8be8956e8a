#include "cli/commands/LogCommand.hpp"

#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>

#include "core/Constants.hpp"
#include "core/History.hpp"
#include "core/ObjectStore.hpp"
#include "core/Repository.hpp"

namespace fs = std::filesystem;

namespace oops {

namespace {

Expected<size_t> parseCount(const std::string& flag, const std::string& text) {
    if (text.empty() || text.find_first_not_of("0123456789") != std::string::npos) {
        return Error{ErrorCode::InvalidArgs, "log: " + flag + " expects a positive number, got '" + text + "'"};
    }
    try {
        return static_cast<size_t>(std::stoull(text));
    } catch (const std::out_of_range&) {
        return Error{ErrorCode::InvalidArgs, "log: " + flag + " value out of range: " + text};
    }
}

}

/**
 * @brief Execute 'oops log' command
 *
 * Walks parent links from HEAD (or --branch) and prints one page of
 * commits, newest first, followed by "Page N of M".
 */
Expected<void> LogCommand::execute(const AppContext& ctx, const std::vector<std::string>& args) {
    std::string branch;
    size_t pageSize = Constants::DEFAULT_PAGE_SIZE;
    size_t page = 1;

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if (arg != "--branch" && arg != "--page-size" && arg != "--page") {
            return Error{ErrorCode::InvalidArgs, "log: unknown argument '" + arg + "'"};
        }
        if (i + 1 >= args.size()) {
            return Error{ErrorCode::InvalidArgs, "log: " + arg + " requires a value"};
        }
        const std::string& value = args[++i];
        if (arg == "--branch") {
            branch = value;
            continue;
        }
        auto n = parseCount(arg, value);
        if (!n) return n.error();
        (arg == "--page" ? page : pageSize) = n.value();
    }

    auto rootRes = Repository::instance().discoverRoot(ctx.workingDir());
    if (!rootRes) return rootRes.error();
    fs::path root = rootRes.value();

    ObjectStore store(root);
    auto result = History::log(root, store, branch, pageSize, page);
    if (!result) return result.error();

    const LogPage& lp = result.value();
    for (const auto& commit : lp.commits) {
        std::cout << History::formatCommit(commit) << "\n";
    }
    std::cout << "Page " << lp.pageNumber << " of " << lp.pageCount << "\n";
    return {};
}

}
