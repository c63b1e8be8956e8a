#include "cli/commands/BranchCommand.hpp"

#include <filesystem>
#include <iostream>

#include "core/Repository.hpp"

namespace fs = std::filesystem;

namespace oops {

Expected<void> BranchCommand::execute(const AppContext& ctx, const std::vector<std::string>& args) {
    if (args.size() > 1) {
        return Error{ErrorCode::InvalidArgs, "branch: too many arguments"};
    }

    auto rootRes = Repository::instance().discoverRoot(ctx.workingDir());
    if (!rootRes) return rootRes.error();
    fs::path root = rootRes.value();

    if (!args.empty()) {
        auto res = Repository::createBranch(root, args.front());
        if (!res) return res;
        std::cout << "Created branch " << args.front() << "\n";
        return {};
    }

    auto branches = Repository::listBranches(root);
    if (!branches) return branches.error();
    auto current = Repository::getCurrentBranch(root);
    if (!current) return current.error();

    for (const auto& name : branches.value()) {
        std::cout << (name == current.value() ? "* " : "  ") << name << "\n";
    }
    return {};
}

}
