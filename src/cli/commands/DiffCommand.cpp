#include "cli/commands/DiffCommand.hpp"

#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>

#include "core/Diff.hpp"
#include "core/ObjectStore.hpp"
#include "core/Repository.hpp"

namespace fs = std::filesystem;

namespace oops {

Expected<void> DiffCommand::execute(const AppContext& ctx, const std::vector<std::string>& args) {
    DiffOptions options;
    std::vector<std::string> hashes;

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if (arg == "--generate-patch") {
            options.generatePatch = true;
        } else if (arg == "--context-lines") {
            if (i + 1 >= args.size()) {
                return Error{ErrorCode::InvalidArgs, "diff: --context-lines requires a value"};
            }
            const std::string& value = args[++i];
            if (value.empty() || value.find_first_not_of("0123456789") != std::string::npos) {
                return Error{ErrorCode::InvalidArgs, "diff: invalid --context-lines value '" + value + "'"};
            }
            try {
                options.contextLines = static_cast<size_t>(std::stoull(value));
            } catch (const std::out_of_range&) {
                return Error{ErrorCode::InvalidArgs, "diff: --context-lines value out of range"};
            }
        } else if (!arg.empty() && arg[0] == '-') {
            return Error{ErrorCode::InvalidArgs, "diff: unknown option '" + arg + "'"};
        } else {
            hashes.push_back(arg);
        }
    }
    if (hashes.size() != 2) {
        return Error{ErrorCode::InvalidArgs, "diff: expected <hash1> <hash2>"};
    }

    auto rootRes = Repository::instance().discoverRoot(ctx.workingDir());
    if (!rootRes) return rootRes.error();

    ObjectStore store(rootRes.value());
    auto out = Diff::diffObjects(store, hashes[0], hashes[1], options);
    if (!out) return out.error();
    std::cout << out.value();
    return {};
}

}
