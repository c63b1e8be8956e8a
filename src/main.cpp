// Command-line entry: registers every command and dispatches argv[1].

#include <iostream>
#include <string>
#include <vector>

#include "cli/CommandFactory.hpp"
#include "cli/CommandInvoker.hpp"
#include "cli/ICommand.hpp"
#include "cli/commands/AddCommand.hpp"
#include "cli/commands/BranchCommand.hpp"
#include "cli/commands/CheckoutCommand.hpp"
#include "cli/commands/CommitCommand.hpp"
#include "cli/commands/DiffCommand.hpp"
#include "cli/commands/HelpCommand.hpp"
#include "cli/commands/InitCommand.hpp"
#include "cli/commands/LogCommand.hpp"
#include "cli/commands/RestoreCommand.hpp"
#include "cli/commands/RmCommand.hpp"
#include "cli/commands/StashCommand.hpp"
#include "cli/commands/StatusCommand.hpp"

using namespace oops;

static void registerCommands() {
    auto& f = CommandFactory::instance();
    f.registerCommand<HelpCommand>();
    f.registerCommand<InitCommand>();
    f.registerCommand<AddCommand>();
    f.registerCommand<CommitCommand>();
    f.registerCommand<BranchCommand>();
    f.registerCommand<CheckoutCommand>();
    f.registerCommand<RmCommand>();
    f.registerCommand<RestoreCommand>();
    f.registerCommand<StashCommand>();
    f.registerCommand<LogCommand>();
    f.registerCommand<DiffCommand>();
    f.registerCommand<StatusCommand>();
}

int main(int argc, char** argv) {
    registerCommands();
    std::vector<std::string> args(argv + 1, argv + argc);
    AppContext ctx{};
    CommandInvoker invoker;

    if (args.empty()) {
        return invoker.invoke("help", ctx, {}) ? 0 : 1;
    }

    std::string cmdName = args.front();
    args.erase(args.begin());
    if (!CommandFactory::instance().contains(cmdName)) {
        std::cerr << "Unknown command: " << cmdName << "\n";
        invoker.invoke("help", ctx, {});
        return 1;
    }
    return invoker.invoke(cmdName, ctx, args) ? 0 : 1;
}
