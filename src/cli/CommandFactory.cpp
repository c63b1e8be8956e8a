#include "cli/CommandFactory.hpp"

namespace oops {

CommandFactory& CommandFactory::instance() {
    static CommandFactory factory;
    return factory;
}

void CommandFactory::registerCreator(const std::string& name, Creator creator) {
    creators[name] = std::move(creator);
}

bool CommandFactory::contains(const std::string& name) const {
    return creators.count(name) != 0;
}

std::unique_ptr<ICommand> CommandFactory::create(const std::string& name) const {
    auto it = creators.find(name);
    return it == creators.end() ? nullptr : it->second();
}

std::vector<std::unique_ptr<ICommand>> CommandFactory::createAll() const {
    std::vector<std::unique_ptr<ICommand>> commands;
    commands.reserve(creators.size());
    for (const auto& kv : creators) {
        commands.push_back(kv.second());
    }
    return commands;
}

}
