// command_registry.hpp
#pragma once
#include "base_command.hpp"
#include <functional>
#include <vector>
#include <memory>

class CommandRegistry {
public:
    using Creator = std::function<std::unique_ptr<BaseCommand>()>;

    static CommandRegistry& instance() {
        static CommandRegistry registry;
        return registry;
    }

    void registerCommand(Creator creator) {
        creators.push_back(std::move(creator));
    }

    std::vector<std::unique_ptr<BaseCommand>> createAll() const {
        std::vector<std::unique_ptr<BaseCommand>> result;
        for (const auto& creator : creators) {
            result.push_back(creator());
        }
        return result;
    }

    // nullptr when no command is registered under that name
    std::unique_ptr<BaseCommand> create(const std::string& name) const {
        for (const auto& creator : creators) {
            auto command = creator();
            if (command->name() == name)
                return command;
        }
        return nullptr;
    }

private:
    std::vector<Creator> creators;
};
