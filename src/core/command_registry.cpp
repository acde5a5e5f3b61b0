#include "fastpack/core/command_registry.hpp"
#include "fastpack/core/logger.hpp"
#include <iomanip>
#include <iostream>

namespace fastpack::core {

namespace {
    constexpr int NAME_COLUMN = 10;
}

CommandRegistry::CommandRegistry() {
    register_command("pack", std::make_unique<PackCommandHandler>());
    register_command("status", std::make_unique<StatusCommandHandler>());
    register_command("fetch", std::make_unique<FetchCommandHandler>());
}

void CommandRegistry::register_command(const std::string& name, std::unique_ptr<CommandHandler> handler) {
    if (!handlers_.contains(name)) {
        order_.push_back(name);
    }
    handlers_[name] = std::move(handler);
}

CommandHandler* CommandRegistry::find(const std::string& command) const {
    auto it = handlers_.find(command);
    return it == handlers_.end() ? nullptr : it->second.get();
}

CommandResult CommandRegistry::execute_command(const std::string& command, const std::vector<std::string>& args) {
    auto* handler = find(command);
    if (handler == nullptr) {
        return CommandResult::error("Unknown command: " + command);
    }
    
    LOG_DEBUG("Running command '{}' with {} argument(s)", command, args.empty() ? 0 : args.size() - 1);
    auto result = handler->execute(args);
    if (!result.success) {
        LOG_DEBUG("Command '{}' failed with exit code {}", command, result.exit_code);
    }
    return result;
}

bool CommandRegistry::has_command(const std::string& command) const {
    return find(command) != nullptr;
}

void CommandRegistry::print_help() const {
    std::cout << "\nCommands:\n";
    
    for (const auto& name : order_) {
        const auto* handler = find(name);
        std::cout << "  " << std::left << std::setw(NAME_COLUMN) << name << handler->get_description() << "\n"
                  << "  " << std::setw(NAME_COLUMN) << " " << "Usage: " << handler->get_usage() << "\n\n";
    }
}

} // namespace fastpack::core
