#pragma once

#include <map>
#include <memory>
#include <string>
#include <vector>

#include "command_handler.hpp"

namespace fastpack::core {

// Maps command words to handlers. Registration order is kept for help output.
class CommandRegistry {
public:
    CommandRegistry();
    
    void register_command(const std::string& name, std::unique_ptr<CommandHandler> handler);
    CommandResult execute_command(const std::string& command, const std::vector<std::string>& args);
    bool has_command(const std::string& command) const;
    std::vector<std::string> command_names() const { return order_; }
    
    void print_help() const;

private:
    CommandHandler* find(const std::string& command) const;
    
    std::map<std::string, std::unique_ptr<CommandHandler>> handlers_;
    std::vector<std::string> order_;
};

} // namespace fastpack::core
