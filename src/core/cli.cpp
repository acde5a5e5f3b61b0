#include "fastpack/core/cli.hpp"
#include "fastpack/core/utils.hpp"
#include <charconv>
#include <iomanip>
#include <iostream>

namespace fastpack::core {

namespace {
    constexpr const char* VERSION = "0.3.0";
    constexpr int USAGE_COLUMN = 26;
}

CommandLineParser::CommandLineParser(const std::string& program_name)
    : program_name_(program_name) {
    add_option("h", "help", "Show this help message");
    add_option("v", "version", "Show version information");
    add_option("c", "config", "Configuration file path", true, "~/.fastpack.conf");
    add_option("", "verbose", "Enable debug logging");
}

void CommandLineParser::add_option(const std::string& short_name, const std::string& long_name,
                                   const std::string& description, bool has_value,
                                   const std::string& default_value) {
    const auto& key = long_name.empty() ? short_name : long_name;
    if (key.empty()) {
        return;
    }
    
    if (!options_.contains(key)) {
        declared_order_.push_back(key);
    }
    options_[key] = Option{short_name, description, has_value, default_value};
    if (!short_name.empty()) {
        short_names_[short_name] = key;
    }
}

bool CommandLineParser::parse(int argc, char* argv[]) {
    values_.clear();
    positional_args_.clear();
    error_.clear();
    
    for (int index = 1; index < argc; ++index) {
        std::string arg = argv[index];
        
        if (arg == "--") {
            positional_args_.insert(positional_args_.end(), argv + index + 1, argv + argc);
            break;
        }
        
        bool ok = true;
        if (arg.size() > 2 && arg.starts_with("--")) {
            ok = parse_long(arg, index, argc, argv);
        } else if (arg.size() > 1 && arg.front() == '-') {
            ok = parse_short(arg, index, argc, argv);
        } else {
            positional_args_.push_back(std::move(arg));
        }
        
        if (!ok) {
            return false;
        }
    }
    return true;
}

bool CommandLineParser::parse_long(const std::string& arg, int& index, int argc, char* argv[]) {
    auto separator = arg.find('=');
    auto name = arg.substr(2, separator == std::string::npos ? std::string::npos : separator - 2);
    
    auto it = options_.find(name);
    if (it == options_.end()) {
        return reject("Unknown option: --" + name);
    }
    
    if (!it->second.has_value) {
        if (separator != std::string::npos) {
            return reject("Option --" + name + " does not take a value");
        }
        values_[name] = "true";
        return true;
    }
    
    if (separator != std::string::npos) {
        values_[name] = arg.substr(separator + 1);
    } else if (index + 1 < argc) {
        values_[name] = argv[++index];
    } else {
        return reject("Option --" + name + " requires a value");
    }
    return true;
}

bool CommandLineParser::parse_short(const std::string& arg, int& index, int argc, char* argv[]) {
    for (size_t pos = 1; pos < arg.size(); ++pos) {
        auto flag = arg.substr(pos, 1);
        auto it = short_names_.find(flag);
        if (it == short_names_.end()) {
            return reject("Unknown option: -" + flag);
        }
        
        const auto& name = it->second;
        if (!options_.at(name).has_value) {
            values_[name] = "true";
            continue;
        }
        
        // A valued flag consumes the rest of the bundle, or the next argument.
        if (pos + 1 < arg.size()) {
            values_[name] = arg.substr(pos + 1);
        } else if (index + 1 < argc) {
            values_[name] = argv[++index];
        } else {
            return reject("Option -" + flag + " requires a value");
        }
        return true;
    }
    return true;
}

bool CommandLineParser::reject(const std::string& message) {
    error_ = message;
    return false;
}

std::string CommandLineParser::resolve(const std::string& name) const {
    auto it = short_names_.find(name);
    return it == short_names_.end() ? name : it->second;
}

bool CommandLineParser::has_option(const std::string& name) const {
    return values_.contains(resolve(name));
}

std::string CommandLineParser::get_option(const std::string& name, const std::string& default_value) const {
    auto key = resolve(name);
    if (auto it = values_.find(key); it != values_.end()) {
        return it->second;
    }
    if (auto it = options_.find(key); it != options_.end() && !it->second.default_value.empty()) {
        return it->second.default_value;
    }
    return default_value;
}

int CommandLineParser::get_int_option(const std::string& name, int default_value) const {
    auto text = get_option(name);
    int value = 0;
    auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (text.empty() || ec != std::errc() || end != text.data() + text.size()) {
        return default_value;
    }
    return value;
}

bool CommandLineParser::get_bool_option(const std::string& name, bool default_value) const {
    if (!has_option(name)) {
        return default_value;
    }
    auto text = utils::StringUtils::to_lower(get_option(name));
    return text.empty() || text == "true" || text == "1" || text == "yes";
}

void CommandLineParser::print_help() const {
    std::cout << "Usage: " << program_name_ << " [options] <command> [args...]\n\nOptions:\n";
    
    for (const auto& name : declared_order_) {
        const auto& option = options_.at(name);
        std::string usage = option.short_name.empty() ? "    " : "-" + option.short_name + ", ";
        usage += "--" + name;
        if (option.has_value) {
            usage += " <value>";
        }
        
        std::cout << "  " << std::left << std::setw(USAGE_COLUMN) << usage << option.description;
        if (!option.default_value.empty()) {
            std::cout << " (default: " << option.default_value << ")";
        }
        std::cout << "\n";
    }
}

void CommandLineParser::print_version() const {
    std::cout << program_name_ << " " << VERSION << "\n";
}

} // namespace fastpack::core
