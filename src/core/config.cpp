#include "fastpack/core/config.hpp"
#include "fastpack/core/logger.hpp"
#include "fastpack/core/utils.hpp"
#include <charconv>
#include <map>
#include <utility>

namespace fastpack::core {

namespace {
    const std::pair<const char*, const char*> DEFAULTS[] = {
        {"upload.chunk_size", "5242880"},
        {"upload.max_parts", "10000"},
        {"repack.part_size", "52428800"},
        {"repack.read_window", "10485760"},
        {"repack.compression_level", "0"},
        {"repack.max_pending_parts", "4"},
        {"repack.drain_timeout_ms", "60000"},
        {"repack.archive_name", "files.zip"},
        {"archive.extension", ".zip"},
        {"retry.max_attempts", "5"},
        {"retry.base_delay_ms", "1000"},
        {"retry.jitter_ms", "1000"},
        {"artifact.retention_hours", "720"},
        {"workers.background", "2"},
        {"workers.parts", "4"},
        {"storage.root", "./fastpack_data"},
        {"metadata.path", "./fastpack_data/fastpack.db"},
        {"log.level", "info"},
        {"log.file", "fastpack.log"},
    };
    
    template<typename T>
    std::optional<T> parse_number(const std::string& text) {
        T value{};
        auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
        if (text.empty() || ec != std::errc() || end != text.data() + text.size()) {
            return std::nullopt;
        }
        return value;
    }
}

Config& Config::instance() {
    static Config instance;
    return instance;
}

bool Config::load_from_file(const std::string& filename) {
    std::ifstream file(filename);
    if (!file) {
        return false;
    }
    
    std::string line;
    for (size_t number = 1; std::getline(file, line); ++number) {
        line = utils::StringUtils::trim(line);
        if (line.empty() || line.front() == '#') {
            continue;
        }
        
        auto separator = line.find('=');
        auto key = separator == std::string::npos ? std::string() : utils::StringUtils::trim(line.substr(0, separator));
        if (key.empty()) {
            LOG_WARN("{}:{}: ignoring line without key=value", filename, number);
            continue;
        }
        values_[key] = utils::StringUtils::trim(line.substr(separator + 1));
    }
    return true;
}

bool Config::save_to_file(const std::string& filename) const {
    std::ofstream file(filename);
    if (!file) {
        return false;
    }
    
    std::map<std::string, std::string> ordered(values_.begin(), values_.end());
    file << "# fastpack configuration\n";
    std::string section;
    for (const auto& [key, value] : ordered) {
        auto prefix = key.substr(0, key.find('.'));
        if (prefix != section) {
            file << "\n";
            section = prefix;
        }
        file << key << "=" << value << "\n";
    }
    return static_cast<bool>(file);
}

void Config::set(const std::string& key, const std::string& value) {
    values_[key] = value;
}

std::optional<std::string> Config::get(const std::string& key) const {
    auto it = values_.find(key);
    if (it == values_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool Config::get_bool(const std::string& key, bool default_value) const {
    auto value = get(key);
    if (!value) {
        return default_value;
    }
    auto lowered = utils::StringUtils::to_lower(*value);
    return lowered == "true" || lowered == "1" || lowered == "yes";
}

int Config::get_int(const std::string& key, int default_value) const {
    auto value = get(key);
    auto parsed = value ? parse_number<int>(*value) : std::nullopt;
    return parsed.value_or(default_value);
}

uint64_t Config::get_uint64(const std::string& key, uint64_t default_value) const {
    auto value = get(key);
    auto parsed = value ? parse_number<uint64_t>(*value) : std::nullopt;
    return parsed.value_or(default_value);
}

std::string Config::get_string(const std::string& key, const std::string& default_value) const {
    return get(key).value_or(default_value);
}

void Config::set_defaults() {
    for (const auto& [key, value] : DEFAULTS) {
        values_[key] = value;
    }
}

void Config::clear() {
    values_.clear();
}

} // namespace fastpack::core
