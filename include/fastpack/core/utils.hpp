#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace fastpack::core::utils {

class StringUtils {
public:
    static std::string trim(const std::string& str);
    static std::string to_lower(const std::string& str);
    static bool ends_with_ignore_case(const std::string& str, const std::string& suffix);
    
    // Binary units, two decimals: "50.00 MiB".
    static std::string format_bytes(uint64_t bytes);
};

class FileUtils {
public:
    static bool exists(const std::filesystem::path& path);
    static bool is_file(const std::filesystem::path& path);
    static std::optional<uint64_t> file_size(const std::filesystem::path& path);
    static bool create_directories(const std::filesystem::path& path);
    
    // Leading "~" resolves against $HOME, or the working directory when unset.
    static std::filesystem::path expand_home(const std::string& path);
};

class TimeUtils {
public:
    static std::string to_iso_string(const std::chrono::system_clock::time_point& time);
};

} // namespace fastpack::core::utils
