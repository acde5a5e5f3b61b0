#include "fastpack/core/utils.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace fastpack::core::utils {

namespace {
    constexpr std::array<const char*, 5> BYTE_UNITS{"B", "KiB", "MiB", "GiB", "TiB"};
}

std::string StringUtils::trim(const std::string& str) {
    auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };
    
    auto first = std::find_if_not(str.begin(), str.end(), is_space);
    auto last = std::find_if_not(str.rbegin(), str.rend(), is_space).base();
    return first < last ? std::string(first, last) : std::string();
}

std::string StringUtils::to_lower(const std::string& str) {
    std::string lowered(str.size(), '\0');
    std::transform(str.begin(), str.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lowered;
}

bool StringUtils::ends_with_ignore_case(const std::string& str, const std::string& suffix) {
    return str.size() >= suffix.size() &&
           to_lower(str.substr(str.size() - suffix.size())) == to_lower(suffix);
}

std::string StringUtils::format_bytes(uint64_t bytes) {
    size_t unit = 0;
    double scaled = static_cast<double>(bytes);
    for (; scaled >= 1024.0 && unit + 1 < BYTE_UNITS.size(); ++unit) {
        scaled /= 1024.0;
    }
    
    std::ostringstream out;
    out << std::fixed << std::setprecision(2) << scaled << ' ' << BYTE_UNITS[unit];
    return out.str();
}

bool FileUtils::exists(const std::filesystem::path& path) {
    std::error_code ec;
    return std::filesystem::exists(path, ec);
}

bool FileUtils::is_file(const std::filesystem::path& path) {
    std::error_code ec;
    return std::filesystem::is_regular_file(path, ec);
}

std::optional<uint64_t> FileUtils::file_size(const std::filesystem::path& path) {
    std::error_code ec;
    auto size = std::filesystem::file_size(path, ec);
    if (ec) {
        return std::nullopt;
    }
    return static_cast<uint64_t>(size);
}

bool FileUtils::create_directories(const std::filesystem::path& path) {
    std::error_code ec;
    std::filesystem::create_directories(path, ec);
    return !ec && std::filesystem::is_directory(path, ec);
}

std::filesystem::path FileUtils::expand_home(const std::string& path) {
    if (path.empty() || path.front() != '~') {
        return std::filesystem::path(path);
    }
    
    const char* home = std::getenv("HOME");
    std::filesystem::path base = home ? std::filesystem::path(home) : std::filesystem::current_path();
    auto rest = path.find_first_not_of('/', 1);
    return rest == std::string::npos ? base : base / path.substr(rest);
}

std::string TimeUtils::to_iso_string(const std::chrono::system_clock::time_point& time) {
    auto seconds = std::chrono::system_clock::to_time_t(time);
    std::tm utc{};
    gmtime_r(&seconds, &utc);
    
    std::ostringstream out;
    out << std::put_time(&utc, "%Y-%m-%dT%H:%M:%SZ");
    return out.str();
}

} // namespace fastpack::core::utils
