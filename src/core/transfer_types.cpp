/**
 * @file transfer_types.cpp
 * @brief Entry classification and summary formatting
 */

#include <kcenon/file_move/core/transfer_types.h>
#include <kcenon/file_move/core/types.h>

#include <iomanip>
#include <sstream>
#include <system_error>

namespace kcenon::file_move {

auto kind_of(const std::filesystem::path& path) -> entry_kind {
    std::error_code ec;
    auto status = std::filesystem::status(path, ec);
    if (ec || !std::filesystem::exists(status)) {
        return entry_kind::missing;
    }
    if (std::filesystem::is_regular_file(status)) {
        return entry_kind::file;
    }
    if (std::filesystem::is_directory(status)) {
        return entry_kind::directory;
    }
    return entry_kind::other;
}

auto render_summary(std::string_view verb,
                    duration elapsed,
                    const std::filesystem::path& source,
                    const std::filesystem::path& destination) -> std::string {
    std::string line(verb);
    line += " in " + format_duration(elapsed) + ": ";
    line += quoted(source) + " => " + quoted(destination);
    return line;
}

auto format_duration(duration elapsed) -> std::string {
    auto seconds = std::chrono::duration_cast<std::chrono::seconds>(elapsed).count();

    auto plural = [](long long value, const char* unit) {
        return std::to_string(value) + " " + unit + (value == 1 ? "" : "s");
    };

    if (seconds < 60) {
        return plural(seconds, "second");
    }
    if (seconds < 3600) {
        return plural(seconds / 60, "minute");
    }
    if (seconds < 86400) {
        return plural(seconds / 3600, "hour");
    }
    return plural(seconds / 86400, "day");
}

auto format_bytes(uint64_t bytes) -> std::string {
    constexpr uint64_t KB = 1024;
    constexpr uint64_t MB = KB * 1024;
    constexpr uint64_t GB = MB * 1024;

    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2);

    if (bytes >= GB) {
        oss << static_cast<double>(bytes) / static_cast<double>(GB) << " GB";
    } else if (bytes >= MB) {
        oss << static_cast<double>(bytes) / static_cast<double>(MB) << " MB";
    } else if (bytes >= KB) {
        oss << static_cast<double>(bytes) / static_cast<double>(KB) << " KB";
    } else {
        oss << bytes << " B";
    }
    return oss.str();
}

}  // namespace kcenon::file_move
