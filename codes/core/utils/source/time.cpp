#include "utils/time.hpp"
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace stream_http {
namespace utils {

uint64_t get_monotonic_time_ms() {
    auto now = std::chrono::steady_clock::now();
    return static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count());
}

std::string format_current_time(const char* format) {
    std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm;
    localtime_r(&now, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, format);
    return oss.str();
}

} // namespace utils
} // namespace stream_http
