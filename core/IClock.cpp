#include "IClock.hpp"
#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace metersim {

std::string SystemClock::iso8601() const {
    return formatIso8601(now());
}

std::string formatIso8601(std::chrono::system_clock::time_point time) {
    auto time_t = std::chrono::system_clock::to_time_t(time);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        time.time_since_epoch()) % 1000;
    if (ms.count() < 0) {
        ms += std::chrono::milliseconds(1000);
        --time_t;
    }
    
    std::stringstream ss;
    
    // Use thread-safe gmtime_s on Windows, gmtime_r on other platforms
#ifdef _WIN32
    std::tm tm_buf{};
    if (gmtime_s(&tm_buf, &time_t) == 0) {
        ss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S");
    }
#else
    std::tm tm_buf{};
    if (gmtime_r(&time_t, &tm_buf)) {
        ss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S");
    }
#endif
    
    ss << '.' << std::setfill('0') << std::setw(3) << ms.count() << 'Z';
    return ss.str();
}

std::optional<std::chrono::system_clock::time_point> parseIso8601(const std::string& text) {
    std::tm tm_buf{};
    std::istringstream ss(text);
    ss >> std::get_time(&tm_buf, "%Y-%m-%dT%H:%M:%S");
    if (ss.fail()) {
        return std::nullopt;
    }
    
    std::chrono::microseconds fraction{0};
    if (ss.peek() == '.') {
        ss.get();
        std::string digits;
        while (std::isdigit(ss.peek())) {
            digits += static_cast<char>(ss.get());
        }
        digits = digits.substr(0, 6);
        digits.append(6 - digits.size(), '0');
        fraction = std::chrono::microseconds(std::stoll(digits));
    }
    
#ifdef _WIN32
    std::time_t seconds = _mkgmtime(&tm_buf);
#else
    std::time_t seconds = timegm(&tm_buf);
#endif
    if (seconds == static_cast<std::time_t>(-1)) {
        return std::nullopt;
    }
    
    return std::chrono::system_clock::from_time_t(seconds) +
           std::chrono::duration_cast<std::chrono::system_clock::duration>(fraction);
}

} // namespace metersim
