#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace metersim {

class IClock {
public:
    virtual ~IClock() = default;
    
    virtual std::chrono::system_clock::time_point now() const = 0;
    virtual uint64_t epochSeconds() const = 0;
    virtual std::string iso8601() const = 0;
};

class SystemClock : public IClock {
public:
    std::chrono::system_clock::time_point now() const override {
        return std::chrono::system_clock::now();
    }
    
    uint64_t epochSeconds() const override {
        return std::chrono::duration_cast<std::chrono::seconds>(
            now().time_since_epoch()).count();
    }
    
    std::string iso8601() const override;
};

/// UTC, millisecond precision: 2025-03-01T12:00:05.250Z
std::string formatIso8601(std::chrono::system_clock::time_point time);

/// Accepts the format above, with or without fraction and trailing 'Z'
std::optional<std::chrono::system_clock::time_point> parseIso8601(const std::string& text);

} // namespace metersim
