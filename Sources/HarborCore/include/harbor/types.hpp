#pragma once

#include <cstdint>
#include <string>
#include <optional>
#include <vector>
#include <functional>
#include <variant>
#include <chrono>
#include <array>
#include <random>
#include <sstream>
#include <iomanip>

namespace harbor {

// Wall-clock timestamp; persisted as milliseconds since the Unix epoch.
using timestamp_t = std::chrono::system_clock::time_point;

// Injectable wall clock (tests pin it, production uses system_clock).
using clock_fn = std::function<timestamp_t()>;

inline timestamp_t system_now() {
    return std::chrono::system_clock::now();
}

inline int64_t to_millis(timestamp_t t) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(t.time_since_epoch()).count();
}

inline timestamp_t from_millis(int64_t ms) {
    return timestamp_t(std::chrono::milliseconds(ms));
}

// UUID type (stored as TEXT, lowercase hyphenated)
struct uuid_t {
    std::array<uint8_t, 16> bytes{};

    // Convert to lowercase hyphenated string (e.g., "550e8400-e29b-41d4-a716-446655440000")
    std::string to_string() const {
        std::stringstream ss;
        ss << std::hex << std::setfill('0');
        for (size_t i = 0; i < 16; ++i) {
            if (i == 4 || i == 6 || i == 8 || i == 10) ss << '-';
            ss << std::setw(2) << static_cast<int>(bytes[i]);
        }
        return ss.str();
    }

    // Generate a random UUID (v4)
    static uuid_t generate() {
        static thread_local std::random_device rd;
        static thread_local std::mt19937_64 gen(rd());
        static thread_local std::uniform_int_distribution<uint64_t> dis;

        uuid_t result;
        uint64_t a = dis(gen);
        uint64_t b = dis(gen);

        for (int i = 0; i < 8; ++i) {
            result.bytes[i] = static_cast<uint8_t>((a >> (56 - i * 8)) & 0xFF);
            result.bytes[8 + i] = static_cast<uint8_t>((b >> (56 - i * 8)) & 0xFF);
        }

        // Set version (4) and variant (RFC 4122)
        result.bytes[6] = (result.bytes[6] & 0x0F) | 0x40;
        result.bytes[8] = (result.bytes[8] & 0x3F) | 0x80;

        return result;
    }
};

// Supported column types
using column_value_t = std::variant<
    std::nullptr_t,
    int64_t,
    double,
    std::string,
    std::vector<uint8_t>  // blob
>;

enum class column_type {
    integer,
    real,
    text,
    blob
};

namespace detail {
    inline std::optional<std::string> as_string(const column_value_t& v) {
        if (std::holds_alternative<std::string>(v)) return std::get<std::string>(v);
        return std::nullopt;
    }

    inline std::optional<int64_t> as_int(const column_value_t& v) {
        if (std::holds_alternative<int64_t>(v)) return std::get<int64_t>(v);
        if (std::holds_alternative<double>(v)) return static_cast<int64_t>(std::get<double>(v));
        return std::nullopt;
    }
} // namespace detail

} // namespace harbor
