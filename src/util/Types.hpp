#pragma once
// Types.hpp - Common type aliases and small value types

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

namespace lrc {

using u8 = std::uint8_t;
using u32 = std::uint32_t;
using i32 = std::int32_t;
using i64 = std::int64_t;
using f32 = float;
using f64 = double;

using Duration = std::chrono::milliseconds;

struct Color {
    u8 r{0};
    u8 g{0};
    u8 b{0};
    u8 a{255};

    static constexpr Color white() {
        return {255, 255, 255, 255};
    }

    // Accepts #RGB, #RRGGBB and #RRGGBBAA. Invalid input yields white.
    static Color fromHex(std::string_view hex);
    std::string toHex() const;

    bool operator==(const Color&) const = default;
};

} // namespace lrc
