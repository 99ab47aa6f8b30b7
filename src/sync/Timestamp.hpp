#pragma once
// Timestamp.hpp - Millisecond position and its [MM:SS.CC] text form

#include <compare>
#include <string>
#include <string_view>
#include "util/Result.hpp"
#include "util/Types.hpp"

namespace lrc::sync {

class Timestamp {
public:
    Timestamp() = default;

    // Negative positions clamp to zero
    explicit Timestamp(i64 millis) : millis_(millis < 0 ? 0 : millis) {}

    i64 millis() const {
        return millis_;
    }

    i64 minutes() const {
        return millis_ / 1000 / 60;
    }
    i64 seconds() const {
        return (millis_ / 1000) % 60;
    }
    i64 hundredths() const {
        return (millis_ % 1000) / 10;
    }

    // "[MM:SS.CC]". Minutes are never wrapped into hours and grow past two
    // digits as needed.
    std::string toString() const;

    // "MM:SS.CC", as shown in the status bar
    std::string toClock() const;

    // Accepts "[MM:SS.CC]" or "MM:SS.CC". The result is truncated to
    // hundredths, so parse(t.toString()) equals t only when t is.
    static Result<Timestamp> parse(std::string_view text);

    bool operator==(const Timestamp&) const = default;
    auto operator<=>(const Timestamp&) const = default;

private:
    i64 millis_{0};
};

} // namespace lrc::sync
