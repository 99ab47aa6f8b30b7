#include "Timestamp.hpp"
#include <charconv>
#include <limits>
#include <spdlog/fmt/fmt.h>

namespace lrc::sync {

namespace {
constexpr i64 kMaxMinutes = std::numeric_limits<i64>::max() / 60000 - 1;

bool parseDigits(std::string_view s, i64& out) {
    if (s.empty())
        return false;
    for (char c : s) {
        if (c < '0' || c > '9')
            return false;
    }
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
    return ec == std::errc() && ptr == s.data() + s.size();
}
} // namespace

std::string Timestamp::toString() const {
    return "[" + toClock() + "]";
}

std::string Timestamp::toClock() const {
    return fmt::format("{:02}:{:02}.{:02}", minutes(), seconds(), hundredths());
}

Result<Timestamp> Timestamp::parse(std::string_view text) {
    auto bad = [&] {
        return Result<Timestamp>::err(
                ErrorCode::ParseError,
                "Invalid timestamp: '" + std::string(text) + "'");
    };

    std::string_view s = text;
    if (!s.empty() && s.front() == '[') {
        if (s.size() < 2 || s.back() != ']')
            return bad();
        s = s.substr(1, s.size() - 2);
    }

    auto colon = s.find(':');
    auto dot = s.find('.');
    if (colon == std::string_view::npos || dot == std::string_view::npos ||
        dot < colon)
        return bad();

    auto minPart = s.substr(0, colon);
    auto secPart = s.substr(colon + 1, dot - colon - 1);
    auto centPart = s.substr(dot + 1);

    i64 minutes = 0;
    i64 seconds = 0;
    i64 hundredths = 0;
    if (minPart.size() < 2 || secPart.size() != 2 || centPart.size() != 2 ||
        !parseDigits(minPart, minutes) || !parseDigits(secPart, seconds) ||
        !parseDigits(centPart, hundredths) || seconds > 59 ||
        minutes > kMaxMinutes)
        return bad();

    return Result<Timestamp>::ok(
            Timestamp((minutes * 60 + seconds) * 1000 + hundredths * 10));
}

} // namespace lrc::sync
