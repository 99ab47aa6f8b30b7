#include "Types.hpp"
#include <spdlog/fmt/fmt.h>

namespace lrc {

namespace {
int hexDigit(char c) {
    if (c >= '0' && c <= '9')
        return c - '0';
    if (c >= 'a' && c <= 'f')
        return c - 'a' + 10;
    if (c >= 'A' && c <= 'F')
        return c - 'A' + 10;
    return -1;
}

bool hexByte(std::string_view s, u8& out) {
    int hi = hexDigit(s[0]);
    int lo = hexDigit(s[1]);
    if (hi < 0 || lo < 0)
        return false;
    out = static_cast<u8>(hi * 16 + lo);
    return true;
}
} // namespace

Color Color::fromHex(std::string_view hex) {
    if (!hex.empty() && hex.front() == '#')
        hex.remove_prefix(1);

    Color c;
    if (hex.size() == 3) {
        std::string expanded{hex[0], hex[0], hex[1], hex[1], hex[2], hex[2]};
        return fromHex(expanded);
    }
    if (hex.size() != 6 && hex.size() != 8)
        return white();

    if (!hexByte(hex.substr(0, 2), c.r) || !hexByte(hex.substr(2, 2), c.g) ||
        !hexByte(hex.substr(4, 2), c.b))
        return white();
    if (hex.size() == 8 && !hexByte(hex.substr(6, 2), c.a))
        return white();
    return c;
}

std::string Color::toHex() const {
    if (a == 255)
        return fmt::format("#{:02X}{:02X}{:02X}", r, g, b);
    return fmt::format("#{:02X}{:02X}{:02X}{:02X}", r, g, b, a);
}

} // namespace lrc
