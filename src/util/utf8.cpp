#include "util/utf8.hpp"

#include <cstdint>

bool lc::util::isAsciiWhitespace(const unsigned char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\v' || c == '\f' || c == '\r';
}

bool lc::util::isUnicodeWhitespace(const char32_t cp) {
    if (cp < 0x80) return isAsciiWhitespace(static_cast<unsigned char>(cp));
    switch (cp) {
        case 0x0085: case 0x00A0: case 0x1680:
        case 0x2028: case 0x2029: case 0x202F: case 0x205F: case 0x3000:
            return true;
        default:
            return cp >= 0x2000 && cp <= 0x200A;
    }
}

lc::util::LineScan lc::util::scanLine(const std::string_view line, const bool validate) {
    LineScan scan;

    if (!validate) {
        for (const char c : line) {
            if (!isAsciiWhitespace(static_cast<unsigned char>(c))) {
                scan.blank = false;
                break;
            }
        }
        return scan;
    }

    const auto* p = reinterpret_cast<const unsigned char*>(line.data());
    const auto* const e = p + line.size();

    while (p < e) {
        const unsigned char lead = *p;

        if (lead < 0x80) {
            if (scan.blank && !isAsciiWhitespace(lead)) scan.blank = false;
            ++p;
            continue;
        }

        unsigned int len;
        char32_t cp, min;
        if ((lead & 0xE0) == 0xC0) { len = 2; cp = lead & 0x1F; min = 0x80; }
        else if ((lead & 0xF0) == 0xE0) { len = 3; cp = lead & 0x0F; min = 0x800; }
        else if ((lead & 0xF8) == 0xF0) { len = 4; cp = lead & 0x07; min = 0x10000; }
        else { scan.valid = false; return scan; }

        if (static_cast<std::size_t>(e - p) < len) { scan.valid = false; return scan; }

        for (unsigned int i = 1; i < len; ++i) {
            const unsigned char cont = p[i];
            if ((cont & 0xC0) != 0x80) { scan.valid = false; return scan; }
            cp = (cp << 6) | (cont & 0x3F);
        }

        if (cp < min || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
            scan.valid = false;
            return scan;
        }

        if (scan.blank && !isUnicodeWhitespace(cp)) scan.blank = false;
        p += len;
    }

    return scan;
}
