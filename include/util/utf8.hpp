#pragma once

#include <string_view>

namespace lc::util {

struct LineScan {
    bool valid = true;  // well-formed UTF-8 (always true when not validating)
    bool blank = true;  // nothing but whitespace
};

// Unicode White_Space property
bool isUnicodeWhitespace(char32_t cp);

bool isAsciiWhitespace(unsigned char c);

/*
 * Walks a line once, checking UTF-8 well-formedness (RFC 3629: no overlongs,
 * no surrogates, nothing above U+10FFFF) and whether every code point is whitespace.
 * With validate == false the bytes are taken as-is and only ASCII whitespace counts.
 */
LineScan scanLine(std::string_view line, bool validate = true);

}
