#include "threnody/util/utf8.hpp"

#include <cstdint>

namespace threnody::util {

namespace {

// Steps p over one codepoint. Returns false for malformed, overlong,
// surrogate or out-of-range sequences; a bad continuation byte is left for
// the next step to examine as a start byte.
bool step(const uint8_t*& p, const uint8_t* end) {
    uint32_t cp;

    if (*p < 0x80) {
        ++p;
        return true;
    } else if ((*p & 0xE0) == 0xC0 && p + 1 < end) {
        uint8_t b1 = *p++;
        uint8_t b2 = *p++;
        if ((b2 & 0xC0) != 0x80) {
            p--;
            return false;
        }
        cp = ((b1 & 0x1F) << 6) | (b2 & 0x3F);
        return cp >= 0x80;
    } else if ((*p & 0xF0) == 0xE0 && p + 2 < end) {
        uint8_t b1 = *p++;
        uint8_t b2 = *p++;
        uint8_t b3 = *p++;
        if ((b2 & 0xC0) != 0x80 || (b3 & 0xC0) != 0x80) {
            p -= 2;
            return false;
        }
        cp = ((b1 & 0x0F) << 12) | ((b2 & 0x3F) << 6) | (b3 & 0x3F);
        return cp >= 0x800 && (cp < 0xD800 || cp > 0xDFFF);
    } else if ((*p & 0xF8) == 0xF0 && p + 3 < end) {
        uint8_t b1 = *p++;
        uint8_t b2 = *p++;
        uint8_t b3 = *p++;
        uint8_t b4 = *p++;
        if ((b2 & 0xC0) != 0x80 || (b3 & 0xC0) != 0x80 || (b4 & 0xC0) != 0x80) {
            p -= 3;
            return false;
        }
        cp = ((b1 & 0x07) << 18) | ((b2 & 0x3F) << 12) | ((b3 & 0x3F) << 6) | (b4 & 0x3F);
        return cp >= 0x10000 && cp <= 0x10FFFF;
    }

    // Invalid start byte or truncated sequence
    ++p;
    return false;
}

} // namespace

bool is_valid_utf8(const std::string& data) {
    const uint8_t* p = reinterpret_cast<const uint8_t*>(data.data());
    const uint8_t* end = p + data.size();
    while (p < end) {
        if (!step(p, end)) return false;
    }
    return true;
}

size_t codepoint_length(const std::string& data) {
    const uint8_t* p = reinterpret_cast<const uint8_t*>(data.data());
    const uint8_t* end = p + data.size();
    size_t count = 0;
    while (p < end) {
        step(p, end);
        ++count;
    }
    return count;
}

std::string trim(const std::string& data) {
    const char* ws = " \t\n\r\f\v";
    size_t first = data.find_first_not_of(ws);
    if (first == std::string::npos) return {};
    size_t last = data.find_last_not_of(ws);
    return data.substr(first, last - first + 1);
}

} // namespace threnody::util
