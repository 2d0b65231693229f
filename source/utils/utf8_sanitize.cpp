#include "utils/utf8_sanitize.hpp"

#include <cstddef>
#include <utility>

namespace utf8_sanitize {

static const char REPLACEMENT_CHARACTER[] = "\xEF\xBF\xBD"; // U+FFFD

// Length of the well-formed sequence starting at data[offset], or 0.
// Second-byte ranges follow the Unicode "well-formed byte sequences" table,
// which rules out overlongs, surrogates and code points above U+10FFFF.
static size_t sequence_length(const unsigned char *data, size_t offset, size_t size) {
    unsigned char lead = data[offset];
    if (lead < 0x80u) {
        return 1;
    }

    size_t length = 0;
    unsigned char second_low = 0x80u;
    unsigned char second_high = 0xBFu;

    if (lead >= 0xC2u && lead <= 0xDFu) {
        length = 2;
    } else if (lead == 0xE0u) {
        length = 3;
        second_low = 0xA0u;
    } else if (lead == 0xEDu) {
        length = 3;
        second_high = 0x9Fu;
    } else if (lead >= 0xE1u && lead <= 0xEFu) {
        length = 3;
    } else if (lead == 0xF0u) {
        length = 4;
        second_low = 0x90u;
    } else if (lead == 0xF4u) {
        length = 4;
        second_high = 0x8Fu;
    } else if (lead >= 0xF1u && lead <= 0xF3u) {
        length = 4;
    } else {
        return 0;
    }

    if (offset + length > size) {
        return 0;
    }
    if (data[offset + 1] < second_low || data[offset + 1] > second_high) {
        return 0;
    }
    for (size_t index = 2; index < length; ++index) {
        if ((data[offset + index] & 0xC0u) != 0x80u) {
            return 0;
        }
    }
    return length;
}

bool is_valid(const std::string &text) {
    const unsigned char *data = reinterpret_cast<const unsigned char *>(text.data());
    size_t offset = 0;
    while (offset < text.size()) {
        size_t length = sequence_length(data, offset, text.size());
        if (length == 0) {
            return false;
        }
        offset += length;
    }
    return true;
}

void sanitize(std::string &text) {
    // Common case: nothing to fix, avoid the copy.
    if (is_valid(text)) {
        return;
    }

    const unsigned char *data = reinterpret_cast<const unsigned char *>(text.data());
    std::string result;
    result.reserve(text.size() + 16);

    size_t offset = 0;
    while (offset < text.size()) {
        size_t length = sequence_length(data, offset, text.size());
        if (length == 0) {
            result.append(REPLACEMENT_CHARACTER);
            ++offset;
            continue;
        }
        result.append(text, offset, length);
        offset += length;
    }

    text = std::move(result);
}

std::string sanitize(const std::string &text) {
    std::string copy = text;
    sanitize(copy);
    return copy;
}

} // namespace utf8_sanitize
