#include "workq/util/text.hpp"

namespace workq::util {

namespace {

// Length of the well-formed sequence starting at pos, or 0 if malformed
size_t utf8_sequence_length(const std::string& text, size_t pos) {
    unsigned char c = static_cast<unsigned char>(text[pos]);
    if (c <= 0x7F) {
        return 1;
    }

    size_t length;
    unsigned char min_second = 0x80;
    unsigned char max_second = 0xBF;

    if (c >= 0xC2 && c <= 0xDF) {
        length = 2;
    } else if (c >= 0xE0 && c <= 0xEF) {
        length = 3;
        if (c == 0xE0) min_second = 0xA0;       // overlong
        if (c == 0xED) max_second = 0x9F;       // surrogates
    } else if (c >= 0xF0 && c <= 0xF4) {
        length = 4;
        if (c == 0xF0) min_second = 0x90;       // overlong
        if (c == 0xF4) max_second = 0x8F;       // above U+10FFFF
    } else {
        return 0;
    }

    if (pos + length > text.size()) {
        return 0;
    }

    unsigned char second = static_cast<unsigned char>(text[pos + 1]);
    if (second < min_second || second > max_second) {
        return 0;
    }
    for (size_t i = 2; i < length; ++i) {
        if ((static_cast<unsigned char>(text[pos + i]) & 0xC0) != 0x80) {
            return 0;
        }
    }
    return length;
}

} // namespace

bool is_valid_utf8(const std::string& text) {
    size_t pos = 0;
    while (pos < text.size()) {
        size_t length = utf8_sequence_length(text, pos);
        if (length == 0) return false;
        pos += length;
    }
    return true;
}

bool is_storable_text(const std::string& text) {
    return text.find('\0') == std::string::npos && is_valid_utf8(text);
}

std::string to_storable_text(const std::string& text) {
    std::string result;
    result.reserve(text.size());

    size_t pos = 0;
    while (pos < text.size()) {
        size_t length = utf8_sequence_length(text, pos);
        if (length == 0 || text[pos] == '\0') {
            result.push_back('?');
            ++pos;
            continue;
        }
        result.append(text, pos, length);
        pos += length;
    }
    return result;
}

} // namespace workq::util
