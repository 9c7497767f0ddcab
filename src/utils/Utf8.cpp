#include "Utf8.hpp"

namespace pyrunner::utf8 {

namespace {

bool isContinuation(uint8_t byte) {
    return (byte & 0xC0) == 0x80;
}

} // namespace

bool decode(const uint8_t* data, size_t len, uint32_t* codepoint, size_t* bytes_read) {
    *bytes_read = 1;
    if (len == 0) {
        *bytes_read = 0;
        return false;
    }

    const uint8_t lead = data[0];
    if (lead < 0x80) {
        *codepoint = lead;
        return true;
    }

    size_t need;
    uint32_t cp;
    // Valid range for the second byte narrows for E0, ED, F0 and F4 so that
    // overlong forms, surrogates and values above U+10FFFF are rejected.
    uint8_t lo = 0x80;
    uint8_t hi = 0xBF;
    if (lead >= 0xC2 && lead <= 0xDF) {
        need = 1;
        cp = lead & 0x1F;
    } else if (lead >= 0xE0 && lead <= 0xEF) {
        need = 2;
        cp = lead & 0x0F;
        if (lead == 0xE0) lo = 0xA0;
        if (lead == 0xED) hi = 0x9F;
    } else if (lead >= 0xF0 && lead <= 0xF4) {
        need = 3;
        cp = lead & 0x07;
        if (lead == 0xF0) lo = 0x90;
        if (lead == 0xF4) hi = 0x8F;
    } else {
        return false;
    }

    for (size_t i = 1; i <= need; ++i) {
        if (i >= len) {
            // Truncated: the valid prefix read so far is one invalid unit
            *bytes_read = i;
            return false;
        }
        uint8_t byte = data[i];
        if (i == 1 ? (byte < lo || byte > hi) : !isContinuation(byte)) {
            *bytes_read = i;
            return false;
        }
        cp = (cp << 6) | (byte & 0x3F);
    }

    *codepoint = cp;
    *bytes_read = need + 1;
    return true;
}

std::string sanitize(std::string_view input) {
    std::string result;
    result.reserve(input.size());

    const auto* data = reinterpret_cast<const uint8_t*>(input.data());
    size_t pos = 0;
    while (pos < input.size()) {
        uint32_t codepoint = 0;
        size_t bytes_read = 0;
        if (decode(data + pos, input.size() - pos, &codepoint, &bytes_read)) {
            result.append(input.substr(pos, bytes_read));
        } else {
            result.append(kReplacement);
        }
        pos += bytes_read > 0 ? bytes_read : 1;
    }
    return result;
}

std::string trimRight(std::string_view input) {
    auto end = input.find_last_not_of(" \t\r\n\v\f");
    if (end == std::string_view::npos) {
        return {};
    }
    return std::string(input.substr(0, end + 1));
}

} // namespace pyrunner::utf8
