#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace pyrunner::utf8 {

// U+FFFD REPLACEMENT CHARACTER, UTF-8 encoded
inline constexpr std::string_view kReplacement = "\xEF\xBF\xBD";

// Decodes one code point at data[0..len). Returns false for a malformed or
// truncated sequence; bytes_read is then the length of the maximal invalid
// prefix (at least 1).
bool decode(const uint8_t* data, size_t len, uint32_t* codepoint, size_t* bytes_read);

// Copies valid UTF-8 through and substitutes each malformed subsequence
// with a single U+FFFD.
std::string sanitize(std::string_view input);

// Strips trailing spaces, tabs, CR, LF, vertical tab and form feed.
std::string trimRight(std::string_view input);

} // namespace pyrunner::utf8
