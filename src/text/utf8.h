#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace memeseed::text
{
// Decodes UTF-8 into codepoints. Malformed sequences are skipped.
std::vector<char32_t> DecodeUtf8(std::string_view bytes);

// Longest prefix of `bytes` holding at most `max_codepoints` whole codepoints.
std::string Utf8Prefix(std::string_view bytes, std::size_t max_codepoints);

// ASCII-only case mapping; other bytes pass through untouched.
std::string ToUpperAscii(std::string_view s);

// Strips ASCII whitespace from both ends.
std::string TrimAscii(std::string_view s);
} // namespace memeseed::text
