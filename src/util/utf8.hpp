#pragma once

// Code point helpers for UTF-8 encoded std::string's. Malformed input is
// never rejected; a stray continuation or invalid lead byte counts as one
// code point on its own.

#include <cstdint>
#include <string>
#include <vector>

namespace textdiff {

// Number of bytes in the sequence starting with `lead`.
std::size_t
utf8_sequence_length(unsigned char lead);

// Count code points inside given range.
int64_t
utf8_len(const std::string& s, std::string::size_type start, std::string::size_type end);

// Count code points contained in a std::string
int64_t
utf8_len(const std::string& s);

// Byte offset of the code point `index` steps after `start`. Clamped to s.size().
std::string::size_type
utf8_advance_by(const std::string& s, std::string::size_type start, std::size_t index);

// One string per code point.
std::vector<std::string>
utf8_split(const std::string& s);

}  // namespace textdiff
