#include "util/utf8.hpp"

#include <algorithm>

using namespace textdiff;

namespace {

bool
is_continuation(unsigned char c) {
    return (c & 0xC0) == 0x80;
}

// Length of the code point at `pos`, never running past the end or into
// the next lead byte.
std::size_t
code_point_width(const std::string& s, std::string::size_type pos) {
    auto expected = utf8_sequence_length(static_cast<unsigned char>(s[pos]));
    std::size_t width = 1;
    while (width < expected && pos + width < s.size() &&
           is_continuation(static_cast<unsigned char>(s[pos + width]))) {
        width++;
    }
    return width;
}

}  // namespace

std::size_t
textdiff::utf8_sequence_length(unsigned char lead) {
    if (lead < 0x80) {
        return 1;
    } else if ((lead & 0xE0) == 0xC0) {
        return 2;
    } else if ((lead & 0xF0) == 0xE0) {
        return 3;
    } else if ((lead & 0xF8) == 0xF0) {
        return 4;
    }
    return 1;
}

int64_t
textdiff::utf8_len(const std::string& s, std::string::size_type start, std::string::size_type end) {
    end = std::min(end, s.size());
    int64_t count = 0;
    std::string::size_type pos = start;
    while (pos < end) {
        pos += code_point_width(s, pos);
        count++;
    }
    return count;
}

int64_t
textdiff::utf8_len(const std::string& s) {
    return utf8_len(s, 0, s.size());
}

std::string::size_type
textdiff::utf8_advance_by(const std::string& s, std::string::size_type start, std::size_t index) {
    std::string::size_type pos = start;
    while (index > 0 && pos < s.size()) {
        pos += code_point_width(s, pos);
        index--;
    }
    return std::min(pos, s.size());
}

std::vector<std::string>
textdiff::utf8_split(const std::string& s) {
    std::vector<std::string> result;
    result.reserve(s.size());
    std::string::size_type pos = 0;
    while (pos < s.size()) {
        auto width = code_point_width(s, pos);
        result.push_back(s.substr(pos, width));
        pos += width;
    }
    return result;
}
