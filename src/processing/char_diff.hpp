#pragma once

/*
    Per-character tags for highlighting inside a modified pair.

    This is a synchronized walk, not an alignment: position n of the
    original is compared with position n of the modified text. Equal code
    points are unchanged, differing ones are removed on the left and added
    on the right, and the longer side's tail is all removed or added.
*/

#include <string>
#include <vector>

namespace textdiff {

enum class CharTag {
    Unchanged,
    Added,
    Removed,
};

struct TaggedChar {
    std::string ch;  // one code point
    CharTag tag;

    bool
    operator==(const TaggedChar& other) const {
        return ch == other.ch && tag == other.tag;
    }
};

struct CharacterDiff {
    std::vector<TaggedChar> original;  // Unchanged or Removed
    std::vector<TaggedChar> modified;  // Unchanged or Added
};

CharacterDiff
compute_character_diff(const std::string& original, const std::string& modified);

}  // namespace textdiff
