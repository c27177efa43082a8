#include "processing/char_diff.hpp"

#include "util/utf8.hpp"

using namespace textdiff;

CharacterDiff
textdiff::compute_character_diff(const std::string& original, const std::string& modified) {
    auto a = utf8_split(original);
    auto b = utf8_split(modified);

    CharacterDiff result;
    result.original.reserve(a.size());
    result.modified.reserve(b.size());

    std::size_t i = 0, j = 0;
    while (i < a.size() || j < b.size()) {
        if (i < a.size() && j < b.size()) {
            if (a[i] == b[j]) {
                result.original.push_back({a[i], CharTag::Unchanged});
                result.modified.push_back({b[j], CharTag::Unchanged});
            } else {
                result.original.push_back({a[i], CharTag::Removed});
                result.modified.push_back({b[j], CharTag::Added});
            }
            i++;
            j++;
        } else if (i < a.size()) {
            result.original.push_back({a[i], CharTag::Removed});
            i++;
        } else {
            result.modified.push_back({b[j], CharTag::Added});
            j++;
        }
    }

    return result;
}
