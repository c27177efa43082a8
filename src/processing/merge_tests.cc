#include "processing/merge.hpp"
#include "processing/text_diff.hpp"

#include <doctest.h>

#include <string>
#include <vector>

using namespace textdiff;

namespace {

ChangeRecord
unchanged(const std::string& s) {
    ChangeRecord c;
    c.kind = ChangeKind::Unchanged;
    c.original_text = s;
    c.modified_text = s;
    return c;
}

ChangeRecord
added(const std::string& s) {
    ChangeRecord c;
    c.kind = ChangeKind::Added;
    c.modified_text = s;
    return c;
}

ChangeRecord
removed(const std::string& s) {
    ChangeRecord c;
    c.kind = ChangeKind::Removed;
    c.original_text = s;
    return c;
}

ChangeRecord
modified(const std::string& a, const std::string& b) {
    ChangeRecord c;
    c.kind = ChangeKind::Modified;
    c.original_text = a;
    c.modified_text = b;
    return c;
}

}  // namespace

TEST_CASE("generate_merged_text") {
    const std::vector<ChangeRecord> changes = {
        unchanged("keep"),
        added("new"),
        removed("old"),
        modified("before", "after"),
    };

    SUBCASE("empty") {
        REQUIRE(generate_merged_text({}, {}).empty());
    }

    SUBCASE("default decisions") {
        REQUIRE(generate_merged_text(changes, {}) == "keep\nnew\nold\nafter");
    }

    SUBCASE("accept everything") {
        MergeDecisions decisions = {
            {1, MergeDecision::Accept},
            {2, MergeDecision::Accept},
            {3, MergeDecision::Accept},
        };
        REQUIRE(generate_merged_text(changes, decisions) == "keep\nnew\nafter");
    }

    SUBCASE("reject everything") {
        MergeDecisions decisions = {
            {0, MergeDecision::Reject},
            {1, MergeDecision::Reject},
            {2, MergeDecision::Reject},
            {3, MergeDecision::Reject},
        };
        REQUIRE(generate_merged_text(changes, decisions) == "keep\nold\nbefore");
    }

    SUBCASE("decisions outside the list are ignored") {
        MergeDecisions decisions = {{42, MergeDecision::Reject}};
        REQUIRE(generate_merged_text(changes, decisions) == "keep\nnew\nold\nafter");
    }

    SUBCASE("self diff reproduces the text") {
        const std::string text = "alpha\nbeta\ngamma";
        auto result = diff(text, text);
        REQUIRE(generate_merged_text(result.changes, {}) == text);
    }

    SUBCASE("crlf text needs a crlf separator") {
        const std::string text = "a\r\nb";
        auto result = diff(text, text);
        REQUIRE(generate_merged_text(result.changes, {}) == "a\nb");
        REQUIRE(generate_merged_text(result.changes, {}, "\r\n") == text);
    }

    SUBCASE("accepting a line diff yields the modified text") {
        auto result = diff("one\ntwo\nthree", "one\n2\nthree\nfour");
        MergeDecisions decisions;
        for (std::size_t i = 0; i < result.changes.size(); i++) {
            decisions[i] = MergeDecision::Accept;
        }
        REQUIRE(generate_merged_text(result.changes, decisions) == "one\n2\nthree\nfour");
    }
}
