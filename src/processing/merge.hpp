#pragma once

#include "processing/change.hpp"

#include <map>
#include <string>
#include <vector>

namespace textdiff {

enum class MergeDecision {
    Accept,  // take the modified side
    Reject,  // take the original side
    Keep,    // default rules, see below
};

// Indices into the change list; entries without a decision use Keep.
using MergeDecisions = std::map<std::size_t, MergeDecision>;

// Replay a change list into text, one entry per output line:
//   unchanged: original text
//   added:     kept unless rejected
//   removed:   kept unless accepted
//   modified:  original if rejected, modified otherwise
// Line tokens do not carry their terminator, so entries are joined with
// `separator`. Pass "\r\n" to rebuild CRLF text.
std::string
generate_merged_text(const std::vector<ChangeRecord>& changes,
                     const MergeDecisions& decisions,
                     const std::string& separator = "\n");

}  // namespace textdiff
