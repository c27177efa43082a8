#pragma once

/*
    Progress-reporting front end for the diff engine.

    Large inputs are cut into fixed-size chunks (counted in code points)
    and each chunk pair is diffed on its own, so a change that straddles a
    chunk boundary may be reported as two neighbouring changes. Small
    inputs are diffed in one go and still report two events so that
    consumers see the same protocol either way.

    The stream is pulled by the consumer. Dropping a StreamDiff half way
    through is a valid way to cancel it.

    Every event of one stream points at the same accumulated result, which
    keeps growing until the complete event. The first `change_count`
    entries of it and `stats` describe the state at the time of the event.
*/

#include "processing/change.hpp"
#include "processing/options.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace textdiff {

struct StreamEvent {
    double progress = 0.0;  // 0..100
    std::shared_ptr<const DiffResult> partial_result;
    std::size_t change_count = 0;
    ChangeStats stats;
    bool complete = false;
};

// Split into chunks of `chunk_size` code points; the last one may be shorter.
std::vector<std::string>
split_chunks(const std::string& text, std::size_t chunk_size);

class StreamDiff {
  public:
    static constexpr std::size_t kDefaultChunkSize = 1000;

    // Inputs longer than this many chunks (both texts combined) are chunked.
    static constexpr std::size_t kChunkThreshold = 10;

    StreamDiff(std::string original,
               std::string modified,
               DiffOptions options = {},
               std::size_t chunk_size = kDefaultChunkSize);

    bool
    is_chunked() const {
        return chunked_;
    }

    std::size_t
    chunk_size() const {
        return chunk_size_;
    }

    // Chunk pairs to process; 1 when the input is not chunked.
    std::size_t
    chunk_count() const;

    bool
    is_done() const {
        return done_;
    }

    // Produce the next event. Returns false after the complete event has
    // been handed out.
    bool
    next(StreamEvent& event);

  private:
    bool
    next_whole(StreamEvent& event);

    bool
    next_chunk(StreamEvent& event);

    std::string original_;
    std::string modified_;
    DiffOptions options_;
    std::size_t chunk_size_;
    bool chunked_ = false;

    std::vector<std::string> original_chunks_;
    std::vector<std::string> modified_chunks_;

    void
    fill_event(StreamEvent& event, double progress, bool complete) const;

    std::size_t position_ = 0;
    std::shared_ptr<DiffResult> accumulated_;
    bool done_ = false;
};

// Run a stream to completion, collecting every event.
std::vector<StreamEvent>
stream_diff(const std::string& original,
            const std::string& modified,
            const DiffOptions& options = {},
            std::size_t chunk_size = StreamDiff::kDefaultChunkSize);

}  // namespace textdiff
