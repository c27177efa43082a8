#include "processing/stream_diff.hpp"

#include "processing/text_diff.hpp"
#include "util/utf8.hpp"

#include <algorithm>
#include <iterator>
#include <utility>

using namespace textdiff;

std::vector<std::string>
textdiff::split_chunks(const std::string& text, std::size_t chunk_size) {
    std::vector<std::string> chunks;
    if (chunk_size == 0) {
        chunk_size = StreamDiff::kDefaultChunkSize;
    }

    std::string::size_type start = 0;
    while (start < text.size()) {
        auto end = utf8_advance_by(text, start, chunk_size);
        chunks.push_back(text.substr(start, end - start));
        start = end;
    }
    return chunks;
}

StreamDiff::StreamDiff(std::string original, std::string modified, DiffOptions options, std::size_t chunk_size)
    : original_(std::move(original))
    , modified_(std::move(modified))
    , options_(options)
    , chunk_size_(chunk_size == 0 ? kDefaultChunkSize : chunk_size) {
    auto total_length = static_cast<std::size_t>(utf8_len(original_) + utf8_len(modified_));
    chunked_ = total_length > chunk_size_ * kChunkThreshold;

    if (chunked_) {
        original_chunks_ = split_chunks(original_, chunk_size_);
        modified_chunks_ = split_chunks(modified_, chunk_size_);
        accumulated_ = std::make_shared<DiffResult>();
    }
}

std::size_t
StreamDiff::chunk_count() const {
    if (!chunked_) {
        return 1;
    }
    return std::max(original_chunks_.size(), modified_chunks_.size());
}

bool
StreamDiff::next(StreamEvent& event) {
    if (done_) {
        return false;
    }
    return chunked_ ? next_chunk(event) : next_whole(event);
}

void
StreamDiff::fill_event(StreamEvent& event, double progress, bool complete) const {
    event.progress = progress;
    event.partial_result = accumulated_;
    event.change_count = accumulated_->changes.size();
    event.stats = accumulated_->stats;
    event.complete = complete;
}

bool
StreamDiff::next_whole(StreamEvent& event) {
    if (position_ == 0) {
        accumulated_ = std::make_shared<DiffResult>(diff(original_, modified_, options_));
        position_++;
        fill_event(event, 50.0, false);
        return true;
    }

    done_ = true;
    fill_event(event, 100.0, true);
    return true;
}

bool
StreamDiff::next_chunk(StreamEvent& event) {
    const auto count = chunk_count();

    if (position_ < count) {
        static const std::string empty;
        const auto& a = position_ < original_chunks_.size() ? original_chunks_[position_] : empty;
        const auto& b = position_ < modified_chunks_.size() ? modified_chunks_[position_] : empty;

        auto chunk_result = diff(a, b, options_);
        auto& changes = accumulated_->changes;
        changes.insert(changes.end(),
                       std::make_move_iterator(chunk_result.changes.begin()),
                       std::make_move_iterator(chunk_result.changes.end()));
        accumulated_->stats += chunk_result.stats;

        position_++;
        fill_event(event, static_cast<double>(position_) / static_cast<double>(count) * 100.0, false);
        return true;
    }

    done_ = true;
    fill_event(event, 100.0, true);
    return true;
}

std::vector<StreamEvent>
textdiff::stream_diff(const std::string& original,
                      const std::string& modified,
                      const DiffOptions& options,
                      std::size_t chunk_size) {
    std::vector<StreamEvent> events;
    StreamDiff stream(original, modified, options, chunk_size);

    StreamEvent event;
    while (stream.next(event)) {
        events.push_back(event);
    }
    return events;
}
