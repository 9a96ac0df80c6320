// SPDX-License-Identifier: MIT

// lib/stream/multi_stream.hpp
#pragma once

#include <algorithm>
#include <concepts>
#include <expected>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include "lib/stream/sorted_stream.hpp"

namespace kvmerge {

/// Containers that can collect merged values: default-constructible and
/// appendable with push_back().
template<typename C, typename V>
concept Appendable = std::default_initializable<C> && requires(C& c, V&& v) {
    c.push_back(std::move(v));
};

/// k-way merge over several sorted streams.
///
/// Each Read() pulls one record from every stream that has one, emits the
/// smallest key, and collects the values of every stream offering that key
/// into a fresh Container, in input order. Records with larger keys are
/// pushed back onto their own stream for the next round.
///
/// Cost per output record is O(k) for k streams; at most one record per
/// input is held back. When an input fails, records already pulled in that
/// round are pushed back before the error is returned.
template<SortableKey K, typename V, typename Container = std::vector<V>>
    requires Appendable<Container, V>
class MultiStream : public SortedStream<K, Container> {
public:
    using RecordType = typename SortedStream<K, Container>::RecordType;
    using InputPtr = std::unique_ptr<SortedStream<K, V>>;

    /// @throws std::invalid_argument if @p streams is empty.
    explicit MultiStream(std::vector<InputPtr> streams)
        : streams_(std::move(streams)) {
        if (streams_.empty()) {
            throw std::invalid_argument("MultiStream requires at least one stream");
        }
    }

    /// Factory method that returns an expected instead of throwing.
    static std::expected<std::unique_ptr<MultiStream>, Error>
    Create(std::vector<InputPtr> streams) {
        if (streams.empty()) {
            return std::unexpected(Error{ErrorCode::InvalidArgument,
                "MultiStream requires at least one stream"});
        }
        return std::make_unique<MultiStream>(std::move(streams));
    }

    std::size_t StreamCount() const { return streams_.size(); }

    std::string Describe() const override {
        std::vector<std::string> inner;
        inner.reserve(streams_.size());
        for (const auto& s : streams_) inner.push_back(s->Describe());
        return fmt::format("MultiStream(wrapping {})", fmt::join(inner, ", "));
    }

protected:
    PullResult<K, Container> Read() override {
        struct Entry {
            SortedStream<K, V>* stream;
            Record<K, V> record;
        };
        std::vector<Entry> scorecard;
        scorecard.reserve(streams_.size());

        for (auto& s : streams_) {
            auto next = s->Pull();
            if (!next) {
                // Return this round's records to their streams so a retry sees them
                for (auto& entry : scorecard) {
                    if (auto pushed = entry.stream->Pushback(); !pushed) {
                        return std::unexpected(std::move(pushed.error()));
                    }
                }
                return std::unexpected(std::move(next.error()));
            }
            if (*next) scorecard.push_back(Entry{s.get(), std::move(**next)});
        }
        if (scorecard.empty()) return std::optional<RecordType>{};

        const K key = std::min_element(scorecard.begin(), scorecard.end(),
            [](const Entry& a, const Entry& b) { return a.record.key < b.record.key; })
            ->record.key;

        RecordType merged{key, Container{}};
        for (auto& entry : scorecard) {
            if (entry.record.key == key) {
                merged.value.push_back(std::move(entry.record.value));
            } else if (auto pushed = entry.stream->Pushback(); !pushed) {
                return std::unexpected(std::move(pushed.error()));
            }
        }
        return merged;
    }

    bool Exhausted() override {
        return std::all_of(streams_.begin(), streams_.end(),
                           [](const InputPtr& s) { return s->AtEnd(); });
    }

    std::expected<void, Error> DoRewind() override {
        std::expected<void, Error> result;
        for (auto& s : streams_) {
            auto rewound = s->Rewind();
            if (!rewound && result) result = std::move(rewound);
        }
        return result;
    }

private:
    std::vector<InputPtr> streams_;
};

/// Merge one or more streams sharing key and value types into a MultiStream
/// that collects values in a std::vector.
template<StreamType S, StreamType... Rest>
auto MakeMultiStream(std::unique_ptr<S> first, std::unique_ptr<Rest>... rest) {
    using K = typename S::KeyType;
    using V = typename S::ValueType;
    static_assert((std::same_as<K, typename Rest::KeyType> && ...),
                  "merged streams must share a key type");
    static_assert((std::same_as<V, typename Rest::ValueType> && ...),
                  "merged streams must share a value type");

    std::vector<std::unique_ptr<SortedStream<K, V>>> streams;
    streams.reserve(1 + sizeof...(rest));
    streams.push_back(std::move(first));
    (streams.push_back(std::move(rest)), ...);
    return std::make_unique<MultiStream<K, V>>(std::move(streams));
}

}  // namespace kvmerge
