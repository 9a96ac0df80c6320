// SPDX-License-Identifier: MIT

// lib/stream/unique_stream.hpp
#pragma once

#include <expected>
#include <memory>
#include <optional>
#include <string>
#include <utility>

#include <fmt/format.h>

#include "lib/stream/sorted_stream.hpp"

namespace kvmerge {

/// Decorator that drops records whose key repeats the previous key.
///
/// The first record of each run of equal keys wins. Requires the inner
/// stream to be sorted; over an already-unique stream it is an identity.
/// An inner error mid-run is returned and the candidate is kept for the
/// next pull.
template<SortableKey K, typename V>
class UniqueStream : public SortedStream<K, V> {
public:
    using RecordType = typename SortedStream<K, V>::RecordType;

    explicit UniqueStream(std::unique_ptr<SortedStream<K, V>> inner)
        : inner_(std::move(inner)) {}

    std::string Describe() const override {
        return fmt::format("UniqueStream(wrapping {})", inner_->Describe());
    }

protected:
    PullResult<K, V> Read() override {
        std::optional<RecordType> candidate = std::move(held_);
        held_.reset();
        if (!candidate) {
            auto first = inner_->Pull();
            if (!first || !*first) return first;
            candidate = std::move(**first);
        }

        while (true) {
            auto next = inner_->Pull();
            if (!next) {
                held_ = std::move(candidate);
                return std::unexpected(std::move(next.error()));
            }
            if (!*next) return candidate;
            if ((*next)->key != candidate->key) {
                if (auto pushed = inner_->Pushback(); !pushed) {
                    return std::unexpected(std::move(pushed.error()));
                }
                return candidate;
            }
        }
    }

    bool Exhausted() override { return !held_ && inner_->AtEnd(); }

    std::expected<void, Error> DoRewind() override {
        held_.reset();
        return inner_->Rewind();
    }

private:
    std::unique_ptr<SortedStream<K, V>> inner_;
    // Candidate interrupted by an inner error, resumed by the next Read()
    std::optional<RecordType> held_;
};

/// Wrap a stream in a UniqueStream, deducing key and value types.
template<StreamType S>
auto MakeUniqueStream(std::unique_ptr<S> inner) {
    using K = typename S::KeyType;
    using V = typename S::ValueType;
    return std::make_unique<UniqueStream<K, V>>(
        std::unique_ptr<SortedStream<K, V>>(std::move(inner)));
}

}  // namespace kvmerge
