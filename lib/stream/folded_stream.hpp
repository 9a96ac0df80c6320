// SPDX-License-Identifier: MIT

// lib/stream/folded_stream.hpp
#pragma once

#include <expected>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <fmt/format.h>

#include "lib/stream/sorted_stream.hpp"

namespace kvmerge {

/// Decorator that groups adjacent records sharing a key.
///
/// Each output record carries every value of its group, in input order.
/// The value is always a vector, even for a group of one. An inner error
/// mid-group is returned and the partial group is kept for the next pull.
template<SortableKey K, typename V>
class FoldedStream : public SortedStream<K, std::vector<V>> {
public:
    using RecordType = typename SortedStream<K, std::vector<V>>::RecordType;

    explicit FoldedStream(std::unique_ptr<SortedStream<K, V>> inner)
        : inner_(std::move(inner)) {}

    std::string Describe() const override {
        return fmt::format("FoldedStream(folding {})", inner_->Describe());
    }

protected:
    PullResult<K, std::vector<V>> Read() override {
        std::optional<RecordType> group = std::move(held_);
        held_.reset();
        if (!group) {
            auto first = inner_->Pull();
            if (!first) return std::unexpected(std::move(first.error()));
            if (!*first) return std::optional<RecordType>{};
            group = RecordType{std::move((*first)->key), {}};
            group->value.push_back(std::move((*first)->value));
        }

        while (true) {
            auto next = inner_->Pull();
            if (!next) {
                held_ = std::move(group);
                return std::unexpected(std::move(next.error()));
            }
            if (!*next) return group;
            if ((*next)->key == group->key) {
                group->value.push_back(std::move((*next)->value));
                continue;
            }
            if (auto pushed = inner_->Pushback(); !pushed) {
                return std::unexpected(std::move(pushed.error()));
            }
            return group;
        }
    }

    bool Exhausted() override { return !held_ && inner_->AtEnd(); }

    std::expected<void, Error> DoRewind() override {
        held_.reset();
        return inner_->Rewind();
    }

private:
    std::unique_ptr<SortedStream<K, V>> inner_;
    // Partial group interrupted by an inner error, resumed by the next Read()
    std::optional<RecordType> held_;
};

/// Wrap a stream in a FoldedStream, deducing key and value types.
template<StreamType S>
auto MakeFoldedStream(std::unique_ptr<S> inner) {
    using K = typename S::KeyType;
    using V = typename S::ValueType;
    return std::make_unique<FoldedStream<K, V>>(
        std::unique_ptr<SortedStream<K, V>>(std::move(inner)));
}

}  // namespace kvmerge
