// SPDX-License-Identifier: MIT

// lib/stream/comparison_stream.hpp
#pragma once

#include <concepts>
#include <expected>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <utility>

#include <fmt/format.h>

#include "lib/stream/sorted_stream.hpp"

namespace kvmerge {

/// Full outer join of two sorted streams, walked pairwise by key.
///
/// Each row carries the key plus the left and/or right value:
///
///   key on both sides     - (key, left, right)
///   key only on the left  - (key, left, nullopt)
///   key only on the right - (key, nullopt, right)
///
/// Both inputs should have unique ascending keys; wrap them in UniqueStream
/// or FoldedStream first if they may repeat. Repeated keys still terminate
/// (every Get() consumes at least one record) but pair up arbitrarily.
///
/// Unlike the other streams this is not a SortedStream: rows are not
/// key/value records, and there is no pushback or filter stage. Filter the
/// inputs instead.
template<SortableKey K, typename VL, typename VR>
class ComparisonStream {
public:
    struct Row {
        K key;
        std::optional<VL> left;
        std::optional<VR> right;

        bool operator==(const Row&) const = default;
    };

    using RowResult = std::expected<std::optional<Row>, Error>;
    using Visitor = std::function<void(const Row&)>;

    ComparisonStream(std::unique_ptr<SortedStream<K, VL>> left,
                     std::unique_ptr<SortedStream<K, VR>> right)
        : left_(std::move(left)), right_(std::move(right)) {}

    ComparisonStream(ComparisonStream&&) noexcept = default;
    ComparisonStream& operator=(ComparisonStream&&) noexcept = default;

    bool AtEnd() { return left_->AtEnd() && right_->AtEnd(); }

    /// Produce the next row, or nullopt when both sides are at end.
    /// A failed right-hand pull leaves the left record pushed back.
    RowResult Get() {
        if (AtEnd()) return std::optional<Row>{};

        auto l = left_->Pull();
        if (!l) return std::unexpected(std::move(l.error()));
        auto r = right_->Pull();
        if (!r) {
            if (auto pushed = left_->Pushback(); !pushed) {
                return std::unexpected(std::move(pushed.error()));
            }
            return std::unexpected(std::move(r.error()));
        }

        auto& left = *l;
        auto& right = *r;

        if (!right) {
            if (!left) return std::optional<Row>{};
            return Row{std::move(left->key), std::move(left->value), std::nullopt};
        }
        if (!left) {
            return Row{std::move(right->key), std::nullopt, std::move(right->value)};
        }
        if (left->key < right->key) {
            if (auto pushed = right_->Pushback(); !pushed) {
                return std::unexpected(std::move(pushed.error()));
            }
            return Row{std::move(left->key), std::move(left->value), std::nullopt};
        }
        if (left->key > right->key) {
            if (auto pushed = left_->Pushback(); !pushed) {
                return std::unexpected(std::move(pushed.error()));
            }
            return Row{std::move(right->key), std::nullopt, std::move(right->value)};
        }
        return Row{std::move(left->key), std::move(left->value), std::move(right->value)};
    }

    /// Visit every row until both sides end. Stops at the first error.
    std::expected<void, Error> ForEach(const Visitor& visit) {
        while (!AtEnd()) {
            auto row = Get();
            if (!row) return std::unexpected(std::move(row.error()));
            if (*row) visit(**row);
        }
        return {};
    }

    /// Rewind both sides. Both are attempted; the first failure is returned.
    std::expected<void, Error> Rewind() {
        auto l = left_->Rewind();
        auto r = right_->Rewind();
        if (!l) return l;
        return r;
    }

    std::string Describe() const {
        return fmt::format("ComparisonStream(comparing {} with {})",
                           left_->Describe(), right_->Describe());
    }

private:
    std::unique_ptr<SortedStream<K, VL>> left_;
    std::unique_ptr<SortedStream<K, VR>> right_;
};

/// Pair @p self (left) with @p other (right) in a ComparisonStream.
template<StreamType L, StreamType R>
    requires std::same_as<typename L::KeyType, typename R::KeyType>
auto DiffAgainst(std::unique_ptr<L> self, std::unique_ptr<R> other) {
    using K = typename L::KeyType;
    using VL = typename L::ValueType;
    using VR = typename R::ValueType;
    return ComparisonStream<K, VL, VR>(
        std::unique_ptr<SortedStream<K, VL>>(std::move(self)),
        std::unique_ptr<SortedStream<K, VR>>(std::move(other)));
}

}  // namespace kvmerge
