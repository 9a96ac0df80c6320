// SPDX-License-Identifier: MIT

// lib/stream/sorted_stream.hpp
#pragma once

#include <concepts>
#include <expected>
#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "lib/stream/error.hpp"
#include "lib/stream/record.hpp"

namespace kvmerge {

/// Base class for every stream over ascending-sorted key/value records.
///
/// Provides the shared pull protocol on top of three hooks supplied by each
/// variant:
/// - Read()      - produce the next raw record from the underlying source
/// - Exhausted() - true when the underlying source has nothing left
/// - DoRewind()  - reposition the underlying source to its start
///
/// Pull() delivers records; Pushback() re-queues the last delivered record so
/// the next Pull() returns it again. Only one level of pushback is allowed:
/// the combinators built on this class rely on at most one pending record per
/// stream.
///
/// Filters apply to ForEach() only. Pull() is the raw protocol used by
/// combinators and never filters.
///
/// Keys delivered by Pull() must be non-decreasing. Streams do not sort.
///
/// Thread safety: Not thread-safe. One consumer drives a stream at a time.
template<SortableKey K, typename V>
class SortedStream {
public:
    using KeyType = K;
    using ValueType = V;
    using RecordType = Record<K, V>;
    using Filter = std::function<bool(const K&, const V&)>;
    using Visitor = std::function<void(const K&, const V&)>;

    virtual ~SortedStream() = default;

    SortedStream() = default;
    SortedStream(const SortedStream&) = delete;
    SortedStream& operator=(const SortedStream&) = delete;

    /// Return the next record, the end marker, or an error.
    ///
    /// A pending pushback is delivered first. A failed Read() is returned
    /// as-is and does not replace the record held for pushback.
    PullResult<K, V> Pull() {
        if (pending_) {
            pending_ = false;
            return last_;
        }
        if (AtEnd()) {
            last_.reset();
            has_last_ = true;
            return std::optional<RecordType>{};
        }
        auto result = Read();
        if (!result) return result;
        last_ = *result;
        has_last_ = true;
        return result;
    }

    /// Push the last pulled record back onto the stream.
    /// Fails with PushbackPending if a pushback is already pending.
    [[nodiscard]] std::expected<void, Error> Pushback() {
        if (pending_) {
            return std::unexpected(Error{ErrorCode::PushbackPending,
                "cannot push back twice in a row on " + Describe()});
        }
        if (!has_last_) {
            return std::unexpected(Error{ErrorCode::NothingToPushBack,
                "nothing has been pulled from " + Describe()});
        }
        pending_ = true;
        return {};
    }

    bool PushbackPending() const { return pending_; }

    /// True when no record remains, accounting for a pending pushback.
    bool AtEnd() { return !pending_ && Exhausted(); }

    /// Reset iteration to the start. Discards any pending pushback, even
    /// when repositioning the source fails.
    std::expected<void, Error> Rewind() {
        pending_ = false;
        has_last_ = false;
        last_.reset();
        return DoRewind();
    }

    std::vector<Filter>& Filters() { return filters_; }
    const std::vector<Filter>& Filters() const { return filters_; }

    void AddFilter(Filter filter) { filters_.push_back(std::move(filter)); }

    /// Pull until the stream ends, visiting every record that passes all
    /// filters. Stops at and returns the first pull error.
    std::expected<void, Error> ForEach(const Visitor& visit) {
        while (!AtEnd()) {
            auto next = Pull();
            if (!next) return std::unexpected(std::move(next.error()));
            if (PassesFilters(*next)) {
                visit((*next)->key, (*next)->value);
            }
        }
        return {};
    }

    /// Diagnostic description, suitable for log messages.
    virtual std::string Describe() const = 0;

protected:
    virtual PullResult<K, V> Read() = 0;
    virtual bool Exhausted() = 0;
    virtual std::expected<void, Error> DoRewind() = 0;

private:
    bool PassesFilters(const std::optional<RecordType>& record) const {
        if (!record) return false;
        for (const auto& filter : filters_) {
            if (!filter(record->key, record->value)) return false;
        }
        return true;
    }

    std::optional<RecordType> last_;
    bool has_last_ = false;
    bool pending_ = false;
    std::vector<Filter> filters_;
};

/// Types usable wherever a stream is expected.
template<typename S>
concept StreamType = std::derived_from<S, SortedStream<typename S::KeyType, typename S::ValueType>>;

}  // namespace kvmerge
