// SPDX-License-Identifier: MIT

// lib/stream/vector_stream.hpp
#pragma once

#include <cstddef>
#include <expected>
#include <string>
#include <utility>
#include <vector>

#include <fmt/format.h>

#include "lib/stream/sorted_stream.hpp"

namespace kvmerge {

// In-memory leaf stream over records already sorted by key.
template<SortableKey K, typename V>
class VectorStream : public SortedStream<K, V> {
public:
    using RecordType = typename SortedStream<K, V>::RecordType;

    explicit VectorStream(std::vector<RecordType> records)
        : records_(std::move(records)) {}

    std::string Describe() const override {
        return fmt::format("VectorStream({} records)", records_.size());
    }

protected:
    PullResult<K, V> Read() override {
        if (pos_ >= records_.size()) return std::optional<RecordType>{};
        return records_[pos_++];
    }

    bool Exhausted() override { return pos_ >= records_.size(); }

    std::expected<void, Error> DoRewind() override {
        pos_ = 0;
        return {};
    }

private:
    std::vector<RecordType> records_;
    std::size_t pos_ = 0;
};

}  // namespace kvmerge
