// SPDX-License-Identifier: MIT

// lib/stream/record.hpp
#pragma once

#include <concepts>
#include <expected>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "lib/stream/error.hpp"

namespace kvmerge {

/// Keys must be totally ordered; streams compare them with <, > and ==.
template<typename K>
concept SortableKey = std::totally_ordered<K> && std::copyable<K>;

/// One key/value pair produced by a stream.
template<typename K, typename V>
struct Record {
    K key;
    V value;

    bool operator==(const Record&) const = default;
};

/// Outcome of a single pull: an error, the end marker (empty optional),
/// or the next record.
template<typename K, typename V>
using PullResult = std::expected<std::optional<Record<K, V>>, Error>;

/// Value of a text line record.
///
/// - std::monostate: the line held only a key
/// - std::string: exactly one value field (Scalar)
/// - std::vector<std::string>: two or more value fields (Sequence)
using FieldValue = std::variant<std::monostate, std::string, std::vector<std::string>>;

/// Render a FieldValue as its fields joined by single spaces.
std::string ToString(const FieldValue& value);

}  // namespace kvmerge
