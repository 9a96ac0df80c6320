// SPDX-License-Identifier: MIT

// lib/stream/line_stream.hpp
#pragma once

#include <expected>
#include <string>
#include <string_view>
#include <vector>

#include "lib/stream/error.hpp"
#include "lib/stream/line_source.hpp"
#include "lib/stream/record.hpp"
#include "lib/stream/sorted_stream.hpp"

namespace kvmerge {

/// Leaf stream reading whitespace-delimited records, one per line.
///
/// The first field is the key; the remaining fields become the value
/// (see FieldValue). Lines should share the same arity, but mismatches pass
/// through unchanged. A line without any field produces the end marker for
/// that pull; the following line is still read by the next pull.
///
/// The LineSource must outlive the stream.
class LineStream : public SortedStream<std::string, FieldValue> {
public:
    explicit LineStream(LineSource& source) : source_(source) {}

    std::string Describe() const override;

    /// Split a line into its key and value. Returns the end marker for a
    /// line without fields.
    static std::optional<RecordType> ParseLine(std::string_view line);

protected:
    PullResult<std::string, FieldValue> Read() override;
    bool Exhausted() override { return source_.Exhausted(); }
    std::expected<void, Error> DoRewind() override { return source_.Rewind(); }

private:
    LineSource& source_;
};

}  // namespace kvmerge
