// SPDX-License-Identifier: MIT

// lib/stream/line_stream.cpp
#include "lib/stream/line_stream.hpp"

#include <cctype>
#include <utility>

#include <fmt/format.h>

namespace kvmerge {

namespace {

std::vector<std::string> SplitFields(std::string_view line) {
    std::vector<std::string> fields;
    size_t pos = 0;
    while (pos < line.size()) {
        while (pos < line.size() && std::isspace(static_cast<unsigned char>(line[pos]))) {
            ++pos;
        }
        size_t start = pos;
        while (pos < line.size() && !std::isspace(static_cast<unsigned char>(line[pos]))) {
            ++pos;
        }
        if (pos > start) {
            fields.emplace_back(line.substr(start, pos - start));
        }
    }
    return fields;
}

}  // namespace

std::optional<LineStream::RecordType> LineStream::ParseLine(std::string_view line) {
    auto fields = SplitFields(line);
    if (fields.empty()) return std::nullopt;

    RecordType record{std::move(fields.front()), FieldValue{}};
    if (fields.size() == 2) {
        record.value = std::move(fields[1]);
    } else if (fields.size() > 2) {
        record.value = std::vector<std::string>(
            std::make_move_iterator(fields.begin() + 1),
            std::make_move_iterator(fields.end()));
    }
    return record;
}

PullResult<std::string, FieldValue> LineStream::Read() {
    if (source_.Exhausted()) {
        return std::optional<RecordType>{};
    }
    auto line = source_.ReadLine();
    if (!line) return std::unexpected(std::move(line.error()));
    return ParseLine(*line);
}

std::string LineStream::Describe() const {
    return fmt::format("LineStream(from {})", source_.Name());
}

}  // namespace kvmerge
