// SPDX-License-Identifier: MIT

// lib/stream/record.cpp
#include "lib/stream/record.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>

namespace kvmerge {

std::string ToString(const FieldValue& value) {
    if (const auto* scalar = std::get_if<std::string>(&value)) {
        return *scalar;
    }
    if (const auto* fields = std::get_if<std::vector<std::string>>(&value)) {
        return fmt::format("{}", fmt::join(*fields, " "));
    }
    return {};
}

}  // namespace kvmerge
