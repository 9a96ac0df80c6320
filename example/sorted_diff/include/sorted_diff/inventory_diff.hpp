// SPDX-License-Identifier: MIT

#pragma once

#include "src/config.hpp"
#include "src/reporter.hpp"
#include "lib/stream/error.hpp"
#include <cstddef>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <optional>
#include <string>

namespace sorted_diff {

// Settings read from the program's configuration section
struct DiffOptions {
    std::filesystem::path left;
    std::filesystem::path right;
    // Fold repeated keys into one record instead of keeping the first
    bool fold = false;
    std::string title = "Sorted Diff";
    size_t max_report_lines = kvmerge::Reporter::kDefaultMaxLines;
    std::optional<std::filesystem::path> log_file;

    static std::expected<DiffOptions, kvmerge::Error> from_config(const kvmerge::Config& config);
};

// Row counts from one comparison
struct DiffSummary {
    uint64_t matched = 0;      // Key on both sides, equal values
    uint64_t differing = 0;    // Key on both sides, different values
    uint64_t only_left = 0;    // Key missing from the right input
    uint64_t only_right = 0;   // Key missing from the left input

    bool clean() const { return differing == 0 && only_left == 0 && only_right == 0; }
};

// Compare the two sorted inputs named by options, writing one report line
// per mismatch and a closing summary to reporter.
std::expected<DiffSummary, kvmerge::Error> run_diff(const DiffOptions& options,
                                                    kvmerge::Reporter& reporter);

}  // namespace sorted_diff
