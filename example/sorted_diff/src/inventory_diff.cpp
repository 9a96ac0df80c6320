// SPDX-License-Identifier: MIT

#include "sorted_diff/inventory_diff.hpp"
#include "src/stream.hpp"
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace sorted_diff {
namespace {

using kvmerge::ComparisonStream;
using kvmerge::Error;
using kvmerge::FieldValue;

std::string render(const FieldValue& value) {
    return kvmerge::ToString(value);
}

std::string render(const std::vector<FieldValue>& values) {
    std::vector<std::string> parts;
    parts.reserve(values.size());
    for (const auto& v : values) parts.push_back(kvmerge::ToString(v));
    return fmt::format("[{}]", fmt::join(parts, " | "));
}

template <typename V>
std::expected<DiffSummary, Error> walk(ComparisonStream<std::string, V, V>& diff,
                                       kvmerge::Reporter& reporter) {
    DiffSummary summary;
    auto result = diff.ForEach([&](const auto& row) {
        if (row.left && row.right) {
            if (*row.left == *row.right) {
                ++summary.matched;
                return;
            }
            ++summary.differing;
            reporter.Warn(fmt::format("differs: {} left={} right={}",
                                      row.key, render(*row.left), render(*row.right)));
        } else if (row.left) {
            ++summary.only_left;
            reporter.Warn(fmt::format("only in left: {} {}", row.key, render(*row.left)));
        } else {
            ++summary.only_right;
            reporter.Warn(fmt::format("only in right: {} {}", row.key, render(*row.right)));
        }
    });
    if (!result) return std::unexpected(std::move(result.error()));
    return summary;
}

}  // namespace

std::expected<DiffOptions, Error> DiffOptions::from_config(const kvmerge::Config& config) {
    DiffOptions options;

    auto left = config.Get<std::string>("left");
    if (!left) return std::unexpected(std::move(left.error()));
    options.left = *left;

    auto right = config.Get<std::string>("right");
    if (!right) return std::unexpected(std::move(right.error()));
    options.right = *right;

    auto fold = config.GetOr<bool>("fold", false);
    if (!fold) return std::unexpected(std::move(fold.error()));
    options.fold = *fold;

    auto title = config.GetOr<std::string>("title", options.title);
    if (!title) return std::unexpected(std::move(title.error()));
    options.title = *title;

    auto max_lines = config.GetOr<size_t>("max_report_lines", options.max_report_lines);
    if (!max_lines) return std::unexpected(std::move(max_lines.error()));
    options.max_report_lines = *max_lines;

    if (config.Contains("log_file")) {
        auto log_file = config.Get<std::string>("log_file");
        if (!log_file) return std::unexpected(std::move(log_file.error()));
        options.log_file = *log_file;
    }
    return options;
}

std::expected<DiffSummary, Error> run_diff(const DiffOptions& options,
                                           kvmerge::Reporter& reporter) {
    auto left_source = kvmerge::LineSource::Open(options.left);
    if (!left_source) return std::unexpected(std::move(left_source.error()));
    auto right_source = kvmerge::LineSource::Open(options.right);
    if (!right_source) return std::unexpected(std::move(right_source.error()));

    auto left = std::make_unique<kvmerge::LineStream>(*left_source);
    auto right = std::make_unique<kvmerge::LineStream>(*right_source);

    std::expected<DiffSummary, Error> summary;
    if (options.fold) {
        auto diff = kvmerge::DiffAgainst(kvmerge::MakeFoldedStream(std::move(left)),
                                         kvmerge::MakeFoldedStream(std::move(right)));
        spdlog::debug("running {}", diff.Describe());
        summary = walk(diff, reporter);
    } else {
        auto diff = kvmerge::DiffAgainst(kvmerge::MakeUniqueStream(std::move(left)),
                                         kvmerge::MakeUniqueStream(std::move(right)));
        spdlog::debug("running {}", diff.Describe());
        summary = walk(diff, reporter);
    }
    if (!summary) return summary;

    reporter.Info(fmt::format("{} matched, {} differing, {} only in left, {} only in right",
                              summary->matched, summary->differing,
                              summary->only_left, summary->only_right));
    return summary;
}

}  // namespace sorted_diff
