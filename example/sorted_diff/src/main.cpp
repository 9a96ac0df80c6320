// SPDX-License-Identifier: MIT

// sorted_diff - compare two sorted key/value text files.
//
// usage: sorted_diff <config.yaml> [section...]
//
// Reads left/right/fold/title/max_report_lines/log_file from the named
// configuration sections (default: sorted_diff). Exit status is 0 when the
// inputs match, 1 when they differ and 2 on error.

#include "sorted_diff/inventory_diff.hpp"
#include "src/config.hpp"
#include "src/logging.hpp"
#include "src/reporter.hpp"
#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <iostream>
#include <string>
#include <vector>

namespace {

constexpr int kExitClean = 0;
constexpr int kExitDiffers = 1;
constexpr int kExitError = 2;

void log_error(const kvmerge::Error& e) {
    spdlog::error("{} error: {}", kvmerge::error_category(e.code), e.message);
}

}  // namespace

int main(int argc, char** argv) {
    if (argc < 2) {
        std::cerr << "usage: sorted_diff <config.yaml> [section...]\n";
        return kExitError;
    }

    std::vector<std::string> sections(argv + 2, argv + argc);
    if (sections.empty()) sections.emplace_back("sorted_diff");

    auto config = kvmerge::Config::Load(argv[1], sections);
    if (!config) {
        log_error(config.error());
        return kExitError;
    }

    auto options = sorted_diff::DiffOptions::from_config(*config);
    if (!options) {
        log_error(options.error());
        return kExitError;
    }

    auto logger = kvmerge::SetupLogging(kvmerge::LogConfig{
        .service = "sorted_diff",
        .file = options->log_file,
    });
    if (!logger) {
        log_error(logger.error());
        return kExitError;
    }

    kvmerge::Reporter reporter(
        options->title,
        fmt::format("{} against {}", options->left.string(), options->right.string()),
        *logger, options->max_report_lines);

    auto summary = sorted_diff::run_diff(*options, reporter);
    if (!summary) {
        log_error(summary.error());
        return kExitError;
    }

    reporter.Done();
    if (auto written = reporter.Write(std::cout); !written) {
        log_error(written.error());
        return kExitError;
    }
    return summary->clean() ? kExitClean : kExitDiffers;
}
