// SPDX-License-Identifier: MIT

// src/reporter.hpp
#pragma once

#include <chrono>
#include <cstddef>
#include <deque>
#include <expected>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <spdlog/spdlog.h>

#include "lib/stream/error.hpp"

namespace kvmerge {

// Reporter combines logging with a short written report.
//
//   Reporter rep("Inventory Check", "left.txt against right.txt");
//   rep.Info("3 keys only in left");   // logs "Inventory Check: 3 keys only in left"
//   rep.Write(std::cout);
//
// produces
//
//   Inventory Check: left.txt against right.txt
//   :::::::::::::::::::::::::::::::::::::::::::
//   3 keys only in left
//
// The subtitle only appears in the written report; severity only appears in
// the log. Keep the title short since it prefixes every log line.
//
// A report holds at most max_lines lines: once exceeded, the first half and
// the last half are kept and the middle is dropped (the log still has
// everything).
//
// Thread safety: NOT thread-safe.
class Reporter {
public:
    static constexpr std::size_t kDefaultMaxLines = 2000;

    using LineVisitor = std::function<void(std::string_view)>;

    explicit Reporter(std::string title,
                      std::optional<std::string> subtitle = std::nullopt,
                      std::shared_ptr<spdlog::logger> logger = spdlog::default_logger(),
                      std::size_t max_lines = kDefaultMaxLines);

    void Info(std::string_view line) { Emit(spdlog::level::info, line); }
    void Warn(std::string_view line) { Emit(spdlog::level::warn, line); }
    void Err(std::string_view line) { Emit(spdlog::level::err, line); }

    // Append an empty line to the report. Nothing is logged.
    void Blank() { Append(std::string{}); }

    // Stop the clock; the heading then includes the elapsed seconds.
    void Done() { done_ = Clock::now(); }

    // True if anything has been reported.
    bool Interesting() const { return count_ > 0; }

    std::size_t Count() const { return count_; }
    std::size_t MaxLines() const { return max_lines_; }
    const std::string& Title() const { return title_; }

    // Heading, rule, report lines (truncated in the middle if needed), then
    // an empty line.
    void ForEachLine(const LineVisitor& visit) const;

    std::expected<void, Error> Write(std::ostream& out) const;

    // Log @p message at info and write it to @p out immediately.
    static void Note(std::string_view message, std::ostream& out = std::cout,
                     const std::shared_ptr<spdlog::logger>& logger = spdlog::default_logger());

private:
    using Clock = std::chrono::steady_clock;

    void Emit(spdlog::level::level_enum level, std::string_view line);
    void Append(std::string line);
    std::string Heading() const;

    std::size_t HeadLimit() const { return max_lines_ / 2 + max_lines_ % 2; }
    std::size_t TailLimit() const { return max_lines_ / 2; }

    std::string title_;
    std::optional<std::string> subtitle_;
    std::shared_ptr<spdlog::logger> logger_;
    std::size_t max_lines_;

    Clock::time_point start_ = Clock::now();
    std::optional<Clock::time_point> done_;

    std::size_t count_ = 0;
    std::vector<std::string> head_;
    std::deque<std::string> tail_;
};

}  // namespace kvmerge
