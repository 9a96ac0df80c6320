// SPDX-License-Identifier: MIT

// src/reporter.cpp
#include "src/reporter.hpp"

#include <utility>

#include <fmt/format.h>

namespace kvmerge {

Reporter::Reporter(std::string title, std::optional<std::string> subtitle,
                   std::shared_ptr<spdlog::logger> logger, std::size_t max_lines)
    : title_(std::move(title)),
      subtitle_(std::move(subtitle)),
      logger_(std::move(logger)),
      max_lines_(max_lines) {}

void Reporter::Emit(spdlog::level::level_enum level, std::string_view line) {
    if (logger_ && !line.empty()) {
        logger_->log(level, "{}: {}", title_, line);
    }
    Append(std::string(line));
}

void Reporter::Append(std::string line) {
    ++count_;
    if (head_.size() < HeadLimit()) {
        head_.push_back(std::move(line));
        return;
    }
    tail_.push_back(std::move(line));
    if (tail_.size() > TailLimit()) {
        tail_.pop_front();
    }
}

std::string Reporter::Heading() const {
    std::string heading = title_;
    if (subtitle_) {
        heading += fmt::format(": {}", *subtitle_);
    }
    if (done_) {
        std::chrono::duration<double> elapsed = *done_ - start_;
        heading += fmt::format(" ({:3.2f} seconds)", elapsed.count());
    }
    return heading;
}

void Reporter::ForEachLine(const LineVisitor& visit) const {
    const std::string heading = Heading();
    visit(heading);
    visit(std::string(heading.size(), ':'));

    if (count_ > max_lines_) {
        visit(fmt::format(
            "Note: {} of {} lines were discarded - see the system log for the complete report.",
            count_ - max_lines_, count_));
        for (const auto& line : head_) visit(line);
        visit(" ...");
        for (const auto& line : tail_) visit(line);
    } else {
        for (const auto& line : head_) visit(line);
        for (const auto& line : tail_) visit(line);
    }

    visit("");
}

std::expected<void, Error> Reporter::Write(std::ostream& out) const {
    ForEachLine([&out](std::string_view line) { out << line << '\n'; });
    out.flush();
    if (!out) {
        return std::unexpected(Error{ErrorCode::ReportWriteFailed,
            "can't write report " + title_});
    }
    return {};
}

void Reporter::Note(std::string_view message, std::ostream& out,
                    const std::shared_ptr<spdlog::logger>& logger) {
    if (logger) logger->info("{}", message);
    out << message << '\n';
}

}  // namespace kvmerge
