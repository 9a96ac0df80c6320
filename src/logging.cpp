// SPDX-License-Identifier: MIT

// src/logging.cpp
#include "src/logging.hpp"

#include <unistd.h>

#include <array>
#include <utility>

#include <fmt/format.h>
#include <spdlog/pattern_formatter.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace kvmerge {

namespace {

// Pattern flag %* - severity as INFO/WARN/ERROR rather than spdlog's
// lower-case level names.
class SeverityFlag : public spdlog::custom_flag_formatter {
public:
    void format(const spdlog::details::log_msg& msg, const std::tm&,
                spdlog::memory_buf_t& dest) override {
        auto name = SeverityName(msg.level);
        dest.append(name.data(), name.data() + name.size());
    }

    std::unique_ptr<custom_flag_formatter> clone() const override {
        return std::make_unique<SeverityFlag>();
    }
};

std::string LocalHostName() {
    std::array<char, 256> buf{};
    if (::gethostname(buf.data(), buf.size() - 1) != 0) return "localhost";
    return std::string(buf.data());
}

}  // namespace

std::string_view SeverityName(spdlog::level::level_enum level) {
    switch (level) {
        case spdlog::level::trace: return "TRACE";
        case spdlog::level::debug: return "DEBUG";
        case spdlog::level::info: return "INFO";
        case spdlog::level::warn: return "WARN";
        case spdlog::level::err: return "ERROR";
        case spdlog::level::critical: return "FATAL";
        case spdlog::level::off:
        case spdlog::level::n_levels:
            break;
    }
    return "UNKNOWN";
}

std::expected<std::shared_ptr<spdlog::logger>, Error> SetupLogging(const LogConfig& config) {
    spdlog::sink_ptr sink;
    try {
        if (config.file) {
            sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(config.file->string());
        } else {
            sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        }
    } catch (const spdlog::spdlog_ex& e) {
        return std::unexpected(Error{ErrorCode::LogSetupFailed,
            "can't create log sink: " + std::string(e.what())});
    }

    auto logger = std::make_shared<spdlog::logger>(config.service, std::move(sink));
    logger->set_level(config.level);

    const std::string host = config.hostname.empty() ? LocalHostName() : config.hostname;
    auto formatter = std::make_unique<spdlog::pattern_formatter>();
    formatter->add_flag<SeverityFlag>('*').set_pattern(
        fmt::format("%Y-%m-%d %H:%M:%S {} {}[%P]: %* %v", host, config.service));
    logger->set_formatter(std::move(formatter));

    spdlog::drop(config.service);
    spdlog::set_default_logger(logger);
    return logger;
}

}  // namespace kvmerge
