// SPDX-License-Identifier: MIT

// lib/stream/line_source.cpp
#include "lib/stream/line_source.hpp"

#include <fstream>
#include <sstream>
#include <string>
#include <system_error>
#include <utility>

namespace kvmerge {

std::expected<LineSource, Error> LineSource::Open(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return std::unexpected(Error{ErrorCode::SourceNotFound,
            "can't find input file " + path.string()});
    }
    auto in = std::make_unique<std::ifstream>(path);
    if (!in->is_open()) {
        return std::unexpected(Error{ErrorCode::ReadFailed,
            "can't open input file " + path.string()});
    }
    return LineSource(std::move(in), path.string());
}

LineSource LineSource::FromString(std::string text, std::string name) {
    return LineSource(std::make_unique<std::istringstream>(std::move(text)), std::move(name));
}

LineSource::LineSource(std::unique_ptr<std::istream> in, std::string name)
    : in_(std::move(in)), name_(std::move(name)) {}

bool LineSource::Exhausted() {
    if (!in_) return true;
    // peek() sets eofbit on an empty remainder; a bad stream has nothing
    // more to give either.
    return in_->peek() == std::istream::traits_type::eof();
}

std::expected<std::string, Error> LineSource::ReadLine() {
    if (!in_) {
        return std::unexpected(Error{ErrorCode::SourceReleased,
            "line source " + name_ + " has been released"});
    }
    std::string line;
    if (!std::getline(*in_, line)) {
        if (in_->bad()) {
            return std::unexpected(Error{ErrorCode::ReadFailed,
                "I/O error reading " + name_});
        }
        return std::string{};
    }
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
    return line;
}

std::expected<void, Error> LineSource::Rewind() {
    if (!in_) {
        return std::unexpected(Error{ErrorCode::SourceReleased,
            "line source " + name_ + " can't be rewound: it has been released"});
    }
    in_->clear();
    in_->seekg(0, std::ios::beg);
    if (in_->fail()) {
        return std::unexpected(Error{ErrorCode::ReadFailed,
            "can't reposition " + name_});
    }
    return {};
}

}  // namespace kvmerge
