// SPDX-License-Identifier: MIT

// lib/stream/line_source.hpp
#pragma once

#include <expected>
#include <filesystem>
#include <istream>
#include <memory>
#include <string>

#include "lib/stream/error.hpp"

namespace kvmerge {

// LineSource owns an open line-oriented input for a LineStream.
//
// The caller owns the LineSource and decides when to release it; a
// LineStream only refers to it. After Release() the source reads as
// exhausted and Rewind()/ReadLine() fail with SourceReleased.
//
// Thread safety: NOT thread-safe.
class LineSource {
public:
    // Open a text file for reading.
    static std::expected<LineSource, Error> Open(const std::filesystem::path& path);

    // Wrap in-memory text, mostly for tests and small fixtures.
    static LineSource FromString(std::string text, std::string name = "string");

    LineSource(std::unique_ptr<std::istream> in, std::string name);

    LineSource(LineSource&&) noexcept = default;
    LineSource& operator=(LineSource&&) noexcept = default;

    bool IsOpen() const { return in_ != nullptr; }

    // True when no bytes remain (or the source was released).
    bool Exhausted();

    // Read the next line without its terminator.
    std::expected<std::string, Error> ReadLine();

    // Reposition to the first line.
    std::expected<void, Error> Rewind();

    // Close the underlying input. Idempotent.
    void Release() { in_.reset(); }

    const std::string& Name() const { return name_; }

private:
    std::unique_ptr<std::istream> in_;
    std::string name_;
};

}  // namespace kvmerge
