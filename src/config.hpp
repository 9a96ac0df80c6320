// SPDX-License-Identifier: MIT

// src/config.hpp
#pragma once

#include <expected>
#include <filesystem>
#include <functional>
#include <map>
#include <string>
#include <vector>

#include <yaml-cpp/yaml.h>

#include "lib/stream/error.hpp"

namespace kvmerge {

/// Flat key/value view over selected sections of a YAML file.
///
/// The file is a mapping of section names to mappings of simple key/value
/// pairs:
///
///   database:
///     connection_string: postgres://localhost/inventory
///   sorted_diff:
///     left: /var/data/left.txt
///     right: /var/data/right.txt
///
/// Sections are merged in the order they are requested, so a key that
/// appears in several sections takes the value from the last one. Typically
/// a few global sections come first, followed by the program's own.
///
/// Error messages name the file and section involved, since configuration
/// is where new installations usually go wrong.
class Config {
public:
    using Visitor = std::function<void(const std::string&, const YAML::Node&)>;

    /// Load @p sections from the YAML file at @p yaml_path.
    static std::expected<Config, Error> Load(const std::filesystem::path& yaml_path,
                                             const std::vector<std::string>& sections);

    bool Contains(const std::string& key) const { return values_.contains(key); }

    /// Convert the value for @p key to T.
    /// @return KeyNotFound or TypeMismatch on failure.
    template<typename T>
    std::expected<T, Error> Get(const std::string& key) const {
        auto it = values_.find(key);
        if (it == values_.end()) {
            return std::unexpected(Error{ErrorCode::KeyNotFound,
                "configuration has no key named " + key});
        }
        try {
            return it->second.as<T>();
        } catch (const YAML::Exception& e) {
            return std::unexpected(Error{ErrorCode::TypeMismatch,
                "configuration key " + key + " has an unexpected type: " + e.what()});
        }
    }

    /// Like Get<T>(), but a missing key yields @p fallback.
    template<typename T>
    std::expected<T, Error> GetOr(const std::string& key, T fallback) const {
        if (!Contains(key)) return fallback;
        return Get<T>(key);
    }

    void Set(const std::string& key, const std::string& value) {
        values_.erase(key);
        values_.emplace(key, YAML::Node(value));
    }

    std::vector<std::string> Keys() const;

    // Scalar text of every value, in key order. Non-scalars render as YAML.
    std::vector<std::string> Values() const;

    void ForEach(const Visitor& visit) const;

    std::size_t Size() const { return values_.size(); }

    const std::filesystem::path& Path() const { return path_; }

private:
    Config() = default;

    std::filesystem::path path_;
    std::map<std::string, YAML::Node> values_;
};

}  // namespace kvmerge
