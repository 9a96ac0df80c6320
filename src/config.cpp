// SPDX-License-Identifier: MIT

// src/config.cpp
#include "src/config.hpp"

#include <fstream>
#include <system_error>
#include <utility>

namespace kvmerge {

namespace {

std::string NodeTypeName(const YAML::Node& node) {
    switch (node.Type()) {
        case YAML::NodeType::Undefined: return "undefined";
        case YAML::NodeType::Null: return "null";
        case YAML::NodeType::Scalar: return "scalar";
        case YAML::NodeType::Sequence: return "sequence";
        case YAML::NodeType::Map: return "mapping";
    }
    return "unknown";
}

std::string NodeText(const YAML::Node& node) {
    if (node.IsScalar()) return node.Scalar();
    YAML::Emitter out;
    out << YAML::Flow << node;
    return out.c_str();
}

}  // namespace

std::expected<Config, Error> Config::Load(const std::filesystem::path& yaml_path,
                                          const std::vector<std::string>& sections) {
    const std::string path = yaml_path.string();

    std::error_code ec;
    if (!std::filesystem::is_regular_file(yaml_path, ec)) {
        return std::unexpected(Error{ErrorCode::ConfigNotFound,
            "configuration setup can't find the specified YAML file " + path});
    }
    if (!std::ifstream(yaml_path).is_open()) {
        return std::unexpected(Error{ErrorCode::ConfigUnreadable,
            "configuration setup can't read the specified YAML file " + path});
    }
    if (sections.empty()) {
        return std::unexpected(Error{ErrorCode::NoSections,
            "configuration setup wasn't given any sections to read from " + path});
    }

    YAML::Node root;
    try {
        root = YAML::LoadFile(path);
    } catch (const YAML::Exception& e) {
        return std::unexpected(Error{ErrorCode::ConfigParseError,
            "configuration setup did not correctly parse the specified YAML file " +
                path + ": " + e.what()});
    }

    if (!root.IsMap()) {
        return std::unexpected(Error{ErrorCode::ConfigNotMapping,
            "configuration setup parsed the specified YAML file " + path +
                ", but it's not a simple mapping (it's a " + NodeTypeName(root) + ")"});
    }

    Config config;
    config.path_ = yaml_path;

    for (const auto& name : sections) {
        const YAML::Node section = root[name];
        if (!section.IsDefined()) {
            return std::unexpected(Error{ErrorCode::SectionNotFound,
                "configuration setup could not find a section named " + name +
                    " in the specified YAML file " + path});
        }
        if (section.IsNull()) continue;
        if (!section.IsMap()) {
            return std::unexpected(Error{ErrorCode::SectionNotMapping,
                "configuration setup expected that the section named " + name +
                    " from the specified YAML file " + path +
                    " would be a mapping, but instead it's a " + NodeTypeName(section)});
        }
        for (const auto& entry : section) {
            auto key = entry.first.as<std::string>();
            config.values_.erase(key);
            config.values_.emplace(std::move(key), YAML::Clone(entry.second));
        }
    }
    return config;
}

std::vector<std::string> Config::Keys() const {
    std::vector<std::string> keys;
    keys.reserve(values_.size());
    for (const auto& [key, value] : values_) keys.push_back(key);
    return keys;
}

std::vector<std::string> Config::Values() const {
    std::vector<std::string> values;
    values.reserve(values_.size());
    for (const auto& [key, value] : values_) values.push_back(NodeText(value));
    return values;
}

void Config::ForEach(const Visitor& visit) const {
    for (const auto& [key, value] : values_) visit(key, value);
}

}  // namespace kvmerge
