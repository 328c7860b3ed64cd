/*
 * File:        fixlist_config.cpp
 * Module:      fixlist-core
 * Purpose:     Run configuration loaded from YAML
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#include "fixlist_config.h"
#include "logging.h"
#include <yaml-cpp/yaml.h>

namespace fixlist {

namespace {

FixlistConfig config_from_yaml(const YAML::Node& root, const std::string& source) {
    FixlistConfig config;

    if (!root || root.IsNull()) {
        return config;
    }
    if (!root.IsMap() || !root["fixlist"]) {
        throw ConfigError("Invalid configuration '" + source + "': missing required 'fixlist' section");
    }

    const YAML::Node node = root["fixlist"];
    if (!node.IsMap()) {
        throw ConfigError("Invalid configuration '" + source + "': 'fixlist' must be a map");
    }

    try {
        config.database_path = node["database"].as<std::string>(config.database_path);
        config.csv_output_path = node["csv_output"].as<std::string>(config.csv_output_path);
        config.report_output_path = node["report_output"].as<std::string>(config.report_output_path);
        config.thumbnail_dir = node["thumbnail_dir"].as<std::string>(config.thumbnail_dir);
        // as<int>(default) would hide a non-numeric value
        if (node["thumbnail_width"]) {
            config.thumbnail_width = node["thumbnail_width"].as<int>();
        }
        if (node["thumbnail_height"]) {
            config.thumbnail_height = node["thumbnail_height"].as<int>();
        }
        config.log_level = node["log_level"].as<std::string>(config.log_level);
        config.log_file = node["log_file"].as<std::string>(config.log_file);

        std::string delimiter = node["csv_delimiter"].as<std::string>(std::string(1, config.csv_delimiter));
        if (delimiter.size() != 1) {
            throw ConfigError("Invalid configuration '" + source + "': csv_delimiter must be one character, got '" +
                              delimiter + "'");
        }
        config.csv_delimiter = delimiter[0];

        if (node["on_malformed_line"]) {
            config.malformed_line_policy =
                malformed_line_policy_from_string(node["on_malformed_line"].as<std::string>());
        }
    } catch (const YAML::Exception& e) {
        throw ConfigError("Invalid configuration '" + source + "': " + e.what());
    } catch (const std::invalid_argument& e) {
        throw ConfigError("Invalid configuration '" + source + "': " + e.what());
    }

    if (config.thumbnail_width <= 0 || config.thumbnail_height <= 0) {
        throw ConfigError("Invalid configuration '" + source + "': thumbnail size must be positive");
    }

    return config;
}

} // anonymous namespace

FixlistConfig parse_config(const std::string& yaml_text) {
    YAML::Node root;
    try {
        root = YAML::Load(yaml_text);
    } catch (const YAML::Exception& e) {
        throw ConfigError(std::string("Failed to parse YAML configuration: ") + e.what());
    }
    return config_from_yaml(root, "<string>");
}

FixlistConfig load_config(const std::string& filename) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(filename);
    } catch (const YAML::Exception& e) {
        throw ConfigError("Failed to parse YAML file '" + filename + "': " + e.what());
    }

    FixlistConfig config = config_from_yaml(root, filename);
    FIXLIST_LOG_DEBUG("Loaded configuration from '{}'", filename);
    return config;
}

} // namespace fixlist
