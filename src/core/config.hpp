#pragma once

#include <string>
#include <filesystem>
#include "types.hpp"

namespace fs = std::filesystem;

class Config {
public:
    // Load global config from ~/.gitbridge/config.yaml. A missing file yields defaults.
    static Result<Config> load_global();

    // Load config from an explicit path. A missing file yields defaults.
    static Result<Config> load_file(const fs::path& path);

    // Parse config from YAML text
    static Result<Config> parse(const std::string& yaml_text);

    // Accessors
    const SshConfig& ssh() const { return ssh_; }
    const BookmarkConfig& bookmarks() const { return bookmarks_; }
    const LogConfig& log() const { return log_; }

public:
    Config() = default;

private:
    SshConfig ssh_;
    BookmarkConfig bookmarks_;
    LogConfig log_;
};

// Helper to check if the global config exists
bool global_config_exists();

// Get paths
fs::path get_global_config_dir();
fs::path get_global_config_path();

// Create default global config (never overwrites an existing one)
Result<void> create_default_global_config();
