#include "config.hpp"
#include "constants.hpp"
#include <platform/platform.hpp>
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>
#include <fstream>

namespace fs = std::filesystem;

bool global_config_exists() {
    return fs::exists(get_global_config_path());
}

fs::path get_global_config_dir() {
    return platform::home_dir() / ".gitbridge";
}

fs::path get_global_config_path() {
    return get_global_config_dir() / "config.yaml";
}

Result<void> create_default_global_config() {
    fs::path config_path = get_global_config_path();

    // Don't overwrite existing config
    if (fs::exists(config_path)) {
        return Result<void>::Ok();
    }

    const char* default_config = R"(# gitbridge configuration

ssh:
  command: "ssh"                   # ssh client used for git+ssh and scp-style remotes
  # port: 22                       # default port when the remote URL has none

bookmarks:
  transaction: "git_handler"       # transaction label used for bookmark updates

log:
  enabled: true
  # path: "/tmp/gitbridge_debug.log"
)";

    try {
        fs::create_directories(config_path.parent_path());
        std::ofstream out(config_path);
        if (!out) {
            return Result<void>::Err("Failed to create config file at " + config_path.string());
        }
        out << default_config;
        out.close();
        return Result<void>::Ok();
    } catch (const std::exception& e) {
        return Result<void>::Err("Failed to write config file: " + std::string(e.what()));
    }
}

static SshConfig parse_ssh_config(const YAML::Node& node) {
    SshConfig ssh;
    ssh.command = node["command"].as<std::string>(DEFAULT_SSH_COMMAND);
    if (node["port"] && node["port"].IsScalar()) {
        ssh.port = node["port"].as<int>();
    }
    return ssh;
}

static BookmarkConfig parse_bookmark_config(const YAML::Node& node) {
    BookmarkConfig bm;
    bm.transaction = node["transaction"].as<std::string>(DEFAULT_TRANSACTION_NAME);
    return bm;
}

static LogConfig parse_log_config(const YAML::Node& node) {
    LogConfig log;
    log.enabled = node["enabled"].as<bool>(true);
    log.path = node["path"].as<std::string>("");
    return log;
}


Result<Config> Config::parse(const std::string& yaml_text) {
    try {
        YAML::Node root = YAML::Load(yaml_text);

        Config config;
        if (!root || root.IsNull()) {
            return Result<Config>::Ok(config);
        }
        if (!root.IsMap()) {
            return Result<Config>::Err("Config root must be a mapping");
        }

        if (root["ssh"] && root["ssh"].IsMap()) {
            config.ssh_ = parse_ssh_config(root["ssh"]);
        }
        if (root["bookmarks"] && root["bookmarks"].IsMap()) {
            config.bookmarks_ = parse_bookmark_config(root["bookmarks"]);
        }
        if (root["log"] && root["log"].IsMap()) {
            config.log_ = parse_log_config(root["log"]);
        }

        if (config.ssh_.command.empty()) {
            return Result<Config>::Err("ssh.command must not be empty");
        }
        if (config.ssh_.port && (*config.ssh_.port <= 0 || *config.ssh_.port > 65535)) {
            return Result<Config>::Err(fmt::format("ssh.port out of range: {}", *config.ssh_.port));
        }

        return Result<Config>::Ok(config);
    } catch (const YAML::Exception& e) {
        return Result<Config>::Err(fmt::format("Failed to parse config: {}", e.what()));
    }
}

Result<Config> Config::load_file(const fs::path& path) {
    if (!fs::exists(path)) {
        return Result<Config>::Ok(Config{});
    }

    std::ifstream in(path);
    if (!in) {
        return Result<Config>::Err("Failed to open config file " + path.string());
    }
    std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());

    auto result = parse(text);
    if (result.is_err()) {
        return Result<Config>::Err(fmt::format("{}: {}", path.string(), result.error));
    }
    return result;
}

Result<Config> Config::load_global() {
    return load_file(get_global_config_path());
}
