#pragma once

#include <string>
#include <vector>
#include <map>
#include <functional>
#include <core/config.hpp>

class BaseCLI {
public:
    BaseCLI();
    virtual ~BaseCLI() = default;

    // Returns the process exit code.
    using CommandHandler = std::function<int(BaseCLI&, const std::vector<std::string>&)>;

    void add_command(const std::string& name,
                     CommandHandler handler,
                     const std::string& usage,
                     const std::string& help);

    // Runs a command; exceptions are reported and turned into exit code 1.
    int execute_command(const std::string& command, const std::vector<std::string>& args);
    void print_help() const;

    // Effective configuration (defaults when the global file is absent)
    Config config;
    std::string config_error;

protected:
    struct CommandInfo {
        CommandHandler handler;
        std::string usage;
        std::string help;
    };
    std::map<std::string, CommandInfo> commands_;
};

void register_remote_commands(BaseCLI& cli);
void register_subrepo_commands(BaseCLI& cli);
void register_bookmark_commands(BaseCLI& cli);
void register_config_commands(BaseCLI& cli);
