#include "base_cli.hpp"
#include "theme.hpp"
#include <core/log.hpp>
#include <iostream>
#include <fmt/format.h>

BaseCLI::BaseCLI() {
    auto config_result = Config::load_global();
    if (config_result.is_ok()) {
        config = config_result.value;
    } else {
        config_error = config_result.error;
    }
    configure_log(config.log());

    register_remote_commands(*this);
    register_subrepo_commands(*this);
    register_bookmark_commands(*this);
    register_config_commands(*this);
}

void BaseCLI::add_command(const std::string& name,
                          CommandHandler handler,
                          const std::string& usage,
                          const std::string& help) {
    commands_[name] = {std::move(handler), usage, help};
}

int BaseCLI::execute_command(const std::string& command, const std::vector<std::string>& args) {
    auto it = commands_.find(command);
    if (it == commands_.end()) {
        std::cout << theme::fail("Unknown command: " + command);
        std::cout << theme::step("Run 'gitbridge --help' for available commands.");
        return 1;
    }

    if (!config_error.empty()) {
        std::cout << theme::info("Using default config: " + config_error);
    }

    bridge_log(fmt::format("command: {} ({} args)", command, args.size()));
    try {
        return it->second.handler(*this, args);
    } catch (const std::exception& e) {
        bridge_log(fmt::format("command {} failed: {}", command, e.what()));
        std::cout << theme::fail(std::string(e.what()));
        return 1;
    }
}

void BaseCLI::print_help() const {
    std::cout << theme::section("Usage");
    for (const auto& [name, cmd] : commands_) {
        std::cout << theme::color::BLUE << fmt::format("    gitbridge {} ", name)
                  << theme::color::RESET << theme::color::BROWN << fmt::format("{:<24}", cmd.usage)
                  << theme::color::RESET << theme::color::DIM << cmd.help
                  << theme::color::RESET << "\n";
    }
    std::cout << "\n";
    std::cout << theme::color::DIM
              << "    gitbridge --version        Show version\n"
              << "    gitbridge --help           Show this help"
              << theme::color::RESET << "\n\n";
}
