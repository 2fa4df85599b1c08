#include "../base_cli.hpp"
#include "../theme.hpp"
#include <iostream>
#include <fmt/format.h>
#include <core/config.hpp>
#include <core/log.hpp>

static int do_config(BaseCLI& cli, const std::vector<std::string>& args) {
    if (!args.empty() && args[0] == "init") {
        auto result = create_default_global_config();
        if (result.is_err()) {
            std::cout << theme::fail(result.error);
            return 1;
        }
        std::cout << theme::ok("Config at " + get_global_config_path().string());
        return 0;
    }

    std::cout << theme::section("Config");
    if (global_config_exists()) {
        std::cout << theme::kv("File", get_global_config_path().string());
    } else {
        std::cout << theme::kv("File", "(defaults; run 'gitbridge config init')");
    }

    const auto& ssh = cli.config.ssh();
    std::cout << theme::kv("SSH", ssh.command);
    std::cout << theme::kv("Port", ssh.port ? std::to_string(*ssh.port) : "-");
    std::cout << theme::kv("Txn", cli.config.bookmarks().transaction);
    std::cout << theme::kv("Log", cli.config.log().enabled ? bridge_log_path() : "disabled");
    std::cout << "\n";
    return 0;
}

void register_config_commands(BaseCLI& cli) {
    cli.add_command("config", do_config, "[init]",
                    "Show effective config or write the default file");
}
