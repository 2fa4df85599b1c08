#include "../base_cli.hpp"
#include "../theme.hpp"
#include <iostream>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <core/constants.hpp>
#include <remote/endpoint.hpp>
#include <remote/resolver.hpp>
#include <remote/ssh_guard.hpp>

static int do_classify(BaseCLI& cli, const std::vector<std::string>& args) {
    (void)cli;
    if (args.size() != 1) {
        std::cout << theme::fail("Usage: gitbridge classify <location>");
        return 1;
    }

    auto endpoint = classify_endpoint(args[0]);
    if (!endpoint) {
        std::cout << theme::info(fmt::format("{}: not ssh", args[0]));
        return 0;
    }

    std::cout << theme::ok(fmt::format("{}: ssh", args[0]));
    if (!endpoint->user.empty()) {
        std::cout << theme::kv("User", endpoint->user);
    }
    std::cout << theme::kv("Host", endpoint->host);
    std::cout << theme::kv("Path", endpoint->path);
    return 0;
}

static int do_check_host(BaseCLI& cli, const std::vector<std::string>& args) {
    (void)cli;
    if (args.size() != 1) {
        std::cout << theme::fail("Usage: gitbridge check-host <host>");
        return 1;
    }

    // Throws SecurityError; reported by execute_command
    check_safe_ssh_host(args[0]);
    std::cout << theme::ok(fmt::format("{}: safe", args[0]));
    return 0;
}

static int do_resolve(BaseCLI& cli, const std::vector<std::string>& args) {
    if (args.empty() || args.size() > 2) {
        std::cout << theme::fail("Usage: gitbridge resolve <location> [service]");
        return 1;
    }

    auto result = resolve_remote(args[0]);
    if (result.is_err()) {
        std::cout << theme::fail(result.error);
        return 1;
    }

    const auto& target = result.value;
    std::cout << theme::kv("Transport", transport_name(target.kind));
    std::cout << theme::kv("URL", target.url);

    if (target.kind == TransportKind::Ssh) {
        std::string service = args.size() == 2 ? args[1] : DEFAULT_UPLOAD_SERVICE;
        auto argv = build_ssh_argv(cli.config.ssh(), target, service);
        std::cout << theme::kv("Command", fmt::format("{}", fmt::join(argv, " ")));
    } else if (target.kind == TransportKind::Local) {
        std::cout << theme::kv("Path", target.path);
    }
    return 0;
}

void register_remote_commands(BaseCLI& cli) {
    cli.add_command("classify", do_classify, "<location>",
                    "Check whether a location is scp-style SSH");
    cli.add_command("check-host", do_check_host, "<host>",
                    "Reject hosts ssh would read as options");
    cli.add_command("resolve", do_resolve, "<location> [service]",
                    "Show transport and ssh command for a remote");
}
