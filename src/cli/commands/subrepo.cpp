#include "../base_cli.hpp"
#include "../theme.hpp"
#include <iostream>
#include <fstream>
#include <sstream>
#include <filesystem>
#include <fmt/format.h>
#include <core/constants.hpp>
#include <core/utils.hpp>
#include <subrepo/subfile.hpp>

namespace fs = std::filesystem;

static int do_subfile(BaseCLI& cli, const std::vector<std::string>& args) {
    (void)cli;
    if (args.size() != 1) {
        std::cout << theme::fail("Usage: gitbridge subfile <.hgsub|.hgsubstate>");
        return 1;
    }

    fs::path path(args[0]);
    std::ifstream in(path);
    if (!in) {
        std::cout << theme::fail("Cannot read " + path.string());
        return 1;
    }
    std::stringstream buf;
    buf << in.rdbuf();
    auto lines = split_lines(buf.str());

    std::string name = path.filename().string();
    if (name == HGSUBSTATE_FILE) {
        auto parsed = parse_hgsubstate(lines);
        if (parsed.is_err()) {
            std::cout << theme::fail(parsed.error);
            return 1;
        }
        std::cout << serialize_hgsubstate(parsed.value);
    } else if (name == HGSUB_FILE) {
        auto parsed = parse_hgsub(lines);
        if (parsed.is_err()) {
            std::cout << theme::fail(parsed.error);
            return 1;
        }
        std::cout << serialize_hgsub(parsed.value);
    } else {
        std::cout << theme::fail(fmt::format("Unknown subrepo file: {} (expected {} or {})",
                                             name, HGSUB_FILE, HGSUBSTATE_FILE));
        return 1;
    }
    return 0;
}

void register_subrepo_commands(BaseCLI& cli) {
    cli.add_command("subfile", do_subfile, "<path>",
                    "Print .hgsub/.hgsubstate in canonical form");
}
