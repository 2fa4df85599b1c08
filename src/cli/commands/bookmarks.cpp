#include "../base_cli.hpp"
#include "../theme.hpp"
#include <iostream>
#include <fmt/format.h>
#include <bookmarks/file_repository.hpp>

// "name=node" sets, bare "name" deletes
static BookmarkChange parse_change(const std::string& arg) {
    auto eq = arg.find('=');
    if (eq == std::string::npos) {
        return {arg, std::nullopt};
    }
    return {arg.substr(0, eq), arg.substr(eq + 1)};
}

static int do_bookmark(BaseCLI& cli, const std::vector<std::string>& args) {
    if (args.size() < 2) {
        std::cout << theme::fail("Usage: gitbridge bookmark <repo> <name>[=<node>]...");
        return 1;
    }

    auto repo = FileRepository::open(args[0]);
    if (repo.is_err()) {
        std::cout << theme::fail(repo.error);
        return 1;
    }

    std::vector<BookmarkChange> changes;
    for (size_t i = 1; i < args.size(); ++i) {
        auto change = parse_change(args[i]);
        if (change.name.empty()) {
            std::cout << theme::fail("Empty bookmark name in '" + args[i] + "'");
            return 1;
        }
        changes.push_back(change);
    }

    auto result = update_bookmarks(*repo.value, changes, cli.config.bookmarks().transaction);
    if (result.is_err()) {
        std::cout << theme::fail(result.error);
        return 1;
    }

    for (const auto& change : changes) {
        if (change.node) {
            std::cout << theme::ok(fmt::format("{} -> {}", change.name, *change.node));
        } else {
            std::cout << theme::ok(fmt::format("{} deleted", change.name));
        }
    }
    return 0;
}

static int do_bookmarks(BaseCLI& cli, const std::vector<std::string>& args) {
    (void)cli;
    if (args.size() != 1) {
        std::cout << theme::fail("Usage: gitbridge bookmarks <repo>");
        return 1;
    }

    auto repo = FileRepository::open(args[0]);
    if (repo.is_err()) {
        std::cout << theme::fail(repo.error);
        return 1;
    }
    auto marks = repo.value->read_bookmarks();
    if (marks.is_err()) {
        std::cout << theme::fail(marks.error);
        return 1;
    }

    if (marks.value.empty()) {
        std::cout << theme::info("no bookmarks set");
    }
    for (const auto& [name, node] : marks.value.entries()) {
        std::cout << theme::kv(name, node);
    }
    return 0;
}

void register_bookmark_commands(BaseCLI& cli) {
    cli.add_command("bookmark", do_bookmark, "<repo> <name>[=<node>]...",
                    "Set or delete bookmarks under the repository locks");
    cli.add_command("bookmarks", do_bookmarks, "<repo>",
                    "List bookmarks");
}
