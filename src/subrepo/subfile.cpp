#include "subfile.hpp"
#include <core/utils.hpp>
#include <fmt/format.h>
#include <algorithm>

void SubrepoEntries::set(const std::string& key, const std::string& value) {
    for (auto& e : entries_) {
        if (e.first == key) {
            e.second = value;
            return;
        }
    }
    entries_.emplace_back(key, value);
}

std::optional<std::string> SubrepoEntries::get(const std::string& key) const {
    for (const auto& e : entries_) {
        if (e.first == key) return e.second;
    }
    return std::nullopt;
}

bool SubrepoEntries::erase(const std::string& key) {
    auto it = std::find_if(entries_.begin(), entries_.end(),
                           [&](const Entry& e) { return e.first == key; });
    if (it == entries_.end()) return false;
    entries_.erase(it);
    return true;
}

static bool skip_line(const std::string& line) {
    std::string ls = trimmed(line);
    return ls.empty() || ls[0] == '#';
}

Result<SubrepoEntries> parse_hgsub(const std::vector<std::string>& lines) {
    SubrepoEntries rv;
    for (size_t i = 0; i < lines.size(); ++i) {
        const auto& line = lines[i];
        if (skip_line(line)) continue;

        size_t eq = line.find('=');
        if (eq == std::string::npos) {
            return Result<SubrepoEntries>::Err(
                fmt::format(".hgsub line {}: expected 'path = source': {}", i + 1, trimmed(line)));
        }
        rv.set(trimmed(line.substr(0, eq)), trimmed(line.substr(eq + 1)));
    }
    return Result<SubrepoEntries>::Ok(rv);
}

std::string serialize_hgsub(const SubrepoEntries& data) {
    std::string out;
    for (const auto& [name, value] : data.entries()) {
        out += fmt::format("{} = {}\n", name, value);
    }
    return out;
}

Result<SubrepoEntries> parse_hgsubstate(const std::vector<std::string>& lines) {
    SubrepoEntries rv;
    for (size_t i = 0; i < lines.size(); ++i) {
        const auto& line = lines[i];
        if (skip_line(line)) continue;

        size_t sp = line.find(' ');
        if (sp == std::string::npos) {
            return Result<SubrepoEntries>::Err(
                fmt::format(".hgsubstate line {}: expected 'revision path': {}", i + 1, trimmed(line)));
        }
        rv.set(trimmed(line.substr(sp + 1)), trimmed(line.substr(0, sp)));
    }
    return Result<SubrepoEntries>::Ok(rv);
}

std::string serialize_hgsubstate(const SubrepoEntries& data) {
    auto sorted = data.entries();
    std::sort(sorted.begin(), sorted.end(),
              [](const auto& a, const auto& b) { return a.first < b.first; });

    std::string out;
    for (const auto& [name, value] : sorted) {
        out += fmt::format("{} {}\n", value, name);
    }
    return out;
}
