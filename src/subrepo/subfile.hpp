#pragma once

#include <string>
#include <vector>
#include <utility>
#include <optional>
#include <core/types.hpp>

// Ordered string map: keeps first-insertion order, re-assignment updates in place.
class SubrepoEntries {
public:
    using Entry = std::pair<std::string, std::string>;

    void set(const std::string& key, const std::string& value);
    std::optional<std::string> get(const std::string& key) const;
    bool erase(const std::string& key);

    const std::vector<Entry>& entries() const { return entries_; }
    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }

    bool operator==(const SubrepoEntries& other) const { return entries_ == other.entries_; }

private:
    std::vector<Entry> entries_;
};

// .hgsub: "<path> = <source>" per line. Blank lines and '#' comments are skipped.
Result<SubrepoEntries> parse_hgsub(const std::vector<std::string>& lines);
std::string serialize_hgsub(const SubrepoEntries& data);

// .hgsubstate: "<revision> <path>" per line, keyed by path. Serialized in
// sorted path order.
Result<SubrepoEntries> parse_hgsubstate(const std::vector<std::string>& lines);
std::string serialize_hgsubstate(const SubrepoEntries& data);
