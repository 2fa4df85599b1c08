#pragma once

#include <filesystem>
#include <string>
#include <vector>
#include "bookmarks.hpp"
#include <subrepo/subfile.hpp>

namespace fs = std::filesystem;

// Bookmarks kept in <root>/.hg/bookmarks as "<node> <name>" lines.
class FileBookmarkStore : public BookmarkStore {
public:
    explicit FileBookmarkStore(fs::path file) : file_(std::move(file)) {}

    // Re-read the bookmarks file. A missing file means no bookmarks.
    Result<void> load();

    const SubrepoEntries& marks() const { return marks_; }

    BookmarkCapabilities capabilities() const override { return {}; }
    Result<void> apply_changes(Transaction& tr, const std::vector<BookmarkChange>& changes) override;
    // Throws std::invalid_argument for an entry the file format cannot hold.
    void set(const std::string& name, const std::string& node) override;
    void remove(const std::string& name) override;
    Result<void> record_change(Transaction& tr) override;
    Result<void> write() override;

private:
    // A name must be non-empty, single-line and free of surrounding
    // whitespace; a node must be non-empty and contain no whitespace.
    static Result<void> check_entry(const std::string& name, const std::string* node);

    fs::path file_;
    fs::path pending_file() const;
    SubrepoEntries marks_;
    bool registered_ = false;
};

// A Mercurial-style repository directory: <root>/.hg with a working-copy
// lock (.hg/wlock) and a store lock (.hg/store/lock).
class FileRepository : public Repository {
public:
    explicit FileRepository(const fs::path& root);

    // Fails unless <root>/.hg exists.
    static Result<std::unique_ptr<FileRepository>> open(const fs::path& root);

    Result<std::unique_ptr<RepoLock>> wlock() override;
    Result<std::unique_ptr<RepoLock>> lock() override;
    Result<std::unique_ptr<Transaction>> transaction(const std::string& name) override;
    BookmarkStore& bookmarks() override { return store_; }

    // Current on-disk bookmarks (name -> node)
    Result<SubrepoEntries> read_bookmarks();

    fs::path hg_dir() const;

private:
    fs::path root_;
    FileBookmarkStore store_;
};
