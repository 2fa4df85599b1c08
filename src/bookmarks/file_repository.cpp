#include "file_repository.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <platform/file_lock.hpp>
#include <fmt/format.h>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <system_error>

namespace {

class FileRepoLock : public RepoLock {
public:
    explicit FileRepoLock(const std::string& path) : lock_(path) {}
    bool held() const { return lock_.held(); }

private:
    FileLock lock_;
};

Result<std::unique_ptr<RepoLock>> acquire(const fs::path& path, const std::string& what) {
    auto lock = std::make_unique<FileRepoLock>(path.string());
    if (!lock->held()) {
        return Result<std::unique_ptr<RepoLock>>::Err(
            fmt::format("{} is locked ({})", what, path.string()));
    }
    bridge_log(fmt::format("acquired {}", path.string()));
    return Result<std::unique_ptr<RepoLock>>::Ok(std::move(lock));
}

} // namespace

// ── FileBookmarkStore ───────────────────────────────────────

Result<void> FileBookmarkStore::check_entry(const std::string& name, const std::string* node) {
    if (name.empty() || name != trimmed(name) || name.find_first_of("\r\n") != std::string::npos) {
        return Result<void>::Err(fmt::format("invalid bookmark name '{}'", name));
    }
    if (node && (node->empty() || node->find_first_of(" \t\r\n") != std::string::npos)) {
        return Result<void>::Err(fmt::format("invalid node '{}' for bookmark {}", *node, name));
    }
    return Result<void>::Ok();
}

fs::path FileBookmarkStore::pending_file() const {
    return file_.parent_path() / BOOKMARKS_PENDING;
}

Result<void> FileBookmarkStore::load() {
    marks_ = SubrepoEntries{};
    registered_ = false;

    if (!fs::exists(file_)) {
        return Result<void>::Ok();
    }

    std::ifstream in(file_);
    if (!in) {
        return Result<void>::Err("Cannot read " + file_.string());
    }
    std::stringstream buf;
    buf << in.rdbuf();

    auto parsed = parse_hgsubstate(split_lines(buf.str()));
    if (parsed.is_err()) {
        return Result<void>::Err(fmt::format("{}: {}", file_.string(), parsed.error));
    }
    marks_ = parsed.value;
    return Result<void>::Ok();
}

Result<void> FileBookmarkStore::apply_changes(Transaction& tr, const std::vector<BookmarkChange>& changes) {
    for (const auto& change : changes) {
        auto valid = check_entry(change.name, change.node ? &*change.node : nullptr);
        if (valid.is_err()) return valid;
    }
    for (const auto& change : changes) {
        if (change.node) {
            set(change.name, *change.node);
        } else {
            remove(change.name);
        }
    }
    return record_change(tr);
}

void FileBookmarkStore::set(const std::string& name, const std::string& node) {
    auto valid = check_entry(name, &node);
    if (valid.is_err()) {
        throw std::invalid_argument(valid.error);
    }
    marks_.set(name, node);
}

void FileBookmarkStore::remove(const std::string& name) {
    marks_.erase(name);
}

Result<void> FileBookmarkStore::record_change(Transaction& tr) {
    if (registered_) {
        return Result<void>::Ok();
    }
    registered_ = true;
    tr.add_finalizer([this]() { return write(); });
    return Result<void>::Ok();
}

Result<void> FileBookmarkStore::write() {
    fs::path pending = pending_file();
    {
        std::ofstream out(pending, std::ios::trunc);
        if (!out) {
            return Result<void>::Err("Cannot write " + pending.string());
        }
        out << serialize_hgsubstate(marks_);
        if (!out) {
            return Result<void>::Err("Failed writing " + pending.string());
        }
    }

    std::error_code ec;
    fs::rename(pending, file_, ec);
    if (ec) {
        fs::remove(pending, ec);
        return Result<void>::Err(fmt::format("Cannot replace {}: {}", file_.string(), ec.message()));
    }
    registered_ = false;
    return Result<void>::Ok();
}

// ── FileRepository ──────────────────────────────────────────

FileRepository::FileRepository(const fs::path& root)
    : root_(root), store_(root / HG_DIR / BOOKMARKS_FILE) {}

Result<std::unique_ptr<FileRepository>> FileRepository::open(const fs::path& root) {
    if (!fs::is_directory(root / HG_DIR)) {
        return Result<std::unique_ptr<FileRepository>>::Err(
            fmt::format("repository {} not found", root.string()));
    }
    return Result<std::unique_ptr<FileRepository>>::Ok(std::make_unique<FileRepository>(root));
}

fs::path FileRepository::hg_dir() const {
    return root_ / HG_DIR;
}

Result<std::unique_ptr<RepoLock>> FileRepository::wlock() {
    return acquire(hg_dir() / WLOCK_FILE, "working directory of " + root_.string());
}

Result<std::unique_ptr<RepoLock>> FileRepository::lock() {
    return acquire(hg_dir() / STORE_LOCK_FILE, "repository " + root_.string());
}

Result<std::unique_ptr<Transaction>> FileRepository::transaction(const std::string& name) {
    auto loaded = store_.load();
    if (loaded.is_err()) {
        return Result<std::unique_ptr<Transaction>>::Err(loaded.error);
    }

    auto tr = std::make_unique<Transaction>(name);
    // Aborting drops in-memory edits by re-reading the committed file
    tr->add_abort_handler([this]() {
        auto reloaded = store_.load();
        if (reloaded.is_err()) {
            bridge_log("reload after abort failed: " + reloaded.error);
        }
        std::error_code ec;
        fs::remove(hg_dir() / BOOKMARKS_PENDING, ec);
    });

    bridge_log(fmt::format("transaction {} opened in {}", name, root_.string()));
    return Result<std::unique_ptr<Transaction>>::Ok(std::move(tr));
}

Result<SubrepoEntries> FileRepository::read_bookmarks() {
    FileBookmarkStore reader(hg_dir() / BOOKMARKS_FILE);
    auto loaded = reader.load();
    if (loaded.is_err()) {
        return Result<SubrepoEntries>::Err(loaded.error);
    }
    return Result<SubrepoEntries>::Ok(reader.marks());
}
