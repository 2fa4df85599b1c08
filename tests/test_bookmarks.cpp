#include <gtest/gtest.h>
#include <bookmarks/bookmarks.hpp>
#include <bookmarks/file_repository.hpp>
#include <platform/file_lock.hpp>
#include <filesystem>
#include <fstream>
#include <map>
#include <sstream>
#include <stdexcept>

namespace fs = std::filesystem;

// ── ordered acquisition (in-memory repository) ─────────────

namespace {

using EventLog = std::vector<std::string>;

class RecordingLock : public RepoLock {
public:
    RecordingLock(EventLog& log, std::string name) : log_(log), name_(std::move(name)) {
        log_.push_back("acquire " + name_);
    }
    ~RecordingLock() override { log_.push_back("release " + name_); }

private:
    EventLog& log_;
    std::string name_;
};

class RecordingTransaction : public Transaction {
public:
    RecordingTransaction(EventLog& log, const std::string& name) : Transaction(name), log_(log) {
        log_.push_back("open " + name);
    }
    ~RecordingTransaction() override {
        abort();
        log_.push_back(closed() ? "release committed" : "release aborted");
    }

private:
    EventLog& log_;
};

class MemoryStore : public BookmarkStore {
public:
    BookmarkCapabilities caps;
    std::map<std::string, std::string> marks;
    std::map<std::string, std::string> committed;
    EventLog* log = nullptr;
    bool fail_write = false;

    BookmarkCapabilities capabilities() const override { return caps; }

    Result<void> apply_changes(Transaction& tr, const std::vector<BookmarkChange>& changes) override {
        log->push_back("apply_changes");
        for (const auto& c : changes) {
            if (c.node) marks[c.name] = *c.node;
            else marks.erase(c.name);
        }
        return record(tr);
    }

    void set(const std::string& name, const std::string& node) override {
        log->push_back("set " + name);
        marks[name] = node;
    }

    void remove(const std::string& name) override {
        log->push_back("remove " + name);
        marks.erase(name);
    }

    Result<void> record_change(Transaction& tr) override {
        log->push_back("record_change");
        return record(tr);
    }

    Result<void> write() override {
        log->push_back("write");
        if (fail_write) return Result<void>::Err("disk full");
        committed = marks;
        return Result<void>::Ok();
    }

private:
    Result<void> record(Transaction& tr) {
        tr.add_finalizer([this]() { return write(); });
        tr.add_abort_handler([this]() { marks = committed; });
        return Result<void>::Ok();
    }
};

class MemoryRepository : public Repository {
public:
    EventLog log;
    MemoryStore store;
    bool wlock_busy = false;
    bool lock_busy = false;

    MemoryRepository() { store.log = &log; }

    Result<std::unique_ptr<RepoLock>> wlock() override {
        if (wlock_busy) return Result<std::unique_ptr<RepoLock>>::Err("wlock busy");
        return Result<std::unique_ptr<RepoLock>>::Ok(std::make_unique<RecordingLock>(log, "wlock"));
    }

    Result<std::unique_ptr<RepoLock>> lock() override {
        if (lock_busy) return Result<std::unique_ptr<RepoLock>>::Err("lock busy");
        return Result<std::unique_ptr<RepoLock>>::Ok(std::make_unique<RecordingLock>(log, "lock"));
    }

    Result<std::unique_ptr<Transaction>> transaction(const std::string& name) override {
        return Result<std::unique_ptr<Transaction>>::Ok(
            std::make_unique<RecordingTransaction>(log, name));
    }

    BookmarkStore& bookmarks() override { return store; }
};

} // namespace

TEST(UpdateBookmarks, AcquiresInOrderAndReleasesInReverse) {
    MemoryRepository repo;
    auto r = update_bookmarks(repo, {{"main", std::string("abc123")}});
    ASSERT_TRUE(r.is_ok()) << r.error;

    EventLog expected = {
        "acquire wlock", "acquire lock", "open git_handler",
        "apply_changes", "write",
        "release committed", "release lock", "release wlock",
    };
    EXPECT_EQ(repo.log, expected);
    EXPECT_EQ(repo.store.committed.at("main"), "abc123");
}

TEST(UpdateBookmarks, PerEntryPathWithRecordChange) {
    MemoryRepository repo;
    repo.store.caps.apply_changes = false;
    repo.store.marks["old"] = "fff";
    repo.store.committed = repo.store.marks;

    auto r = update_bookmarks(repo, {{"new", std::string("111")}, {"old", std::nullopt}}, "pull");
    ASSERT_TRUE(r.is_ok()) << r.error;

    EventLog expected = {
        "acquire wlock", "acquire lock", "open pull",
        "set new", "remove old", "record_change", "write",
        "release committed", "release lock", "release wlock",
    };
    EXPECT_EQ(repo.log, expected);
    EXPECT_EQ(repo.store.committed.count("old"), 0u);
    EXPECT_EQ(repo.store.committed.at("new"), "111");
}

TEST(UpdateBookmarks, DirectWriteWithoutTransactionSupport) {
    MemoryRepository repo;
    repo.store.caps.apply_changes = false;
    repo.store.caps.record_change = false;

    auto r = update_bookmarks(repo, {{"main", std::string("abc")}});
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(repo.log[3], "set main");
    EXPECT_EQ(repo.log[4], "write");
    EXPECT_EQ(repo.log.back(), "release wlock");
}

TEST(UpdateBookmarks, FailedCommitAbortsAndReleases) {
    MemoryRepository repo;
    repo.store.fail_write = true;

    auto r = update_bookmarks(repo, {{"main", std::string("abc")}});
    ASSERT_TRUE(r.is_err());
    EXPECT_NE(r.error.find("disk full"), std::string::npos);

    EventLog tail(repo.log.end() - 3, repo.log.end());
    EventLog expected = {"release aborted", "release lock", "release wlock"};
    EXPECT_EQ(tail, expected);
    EXPECT_TRUE(repo.store.marks.empty());
}

TEST(UpdateBookmarks, BusyStoreLockReleasesWlock) {
    MemoryRepository repo;
    repo.lock_busy = true;

    auto r = update_bookmarks(repo, {{"main", std::string("abc")}});
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error, "lock busy");
    EventLog expected = {"acquire wlock", "release wlock"};
    EXPECT_EQ(repo.log, expected);
}

TEST(UpdateBookmarks, BusyWlockTouchesNothing) {
    MemoryRepository repo;
    repo.wlock_busy = true;
    EXPECT_TRUE(update_bookmarks(repo, {{"main", std::string("abc")}}).is_err());
    EXPECT_TRUE(repo.log.empty());
}

// ── Transaction ─────────────────────────────────────────────

TEST(Transaction, DestroyingOpenTransactionAborts) {
    bool aborted = false;
    {
        Transaction tr("t");
        tr.add_abort_handler([&]() { aborted = true; });
    }
    EXPECT_TRUE(aborted);
}

TEST(Transaction, CloseTwiceFails) {
    Transaction tr("t");
    EXPECT_TRUE(tr.close().is_ok());
    EXPECT_TRUE(tr.closed());
    EXPECT_TRUE(tr.close().is_err());
}

// ── FileRepository ──────────────────────────────────────────

class FileRepositoryTest : public ::testing::Test {
protected:
    fs::path root;

    void SetUp() override {
        root = fs::temp_directory_path() /
               ("gitbridge_repo_test_" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        fs::remove_all(root);
        fs::create_directories(root / ".hg" / "store");
    }

    void TearDown() override {
        fs::remove_all(root);
    }

    std::string read_bookmarks_file() {
        std::ifstream in(root / ".hg" / "bookmarks");
        std::stringstream buf;
        buf << in.rdbuf();
        return buf.str();
    }
};

TEST_F(FileRepositoryTest, OpenRequiresHgDir) {
    EXPECT_TRUE(FileRepository::open(root).is_ok());
    EXPECT_TRUE(FileRepository::open(root / "missing").is_err());
}

TEST_F(FileRepositoryTest, WritesSortedBookmarksFile) {
    FileRepository repo(root);
    auto r = update_bookmarks(repo, {
        {"zeta", std::string("2222222222222222222222222222222222222222")},
        {"alpha", std::string("1111111111111111111111111111111111111111")},
    });
    ASSERT_TRUE(r.is_ok()) << r.error;

    EXPECT_EQ(read_bookmarks_file(),
              "1111111111111111111111111111111111111111 alpha\n"
              "2222222222222222222222222222222222222222 zeta\n");
    EXPECT_FALSE(fs::exists(root / ".hg" / "bookmarks.pending"));
}

TEST_F(FileRepositoryTest, DeletesBookmark) {
    std::ofstream(root / ".hg" / "bookmarks") << "aaa keep\nbbb drop\n";

    FileRepository repo(root);
    ASSERT_TRUE(update_bookmarks(repo, {{"drop", std::nullopt}}).is_ok());

    auto marks = repo.read_bookmarks();
    ASSERT_TRUE(marks.is_ok());
    EXPECT_EQ(marks.value.size(), 1u);
    EXPECT_EQ(marks.value.get("keep").value_or(""), "aaa");
}

TEST_F(FileRepositoryTest, HeldWlockBlocksUpdate) {
    FileLock other((root / ".hg" / "wlock").string());
    ASSERT_TRUE(other.held());

    FileRepository repo(root);
    auto r = update_bookmarks(repo, {{"main", std::string("abc")}});
    ASSERT_TRUE(r.is_err());
    EXPECT_NE(r.error.find("locked"), std::string::npos);
    EXPECT_FALSE(fs::exists(root / ".hg" / "bookmarks"));
}

TEST_F(FileRepositoryTest, HeldStoreLockBlocksUpdate) {
    FileLock other((root / ".hg" / "store" / "lock").string());
    ASSERT_TRUE(other.held());

    FileRepository repo(root);
    EXPECT_TRUE(update_bookmarks(repo, {{"main", std::string("abc")}}).is_err());

    // wlock was released on the way out
    FileLock wlock((root / ".hg" / "wlock").string());
    EXPECT_TRUE(wlock.held());
}

TEST_F(FileRepositoryTest, LocksReleasedAfterUpdate) {
    FileRepository repo(root);
    ASSERT_TRUE(update_bookmarks(repo, {{"main", std::string("abc")}}).is_ok());

    FileLock wlock((root / ".hg" / "wlock").string());
    FileLock lock((root / ".hg" / "store" / "lock").string());
    EXPECT_TRUE(wlock.held());
    EXPECT_TRUE(lock.held());
}

TEST_F(FileRepositoryTest, CorruptBookmarksFileFails) {
    std::ofstream(root / ".hg" / "bookmarks") << "no-space-here\n";
    FileRepository repo(root);
    EXPECT_TRUE(update_bookmarks(repo, {{"main", std::string("abc")}}).is_err());
}

TEST_F(FileRepositoryTest, RejectsEntriesTheFileCannotHold) {
    std::ofstream(root / ".hg" / "bookmarks") << "aaa keep\n";
    FileRepository repo(root);

    auto r = update_bookmarks(repo, {{"main", std::string("abc def")}});
    ASSERT_TRUE(r.is_err());
    EXPECT_NE(r.error.find("invalid node"), std::string::npos);

    r = update_bookmarks(repo, {{"ok", std::string("abc")}, {"two\nlines", std::string("abc")}});
    ASSERT_TRUE(r.is_err());
    EXPECT_NE(r.error.find("invalid bookmark name"), std::string::npos);

    EXPECT_TRUE(update_bookmarks(repo, {{" padded", std::string("abc")}}).is_err());
    EXPECT_TRUE(update_bookmarks(repo, {{"", std::string("abc")}}).is_err());

    EXPECT_EQ(read_bookmarks_file(), "aaa keep\n");
    EXPECT_FALSE(fs::exists(root / ".hg" / "bookmarks.pending"));
}

TEST_F(FileRepositoryTest, StoreSetRejectsWhitespaceNode) {
    FileBookmarkStore store(root / ".hg" / "bookmarks");
    EXPECT_THROW(store.set("main", "a b"), std::invalid_argument);
    EXPECT_THROW(store.set("a\nb", "abc"), std::invalid_argument);
    store.set("main", "abc");
    EXPECT_EQ(store.marks().get("main").value_or(""), "abc");
}
