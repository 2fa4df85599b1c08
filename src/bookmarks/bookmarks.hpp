#pragma once

#include <string>
#include <vector>
#include <memory>
#include <optional>
#include <functional>
#include <core/types.hpp>
#include <core/constants.hpp>

// Set `name` to `node`, or delete the bookmark when node is empty.
struct BookmarkChange {
    std::string name;
    std::optional<std::string> node;
};

// Held lock; released on destruction.
class RepoLock {
public:
    virtual ~RepoLock() = default;
};

// A repository transaction. close() commits by running the finalizers in
// registration order; destroying an open transaction aborts it and runs the
// abort handlers in reverse order.
class Transaction {
public:
    explicit Transaction(std::string name) : name_(std::move(name)) {}
    virtual ~Transaction();

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    const std::string& name() const { return name_; }
    bool closed() const { return closed_; }
    bool aborted() const { return aborted_; }

    void add_finalizer(std::function<Result<void>()> fn);
    void add_abort_handler(std::function<void()> fn);

    Result<void> close();
    void abort();

private:
    std::string name_;
    bool closed_ = false;
    bool aborted_ = false;
    std::vector<std::function<Result<void>()>> finalizers_;
    std::vector<std::function<void()>> abort_handlers_;
};

// What a bookmark store can do inside a transaction.
struct BookmarkCapabilities {
    bool apply_changes = true;   // bulk apply registered with the transaction
    bool record_change = true;   // per-entry edits, then record_change(tr)
};

class BookmarkStore {
public:
    virtual ~BookmarkStore() = default;

    virtual BookmarkCapabilities capabilities() const = 0;

    virtual Result<void> apply_changes(Transaction& tr, const std::vector<BookmarkChange>& changes) = 0;

    virtual void set(const std::string& name, const std::string& node) = 0;
    virtual void remove(const std::string& name) = 0;
    virtual Result<void> record_change(Transaction& tr) = 0;
    // Immediate write, for stores without transaction support.
    virtual Result<void> write() = 0;
};

class Repository {
public:
    virtual ~Repository() = default;

    // Working-copy lock
    virtual Result<std::unique_ptr<RepoLock>> wlock() = 0;
    // Store lock
    virtual Result<std::unique_ptr<RepoLock>> lock() = 0;
    virtual Result<std::unique_ptr<Transaction>> transaction(const std::string& name) = 0;

    virtual BookmarkStore& bookmarks() = 0;
};

// Apply bookmark changes under wlock -> lock -> transaction. The transaction
// is committed before the locks go away; everything is released in reverse
// order on every exit path.
Result<void> update_bookmarks(Repository& repo,
                              const std::vector<BookmarkChange>& changes,
                              const std::string& name = DEFAULT_TRANSACTION_NAME);
