#include "bookmarks.hpp"
#include <core/log.hpp>
#include <fmt/format.h>

Transaction::~Transaction() {
    if (!closed_ && !aborted_) {
        abort();
    }
}

void Transaction::add_finalizer(std::function<Result<void>()> fn) {
    finalizers_.push_back(std::move(fn));
}

void Transaction::add_abort_handler(std::function<void()> fn) {
    abort_handlers_.push_back(std::move(fn));
}

Result<void> Transaction::close() {
    if (closed_ || aborted_) {
        return Result<void>::Err(fmt::format("transaction {} is no longer open", name_));
    }

    for (auto& fn : finalizers_) {
        auto result = fn();
        if (result.is_err()) {
            abort();
            return Result<void>::Err(fmt::format("transaction {} aborted: {}", name_, result.error));
        }
    }
    closed_ = true;
    bridge_log(fmt::format("transaction {} closed", name_));
    return Result<void>::Ok();
}

void Transaction::abort() {
    if (closed_ || aborted_) return;
    aborted_ = true;
    for (auto it = abort_handlers_.rbegin(); it != abort_handlers_.rend(); ++it) {
        (*it)();
    }
    bridge_log(fmt::format("transaction {} aborted", name_));
}

static Result<void> apply_to_store(BookmarkStore& bms, Transaction& tr,
                                   const std::vector<BookmarkChange>& changes) {
    auto caps = bms.capabilities();
    if (caps.apply_changes) {
        return bms.apply_changes(tr, changes);
    }

    for (const auto& change : changes) {
        if (change.node) {
            bms.set(change.name, *change.node);
        } else {
            bms.remove(change.name);
        }
    }
    if (caps.record_change) {
        return bms.record_change(tr);
    }
    return bms.write();
}

Result<void> update_bookmarks(Repository& repo,
                              const std::vector<BookmarkChange>& changes,
                              const std::string& name) {
    auto wlock = repo.wlock();
    if (wlock.is_err()) return Result<void>::Err(wlock.error);

    auto lock = repo.lock();
    if (lock.is_err()) return Result<void>::Err(lock.error);

    auto tr = repo.transaction(name);
    if (tr.is_err()) return Result<void>::Err(tr.error);

    auto applied = apply_to_store(repo.bookmarks(), *tr.value, changes);
    if (applied.is_err()) return applied;

    auto closed = tr.value->close();
    if (closed.is_err()) return closed;

    bridge_log(fmt::format("updated {} bookmark(s) in transaction {}", changes.size(), name));
    return Result<void>::Ok();
}
