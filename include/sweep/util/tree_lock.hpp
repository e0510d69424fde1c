#pragma once

#include <sweep/core_types.hpp>

#include <condition_variable>
#include <cstdint>
#include <map>
#include <mutex>
#include <vector>

namespace sweep {

class TreeLockRegistry;

/**
 * RAII guard for a set of locked trees. Move-only.
 */
class TreeLock {
public:
    TreeLock() = default;
    TreeLock(TreeLock&& other) noexcept;
    TreeLock& operator=(TreeLock&& other) noexcept;
    ~TreeLock();

    TreeLock(const TreeLock&) = delete;
    TreeLock& operator=(const TreeLock&) = delete;

    bool held() const { return registry_ != nullptr; }
    void release();

private:
    friend class TreeLockRegistry;
    TreeLock(TreeLockRegistry* registry, uint64_t ticket)
        : registry_(registry), ticket_(ticket) {}

    TreeLockRegistry* registry_ = nullptr;
    uint64_t ticket_ = 0;
};

/**
 * TreeLockRegistry - Coarse mutual exclusion over filesystem trees.
 *
 * A lock on "/home/u/Library" conflicts with any lock on the same path, an
 * ancestor, or a descendant. acquire() blocks until none of the requested
 * trees overlaps a held tree, then takes all of them at once, so callers
 * can never deadlock on partial acquisition.
 */
class TreeLockRegistry {
public:
    TreeLockRegistry() = default;

    TreeLockRegistry(const TreeLockRegistry&) = delete;
    TreeLockRegistry& operator=(const TreeLockRegistry&) = delete;

    TreeLock acquire(const std::vector<fs::path>& trees);

    /**
     * Non-blocking variant. Returns an unheld lock on conflict.
     */
    TreeLock try_acquire(const std::vector<fs::path>& trees);

    size_t held_count() const;

private:
    friend class TreeLock;

    bool conflicts(const std::vector<fs::path>& trees) const;
    void release(uint64_t ticket);

    mutable std::mutex mutex_;
    std::condition_variable released_;
    std::map<uint64_t, std::vector<fs::path>> held_;
    uint64_t next_ticket_ = 1;
};

}  // namespace sweep
