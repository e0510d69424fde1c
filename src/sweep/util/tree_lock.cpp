#include <sweep/util/tree_lock.hpp>
#include <sweep/util/path_utils.hpp>

namespace sweep {

TreeLock::TreeLock(TreeLock&& other) noexcept
    : registry_(other.registry_)
    , ticket_(other.ticket_)
{
    other.registry_ = nullptr;
    other.ticket_ = 0;
}

TreeLock& TreeLock::operator=(TreeLock&& other) noexcept {
    if (this != &other) {
        release();
        registry_ = other.registry_;
        ticket_ = other.ticket_;
        other.registry_ = nullptr;
        other.ticket_ = 0;
    }
    return *this;
}

TreeLock::~TreeLock() {
    release();
}

void TreeLock::release() {
    if (registry_) {
        registry_->release(ticket_);
        registry_ = nullptr;
        ticket_ = 0;
    }
}

bool TreeLockRegistry::conflicts(const std::vector<fs::path>& trees) const {
    for (const auto& [ticket, held] : held_) {
        for (const auto& h : held) {
            for (const auto& t : trees) {
                if (paths_overlap(h, t)) {
                    return true;
                }
            }
        }
    }
    return false;
}

TreeLock TreeLockRegistry::acquire(const std::vector<fs::path>& trees) {
    std::unique_lock<std::mutex> lock(mutex_);
    released_.wait(lock, [&] { return !conflicts(trees); });

    uint64_t ticket = next_ticket_++;
    held_.emplace(ticket, trees);
    return TreeLock(this, ticket);
}

TreeLock TreeLockRegistry::try_acquire(const std::vector<fs::path>& trees) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (conflicts(trees)) {
        return TreeLock();
    }
    uint64_t ticket = next_ticket_++;
    held_.emplace(ticket, trees);
    return TreeLock(this, ticket);
}

size_t TreeLockRegistry::held_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return held_.size();
}

void TreeLockRegistry::release(uint64_t ticket) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        held_.erase(ticket);
    }
    released_.notify_all();
}

}  // namespace sweep
