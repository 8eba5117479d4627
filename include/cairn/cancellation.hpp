#pragma once

#include <atomic>
#include <memory>

namespace cairn {

// Copies share one flag; cancel() on any copy is seen by all of them.
// Bulk operations poll it between items, never in the middle of one.
class CancellationToken {
public:
    CancellationToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

    void cancel() { flag_->store(true, std::memory_order_release); }
    bool isCancelled() const { return flag_->load(std::memory_order_acquire); }

private:
    std::shared_ptr<std::atomic<bool>> flag_;
};

} // namespace cairn
