#pragma once

#include <atomic>
#include <memory>

namespace updsrv {

// Shared cancellation flag. Copies observe the same flag.
class CancelToken {
  public:
    CancelToken() : flag_(std::make_shared<std::atomic_bool>(false)) {}

    // Observe an externally owned flag (e.g. the signal flag) without owning it.
    static CancelToken FromFlag(std::atomic_bool& flag) {
        CancelToken t;
        t.flag_ = std::shared_ptr<std::atomic_bool>(&flag, [](std::atomic_bool*) {});
        return t;
    }

    void Cancel() { flag_->store(true, std::memory_order_relaxed); }
    bool IsCancelled() const { return flag_->load(std::memory_order_relaxed); }

  private:
    std::shared_ptr<std::atomic_bool> flag_;
};

} // namespace updsrv
