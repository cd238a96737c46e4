#pragma once
#include <atomic>
#include <memory>

namespace gitwatch {

// Shared stop flag. Copies observe the same flag; cancel() is async-signal-safe
// because it is a single lock-free atomic store.
class CancellationToken {
public:
  CancellationToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

  void cancel() const { flag_->store(true); }
  [[nodiscard]] bool cancelled() const { return flag_->load(); }

  // Raw flag, for handlers that cannot touch a shared_ptr.
  [[nodiscard]] std::atomic<bool> *flag() const { return flag_.get(); }

private:
  std::shared_ptr<std::atomic<bool>> flag_;
};

} // namespace gitwatch
