#pragma once

#include <atomic>
#include <memory>

namespace rag_core::async {

// Copies share one flag, so a caller can keep a token and cancel work it has
// handed off.
class CancellationToken {
 public:
  CancellationToken() : cancelled_(std::make_shared<std::atomic<bool>>(false)) {}

  void cancel() const {
    cancelled_->store(true);
  }
  bool is_cancelled() const {
    return cancelled_->load();
  }

 private:
  std::shared_ptr<std::atomic<bool>> cancelled_;
};

}  // namespace rag_core::async
