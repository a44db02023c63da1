#pragma once

#include <map>
#include <mutex>

#include "rag_core/storage/corpus_repository.hpp"

namespace rag_core {

// Process-local repository used by tests and throwaway runs. Nothing
// survives the instance.
class InMemoryCorpusRepository : public CorpusRepository {
 public:
  InMemoryCorpusRepository();

  void put_artifact(const std::string& key, const std::string& content) override;
  std::optional<std::string> get_artifact(const std::string& key) const override;
  std::vector<std::string> list_artifacts(const std::string& prefix) const override;
  size_t delete_artifacts(const std::string& prefix) override;

  void activate(const CorpusManifest& manifest) override;
  std::optional<CorpusManifest> active_manifest() const override;

  std::unique_ptr<PublishLock> acquire_publish_lock(const std::string& owner,
                                                    std::chrono::minutes stale_after) override;

  void record_run(const RunRecord& run) override;
  std::vector<RunRecord> recent_runs(size_t limit) const override;

  struct LockState {
    std::mutex mtx;
    std::optional<std::string> owner;
    std::chrono::steady_clock::time_point acquired_at;
  };

 private:
  mutable std::mutex mtx_;
  std::map<std::string, std::string> artifacts_;
  std::map<std::string, CorpusManifest> versions_;
  std::optional<std::string> active_version_;
  std::vector<RunRecord> runs_;
  // Shared with outstanding locks so they can release after the repository is gone
  std::shared_ptr<LockState> lock_state_;
};

}  // namespace rag_core
