#include "rag_core/storage/in_memory_corpus_repository.hpp"

#include "rag_core/errors.hpp"

namespace rag_core {

namespace {

class InMemoryPublishLock : public PublishLock {
 public:
  InMemoryPublishLock(std::shared_ptr<InMemoryCorpusRepository::LockState> state, std::string owner)
      : state_(std::move(state)), owner_(std::move(owner)) {}

  ~InMemoryPublishLock() override {
    std::lock_guard<std::mutex> lock(state_->mtx);
    if (state_->owner && *state_->owner == owner_) {
      state_->owner.reset();
    }
  }

  const std::string& owner() const override {
    return owner_;
  }

 private:
  std::shared_ptr<InMemoryCorpusRepository::LockState> state_;
  std::string owner_;
};

}  // namespace

InMemoryCorpusRepository::InMemoryCorpusRepository()
    : lock_state_(std::make_shared<LockState>()) {}

void InMemoryCorpusRepository::put_artifact(const std::string& key, const std::string& content) {
  std::lock_guard<std::mutex> lock(mtx_);
  if (!artifacts_.emplace(key, content).second) {
    throw IndexPublishError("Artifact already exists: " + key);
  }
}

std::optional<std::string> InMemoryCorpusRepository::get_artifact(const std::string& key) const {
  std::lock_guard<std::mutex> lock(mtx_);
  auto it = artifacts_.find(key);
  if (it == artifacts_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<std::string> InMemoryCorpusRepository::list_artifacts(const std::string& prefix) const {
  std::lock_guard<std::mutex> lock(mtx_);
  std::vector<std::string> keys;
  for (auto it = artifacts_.lower_bound(prefix);
       it != artifacts_.end() && it->first.compare(0, prefix.size(), prefix) == 0; ++it) {
    keys.push_back(it->first);
  }
  return keys;
}

size_t InMemoryCorpusRepository::delete_artifacts(const std::string& prefix) {
  std::lock_guard<std::mutex> lock(mtx_);
  auto first = artifacts_.lower_bound(prefix);
  auto last = first;
  size_t removed = 0;
  while (last != artifacts_.end() && last->first.compare(0, prefix.size(), prefix) == 0) {
    ++last;
    ++removed;
  }
  artifacts_.erase(first, last);
  return removed;
}

void InMemoryCorpusRepository::activate(const CorpusManifest& manifest) {
  std::lock_guard<std::mutex> lock(mtx_);
  if (versions_.count(manifest.version) > 0) {
    throw IndexPublishError("Corpus version already exists: " + manifest.version);
  }
  if (artifacts_.count(manifest.chunk_map) == 0) {
    throw IndexPublishError("Chunk-detail map missing for version " + manifest.version + ": " +
                            manifest.chunk_map);
  }
  for (const auto& shard : manifest.payload_shards) {
    if (artifacts_.count(shard) == 0) {
      throw IndexPublishError("Payload shard missing for version " + manifest.version + ": " +
                              shard);
    }
  }
  versions_.emplace(manifest.version, manifest);
  active_version_ = manifest.version;
}

std::optional<CorpusManifest> InMemoryCorpusRepository::active_manifest() const {
  std::lock_guard<std::mutex> lock(mtx_);
  if (!active_version_) {
    return std::nullopt;
  }
  return versions_.at(*active_version_);
}

std::unique_ptr<PublishLock> InMemoryCorpusRepository::acquire_publish_lock(
    const std::string& owner, std::chrono::minutes stale_after) {
  std::lock_guard<std::mutex> lock(lock_state_->mtx);
  const auto now = std::chrono::steady_clock::now();
  if (lock_state_->owner && now - lock_state_->acquired_at < stale_after) {
    throw IndexPublishError("Publish lock is held by " + *lock_state_->owner);
  }
  lock_state_->owner = owner;
  lock_state_->acquired_at = now;
  return std::make_unique<InMemoryPublishLock>(lock_state_, owner);
}

void InMemoryCorpusRepository::record_run(const RunRecord& run) {
  std::lock_guard<std::mutex> lock(mtx_);
  runs_.push_back(run);
}

std::vector<RunRecord> InMemoryCorpusRepository::recent_runs(size_t limit) const {
  std::lock_guard<std::mutex> lock(mtx_);
  std::vector<RunRecord> result;
  for (auto it = runs_.rbegin(); it != runs_.rend() && result.size() < limit; ++it) {
    result.push_back(*it);
  }
  return result;
}

}  // namespace rag_core
