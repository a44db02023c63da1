#pragma once

#include <iostream>

#include <sqlite_modern_cpp.h>

namespace rag_core {

// Rolls back on destruction unless commit() was called
class Transaction {
 public:
  explicit Transaction(sqlite::database& db, bool immediate = false)
      : db_(db), active_(true) {
    db_ << (immediate ? "BEGIN IMMEDIATE;" : "BEGIN;");
  }

  Transaction(const Transaction&) = delete;
  Transaction& operator=(const Transaction&) = delete;

  void commit() {
    if (active_) {
      db_ << "COMMIT;";
      active_ = false;
    }
  }

  ~Transaction() noexcept {
    if (active_) {
      try {
        db_ << "ROLLBACK;";
      } catch (const std::exception& e) {
        std::cerr << "[Transaction] Rollback failed: " << e.what() << std::endl;
      } catch (...) {
        std::cerr << "[Transaction] Rollback failed: unknown error" << std::endl;
      }
    }
  }

 private:
  sqlite::database& db_;
  bool active_;
};

}  // namespace rag_core
