#pragma once

#include <cstddef>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <vector>

#include "ha/core/records.h"

namespace ha::storage {
class KeyValueStore;
}

namespace ha::core {

// Tracks oracle requests between submission and callback. Register and
// Resolve are the serialization point for callback handling: an entry is
// inserted at most once and removed at most once.
class RequestLedger {
 public:
  RequestLedger() = default;
  // Entries are written through to |store| under "request_<id>".
  explicit RequestLedger(storage::KeyValueStore* store);

  RequestLedger(const RequestLedger&) = delete;
  RequestLedger& operator=(const RequestLedger&) = delete;

  // Throws ha::Error (Protocol, kDuplicateRequestId) when |request_id| is present.
  void Register(RequestId request_id, RecordId target_record_id, RecordKind kind);

  [[nodiscard]] std::optional<PendingRequest> Lookup(RequestId request_id) const;

  // Removes and returns the entry. Throws ha::Error (Protocol, kUnknownRequest)
  // when absent, including when it was already resolved.
  PendingRequest Resolve(RequestId request_id);

  // Drops an entry whose submission was rolled back.
  bool Cancel(RequestId request_id);

  [[nodiscard]] std::size_t Size() const;
  [[nodiscard]] std::vector<PendingRequest> Outstanding() const;

  // Rebuilds the in-memory map from the backing store. Returns entries loaded.
  std::size_t Load();

 private:
  void PersistLocked(const PendingRequest& request);
  void EraseLocked(RequestId request_id);

  mutable std::mutex mutex_;
  std::unordered_map<RequestId, PendingRequest> entries_;
  storage::KeyValueStore* store_{nullptr};
};

}  // namespace ha::core
