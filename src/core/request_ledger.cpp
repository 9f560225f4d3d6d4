#include "ha/core/request_ledger.h"

#include <algorithm>
#include <string>

#include "ha/core/record_codec.h"
#include "ha/error.h"
#include "ha/errors.h"
#include "ha/storage/kv_store.h"

namespace ha::core {

RequestLedger::RequestLedger(storage::KeyValueStore* store) : store_(store) {}

void RequestLedger::Register(RequestId request_id, RecordId target_record_id, RecordKind kind) {
  std::lock_guard<std::mutex> lock(mutex_);
  PendingRequest request{request_id, target_record_id, kind};
  auto [it, inserted] = entries_.emplace(request_id, request);
  if (!inserted) {
    ThrowAuditError(ErrorDomain::Protocol, errors::audit::kDuplicateRequestId,
                    errors::msg::kDuplicateRequestId, std::to_string(request_id));
  }
  try {
    PersistLocked(request);
  } catch (const Error&) {
    entries_.erase(it);
    throw;
  }
}

std::optional<PendingRequest> RequestLedger::Lookup(RequestId request_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = entries_.find(request_id);
  if (it == entries_.end()) {
    return std::nullopt;
  }
  return it->second;
}

PendingRequest RequestLedger::Resolve(RequestId request_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = entries_.find(request_id);
  if (it == entries_.end()) {
    ThrowAuditError(ErrorDomain::Protocol, errors::audit::kUnknownRequest,
                    errors::msg::kUnknownRequest, std::to_string(request_id));
  }
  PendingRequest request = it->second;
  EraseLocked(request_id);
  entries_.erase(it);
  return request;
}

bool RequestLedger::Cancel(RequestId request_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = entries_.find(request_id);
  if (it == entries_.end()) {
    return false;
  }
  EraseLocked(request_id);
  entries_.erase(it);
  return true;
}

std::size_t RequestLedger::Size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_.size();
}

std::vector<PendingRequest> RequestLedger::Outstanding() const {
  std::vector<PendingRequest> result;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    result.reserve(entries_.size());
    for (const auto& [id, request] : entries_) {
      result.push_back(request);
    }
  }
  std::sort(result.begin(), result.end(),
            [](const PendingRequest& a, const PendingRequest& b) { return a.request_id < b.request_id; });
  return result;
}

std::size_t RequestLedger::Load() {
  if (!store_) {
    return 0;
  }
  std::unordered_map<RequestId, PendingRequest> loaded;
  for (const auto& key : store_->Keys(codec::kRequestKeyPrefix)) {
    auto bytes = store_->Get(key);
    if (!bytes) {
      continue;
    }
    auto request = codec::DecodePendingRequest(*bytes);
    if (key != codec::RequestKey(request.request_id)) {
      ThrowAuditError(ErrorDomain::IO, errors::io::kCorruptRecord, errors::msg::kCorruptRecord, key);
    }
    loaded.emplace(request.request_id, request);
  }
  std::lock_guard<std::mutex> lock(mutex_);
  entries_ = std::move(loaded);
  return entries_.size();
}

void RequestLedger::PersistLocked(const PendingRequest& request) {
  if (!store_) {
    return;
  }
  auto bytes = codec::EncodePendingRequest(request);
  store_->Put(codec::RequestKey(request.request_id), bytes);
}

void RequestLedger::EraseLocked(RequestId request_id) {
  if (!store_) {
    return;
  }
  store_->Erase(codec::RequestKey(request_id));
}

}  // namespace ha::core
