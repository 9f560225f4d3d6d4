#include "ha/oracle/local_engine.h"

#include <algorithm>
#include <iterator>
#include <string>
#include <utility>

#include "ha/common.h"
#include "ha/core/record_codec.h"
#include "ha/crypto/hkdf.h"
#include "ha/crypto/random.h"
#include "ha/error.h"
#include "ha/errors.h"
#include "ha/oracle/payload.h"
#include "ha/security/zeroizer.h"
#include "ha/storage/kv_store.h"
#include "ha/tlv/parser.h"
#include "ha/tlv/writer.h"

namespace ha::oracle {

namespace {

constexpr std::string_view kKeySalt{"ha-local-engine-v1"};
constexpr std::string_view kSealInfo{"seal"};
constexpr std::string_view kOracleInfo{"oracle-proof"};

constexpr std::string_view kValueKeyPrefix{"ct_"};
constexpr std::string_view kJobKeyPrefix{"engine_job_"};
constexpr std::string_view kRequestCounterKey{"engine_next_request"};

constexpr uint16_t kValueTypeTag = 0x01;
constexpr uint16_t kNonceTag = 0x02;
constexpr uint16_t kCiphertextTag = 0x03;
constexpr uint16_t kAuthTagTag = 0x04;

constexpr uint16_t kJobRequestTag = 0x01;
constexpr uint16_t kJobHandleTag = 0x02;

std::string ValueKey(const core::EncryptedValueHandle& handle) {
  return std::string(kValueKeyPrefix) + handle.ToHex();
}

std::string JobKey(core::RequestId request_id) {
  return std::string(kJobKeyPrefix) + std::to_string(request_id);
}

[[noreturn]] void CorruptEngineState(std::string_view key) {
  ThrowAuditError(ErrorDomain::IO, errors::io::kCorruptRecord, errors::msg::kCorruptRecord, key);
}

template <std::size_t N>
bool CopyFixed(std::span<const uint8_t> value, std::array<uint8_t, N>& out) {
  if (value.size() != N) {
    return false;
  }
  std::copy(value.begin(), value.end(), out.begin());
  return true;
}

std::vector<uint8_t> BuildAad(const core::EncryptedValueHandle& handle, uint8_t type) {
  std::vector<uint8_t> aad(handle.bytes().begin(), handle.bytes().end());
  aad.push_back(type);
  return aad;
}

}  // namespace

LocalEngine::LocalEngine(const MasterSecret& master_secret, storage::KeyValueStore* store)
    : store_(store) {
  const std::span<const uint8_t> ikm(master_secret.data(), master_secret.size());
  seal_key_ = crypto::HkdfSha256(ikm, ha::AsBytesConst(kKeySalt), ha::AsBytesConst(kSealInfo));
  oracle_key_ = crypto::HkdfSha256(ikm, ha::AsBytesConst(kKeySalt), ha::AsBytesConst(kOracleInfo));
}

LocalEngine::~LocalEngine() {
  security::Zeroizer::Wipe(seal_key_);
  security::Zeroizer::Wipe(oracle_key_);
}

core::EncryptedValueHandle LocalEngine::Encrypt(std::string_view hash_text) {
  if (!IsValidHashText(hash_text)) {
    ThrowAuditError(ErrorDomain::Validation, errors::audit::kMalformedPayload, errors::msg::kInvalidHashText);
  }
  std::lock_guard<std::mutex> lock(mutex_);
  return SealLocked(ValueType::kText, ha::AsBytesConst(hash_text));
}

core::EncryptedValueHandle LocalEngine::EncryptBoolean(bool value) {
  const uint8_t byte = value ? 1 : 0;
  std::lock_guard<std::mutex> lock(mutex_);
  return SealLocked(ValueType::kBoolean, std::span<const uint8_t>(&byte, 1));
}

core::EncryptedValueHandle LocalEngine::Equal(const core::EncryptedValueHandle& lhs,
                                              const core::EncryptedValueHandle& rhs) {
  std::lock_guard<std::mutex> lock(mutex_);
  ValueType lhs_type{};
  ValueType rhs_type{};
  const auto lhs_plain = OpenLocked(lhs, lhs_type);
  const auto rhs_plain = OpenLocked(rhs, rhs_type);
  if (lhs_type != rhs_type) {
    ThrowAuditError(ErrorDomain::Validation, errors::audit::kUnknownHandle, errors::msg::kMixedValueTypes);
  }
  const uint8_t equal = lhs_plain == rhs_plain ? 1 : 0;
  return SealLocked(ValueType::kBoolean, std::span<const uint8_t>(&equal, 1));
}

core::RequestId LocalEngine::RequestDecryption(std::span<const core::EncryptedValueHandle> handles) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!available_) {
    ThrowAuditError(ErrorDomain::Dependency, errors::audit::kEngineUnavailable, errors::msg::kEngineUnavailable);
  }
  if (fail_next_submission_) {
    fail_next_submission_ = false;
    ThrowAuditError(ErrorDomain::Dependency, errors::audit::kEngineUnavailable,
                    errors::msg::kEngineSubmissionFailed);
  }
  if (handles.empty()) {
    ThrowAuditError(ErrorDomain::Validation, errors::audit::kUnknownHandle, errors::msg::kEmptyHandleList);
  }
  for (const auto& handle : handles) {
    FindLocked(handle);
  }
  Job job;
  job.request_id = next_request_id_;
  job.handles.assign(handles.begin(), handles.end());
  PersistJobLocked(job);
  ++next_request_id_;
  const core::RequestId request_id = job.request_id;
  jobs_.push_back(std::move(job));
  return request_id;
}

bool LocalEngine::IsAvailable() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return available_;
}

std::vector<OracleCallback> LocalEngine::BuildCallbacksLocked() {
  std::vector<OracleCallback> callbacks;
  callbacks.reserve(jobs_.size());
  for (auto it = jobs_.begin(); it != jobs_.end();) {
    OracleCallback callback;
    callback.request_id = it->request_id;
    try {
      for (const auto& handle : it->handles) {
        ValueType type{};
        const auto plaintext = OpenLocked(handle, type);
        if (type == ValueType::kText) {
          AppendHashPayload(callback.payload,
                            std::string_view(reinterpret_cast<const char*>(plaintext.data()), plaintext.size()));
        } else {
          AppendBooleanPayload(callback.payload, !plaintext.empty() && plaintext[0] == 1);
        }
      }
    } catch (const Error& error) {
      if (error.domain != ErrorDomain::Crypto && error.code != errors::audit::kUnknownHandle) {
        throw;
      }
      failed_jobs_.push_back(FailedJob{it->request_id, error.what()});
      if (store_) {
        store_->Erase(JobKey(it->request_id));
      }
      it = jobs_.erase(it);
      continue;
    }
    const auto proof = ComputeOracleProof(std::span<const uint8_t>(oracle_key_.data(), oracle_key_.size()),
                                          callback.request_id, callback.payload);
    callback.proof.assign(proof.begin(), proof.end());
    callbacks.push_back(std::move(callback));
    ++it;
  }
  return callbacks;
}

void LocalEngine::CompleteJobLocked(core::RequestId request_id) {
  auto it = std::find_if(jobs_.begin(), jobs_.end(), [request_id](const Job& job) {
    return job.request_id == request_id;
  });
  if (it == jobs_.end()) {
    return;
  }
  if (store_) {
    store_->Erase(JobKey(request_id));
  }
  jobs_.erase(it);
}

std::vector<OracleCallback> LocalEngine::TakePendingCallbacks() {
  std::lock_guard<std::mutex> lock(mutex_);
  auto callbacks = BuildCallbacksLocked();
  for (const auto& callback : callbacks) {
    CompleteJobLocked(callback.request_id);
  }
  return callbacks;
}

std::size_t LocalEngine::DeliverPending(const CallbackSink& sink) {
  std::vector<OracleCallback> callbacks;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    callbacks = BuildCallbacksLocked();
  }
  std::size_t delivered = 0;
  for (const auto& callback : callbacks) {
    sink(callback);
    std::lock_guard<std::mutex> lock(mutex_);
    CompleteJobLocked(callback.request_id);
    ++delivered;
  }
  return delivered;
}

std::vector<LocalEngine::FailedJob> LocalEngine::TakeFailedJobs() {
  std::lock_guard<std::mutex> lock(mutex_);
  return std::exchange(failed_jobs_, {});
}

std::size_t LocalEngine::PendingCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return jobs_.size();
}

void LocalEngine::FailNextSubmission() {
  std::lock_guard<std::mutex> lock(mutex_);
  fail_next_submission_ = true;
}

void LocalEngine::SetAvailable(bool available) {
  std::lock_guard<std::mutex> lock(mutex_);
  available_ = available;
}

std::size_t LocalEngine::Load() {
  if (!store_) {
    return 0;
  }
  std::map<core::EncryptedValueHandle, SealedValue> values;
  for (const auto& key : store_->Keys(kValueKeyPrefix)) {
    auto bytes = store_->Get(key);
    if (!bytes) {
      continue;
    }
    auto handle = core::EncryptedValueHandle::TryFromHex(std::string_view(key).substr(kValueKeyPrefix.size()));
    tlv::Parser parser(*bytes);
    if (!handle || !parser.valid() || parser.Count(kValueTypeTag) != 1 || parser.Count(kNonceTag) != 1 ||
        parser.Count(kCiphertextTag) != 1 || parser.Count(kAuthTagTag) != 1) {
      CorruptEngineState(key);
    }
    SealedValue value;
    uint8_t type = 0;
    if (!tlv::ReadU8(parser.Find(kValueTypeTag)->value, type) ||
        (type != static_cast<uint8_t>(ValueType::kText) && type != static_cast<uint8_t>(ValueType::kBoolean)) ||
        !CopyFixed(parser.Find(kNonceTag)->value, value.nonce) ||
        !CopyFixed(parser.Find(kAuthTagTag)->value, value.tag)) {
      CorruptEngineState(key);
    }
    value.type = static_cast<ValueType>(type);
    const auto ciphertext = parser.Find(kCiphertextTag)->value;
    value.ciphertext.assign(ciphertext.begin(), ciphertext.end());
    values.emplace(*handle, std::move(value));
  }

  std::vector<Job> jobs;
  for (const auto& key : store_->Keys(kJobKeyPrefix)) {
    auto bytes = store_->Get(key);
    if (!bytes) {
      continue;
    }
    tlv::Parser parser(*bytes);
    Job job;
    if (!parser.valid() || parser.Count(kJobRequestTag) != 1 ||
        !tlv::ReadU64(parser.Find(kJobRequestTag)->value, job.request_id) || key != JobKey(job.request_id)) {
      CorruptEngineState(key);
    }
    for (const auto& record : parser) {
      if (record.type != kJobHandleTag) {
        continue;
      }
      core::EncryptedValueHandle::Bytes handle_bytes{};
      if (!CopyFixed(record.value, handle_bytes)) {
        CorruptEngineState(key);
      }
      job.handles.emplace_back(handle_bytes);
    }
    if (job.handles.empty()) {
      CorruptEngineState(key);
    }
    jobs.push_back(std::move(job));
  }
  std::sort(jobs.begin(), jobs.end(), [](const Job& a, const Job& b) { return a.request_id < b.request_id; });

  core::RequestId next_request = jobs.empty() ? 1 : jobs.back().request_id + 1;
  if (auto counter = store_->Get(kRequestCounterKey)) {
    next_request = std::max(next_request, core::codec::DecodeCounter(*counter));
  }

  std::lock_guard<std::mutex> lock(mutex_);
  values_ = std::move(values);
  jobs_.assign(std::make_move_iterator(jobs.begin()), std::make_move_iterator(jobs.end()));
  next_request_id_ = next_request;
  return values_.size();
}

core::EncryptedValueHandle LocalEngine::SealLocked(ValueType type, std::span<const uint8_t> plaintext) {
  core::EncryptedValueHandle::Bytes handle_bytes{};
  core::EncryptedValueHandle handle;
  do {
    crypto::SystemRandomBytes(std::span<uint8_t>(handle_bytes.data(), handle_bytes.size()));
    handle = core::EncryptedValueHandle(handle_bytes);
  } while (handle.empty() || values_.find(handle) != values_.end());

  SealedValue value;
  value.type = type;
  crypto::SystemRandomBytes(std::span<uint8_t>(value.nonce.data(), value.nonce.size()));
  const auto aad = BuildAad(handle, static_cast<uint8_t>(type));
  auto sealed = crypto::GcmSeal(seal_key_, value.nonce, std::span<const uint8_t>(aad.data(), aad.size()),
                                plaintext);
  value.ciphertext = std::move(sealed.ciphertext);
  value.tag = sealed.tag;
  PersistValueLocked(handle, value);
  values_.emplace(handle, std::move(value));
  return handle;
}

std::vector<uint8_t> LocalEngine::OpenLocked(const core::EncryptedValueHandle& handle, ValueType& type) const {
  const auto& value = FindLocked(handle);
  const auto aad = BuildAad(handle, static_cast<uint8_t>(value.type));
  try {
    auto plaintext = crypto::GcmOpen(seal_key_, value.nonce, std::span<const uint8_t>(aad.data(), aad.size()),
                                     std::span<const uint8_t>(value.ciphertext.data(), value.ciphertext.size()),
                                     value.tag);
    type = value.type;
    return plaintext;
  } catch (const AuthenticationFailureError& error) {
    ThrowAuditError(ErrorDomain::Crypto, errors::io::kCorruptRecord, errors::msg::kCorruptRecord, error.what());
  }
}

const LocalEngine::SealedValue& LocalEngine::FindLocked(const core::EncryptedValueHandle& handle) const {
  auto it = values_.find(handle);
  if (it == values_.end()) {
    ThrowAuditError(ErrorDomain::Validation, errors::audit::kUnknownHandle, errors::msg::kUnknownHandle,
                    handle.ToHex());
  }
  return it->second;
}

void LocalEngine::PersistValueLocked(const core::EncryptedValueHandle& handle, const SealedValue& value) {
  if (!store_) {
    return;
  }
  tlv::Writer writer;
  writer.AppendU8(kValueTypeTag, static_cast<uint8_t>(value.type))
      .Append(kNonceTag, std::span<const uint8_t>(value.nonce.data(), value.nonce.size()))
      .Append(kCiphertextTag, std::span<const uint8_t>(value.ciphertext.data(), value.ciphertext.size()))
      .Append(kAuthTagTag, std::span<const uint8_t>(value.tag.data(), value.tag.size()));
  store_->Put(ValueKey(handle), writer.bytes());
}

void LocalEngine::PersistJobLocked(const Job& job) {
  if (!store_) {
    return;
  }
  tlv::Writer writer;
  writer.AppendU64(kJobRequestTag, job.request_id);
  for (const auto& handle : job.handles) {
    writer.Append(kJobHandleTag, handle.AsSpan());
  }
  store_->Put(JobKey(job.request_id), writer.bytes());
  const auto counter = core::codec::EncodeCounter(job.request_id + 1);
  store_->Put(kRequestCounterKey, counter);
}

}  // namespace ha::oracle
