#include "ha/storage/io_util.h"

#include "ha/common.h"
#include "ha/crypto/random.h"

#include <array>
#include <cerrno>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <span>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>
#include <thread>
#include <type_traits>
#include <vector>

#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

namespace ha::storage {
namespace {

constexpr const char* kAtomicReplaceErrorMessage = "Atomic file replace failed";

class ErrorContext { // accumulate nested call context
 public:
  void Push(std::string context) { context_stack_.push_back(std::move(context)); }
  void Pop() {
    if (!context_stack_.empty()) {
      context_stack_.pop_back();
    }
  }
  [[nodiscard]] std::vector<std::string> Stack() const { return context_stack_; }
  [[nodiscard]] std::string Format(std::string_view message) const {
    std::ostringstream oss;
    oss << message;
    for (auto it = context_stack_.rbegin(); it != context_stack_.rend(); ++it) {
      oss << "\n  while: " << *it;
    }
    return oss.str();
  }

 private:
  std::vector<std::string> context_stack_;
};

class ScopedErrorContext {
 public:
  ScopedErrorContext(ErrorContext& ctx, std::string description) : ctx_(ctx) {
    ctx_.Push(std::move(description));
  }
  ScopedErrorContext(const ScopedErrorContext&) = delete;
  ScopedErrorContext& operator=(const ScopedErrorContext&) = delete;
  ~ScopedErrorContext() { ctx_.Pop(); }

 private:
  ErrorContext& ctx_;
};

ha::Retryability ClassifyNativeError(int native) {
  switch (native) {
#if defined(EINTR)
    case EINTR:
#endif
#if defined(EAGAIN)
    case EAGAIN:
#endif
      return ha::Retryability::kRetryable;
#if defined(EBUSY)
    case EBUSY:
      return ha::Retryability::kTransient;
#endif
#if defined(ETIMEDOUT)
    case ETIMEDOUT:
      return ha::Retryability::kTransient;
#endif
    default:
      break;
  }
  return ha::Retryability::kFatal;
}

std::vector<std::string> MergeContext(const std::vector<std::string>& existing,
                                      const ErrorContext& ctx) {
  auto merged = existing;
  auto stack = ctx.Stack();
  merged.insert(merged.end(), stack.begin(), stack.end());
  return merged;
}

[[noreturn]] void ThrowIoError(const ErrorContext& ctx, int code, std::string message,
                               std::optional<int> native = std::nullopt,
                               ha::Retryability retry = ha::Retryability::kFatal) {
  auto stack = ctx.Stack();
  std::optional<int> native_value = native;
  if (!native_value.has_value() && code != 0) {
    native_value = code;
  }
  throw Error{ErrorDomain::IO, code, ctx.Format(std::move(message)), native_value, retry, std::move(stack)};
}

Error AugmentError(const Error& err, const ErrorContext& ctx) {
  return Error{err.domain,
               err.code,
               ctx.Format(err.what()),
               err.native_code,
               err.retryability,
               MergeContext(err.context, ctx)};
}

[[noreturn]] void RethrowSystemError(const std::system_error& sys_err, const ErrorContext& ctx) {
  auto stack = ctx.Stack();
  throw Error{ErrorDomain::IO,
              sys_err.code().value(),
              ctx.Format(sys_err.what()),
              sys_err.code().value(),
              ClassifyNativeError(sys_err.code().value()),
              std::move(stack)};
}

template <typename Func>
auto WithContext(ErrorContext& ctx, std::string description, Func&& fn)
    -> std::invoke_result_t<Func&> {
  ScopedErrorContext scoped(ctx, std::move(description));
  try {
    if constexpr (std::is_void_v<std::invoke_result_t<Func&>>) {
      fn();
      return;
    } else {
      return fn();
    }
  } catch (const Error& err) {
    if (err.context.empty()) {
      throw AugmentError(err, ctx);
    }
    throw;
  } catch (const std::system_error& sys_err) {
    RethrowSystemError(sys_err, ctx);
  }
}

void SyncDirectory(const std::filesystem::path& dir) {
  int dir_fd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY);
  if (dir_fd < 0) {
    const int saved_errno = errno;
    throw Error{ErrorDomain::IO,
                saved_errno,
                std::string(kAtomicReplaceErrorMessage) + ": open directory failed",
                saved_errno,
                ClassifyNativeError(saved_errno)};
  }
  if (::fsync(dir_fd) != 0) {
    const int err = errno;
    ::close(dir_fd);
    throw Error{ErrorDomain::IO,
                err,
                std::string(kAtomicReplaceErrorMessage) + ": directory flush failed",
                err,
                ClassifyNativeError(err)};
  }
  ::close(dir_fd);
}

bool IsTransientFsyncError(int err) {
  return err == EINTR || err == EAGAIN || err == EBUSY;
}

void SyncFileWithRetry(int fd, ErrorContext& ctx) {
  constexpr int kMaxRetries = 4;
  std::chrono::milliseconds backoff{5};
  for (int attempt = 0;; ++attempt) {
    if (::fsync(fd) == 0) {
      return;
    }
    const int saved_errno = errno;
    if (saved_errno == EINTR) {
      continue;
    }
    if (attempt >= kMaxRetries || !IsTransientFsyncError(saved_errno)) {
      ThrowIoError(ctx,
                   saved_errno,
                   std::string(kAtomicReplaceErrorMessage) + ": fsync failed",
                   saved_errno,
                   ClassifyNativeError(saved_errno));
    }
    std::this_thread::sleep_for(backoff);
    backoff *= 2;
  }
}

void WriteAll(int fd, std::span<const uint8_t> payload, ErrorContext& ctx) {
  size_t written = 0;
  while (written < payload.size()) {
    auto chunk = ::write(fd, payload.data() + written, payload.size() - written);
    if (chunk < 0) {
      const int saved_errno = errno;
      if (saved_errno == EINTR) {
        continue;
      }
      ThrowIoError(ctx,
                   saved_errno,
                   std::string(kAtomicReplaceErrorMessage) + ": write failed",
                   saved_errno,
                   ClassifyNativeError(saved_errno));
    }
    if (chunk == 0) {
      ThrowIoError(ctx, 0, std::string(kAtomicReplaceErrorMessage) + ": short write", 0,
                   ha::Retryability::kFatal);
    }
    written += static_cast<size_t>(chunk);
  }
}

class TempFileGuard { // ensure cleanup on failure
 public:
  explicit TempFileGuard(std::filesystem::path path) noexcept : path_(std::move(path)) {}
  TempFileGuard(const TempFileGuard&) = delete;
  TempFileGuard& operator=(const TempFileGuard&) = delete;
  ~TempFileGuard() noexcept {
    if (!path_.empty()) {
      std::error_code ec;
      if (!std::filesystem::remove(path_, ec) && ec) {
        std::cerr << "TempFileGuard cleanup failed for " << path_ << ": " << ec.message()
                  << '\n';
      }
    }
  }

  void Release() noexcept { path_.clear(); }

 private:
  std::filesystem::path path_;
};

std::filesystem::path MakeTempPath(const std::filesystem::path& dir,
                                   const std::filesystem::path& base) {
  std::array<uint8_t, 16> random{};
  ha::crypto::SystemRandomBytes(std::span<uint8_t>(random.data(), random.size()));
  std::filesystem::path temp_name = base.filename();
  temp_name += ".tmp.";
  temp_name += ha::HexEncode(std::span<const uint8_t>(random.data(), random.size()));
  return dir / temp_name;
}

}  // namespace

void AtomicReplace(const std::filesystem::path& target, std::span<const uint8_t> payload,
                   const AtomicReplaceHooks& hooks) {
  ErrorContext ctx;
  const std::string target_utf8 = target.empty() ? std::string("<empty>") : ha::PathToUtf8String(target);
  ScopedErrorContext root(ctx, "atomic replace target=" + target_utf8);

  try {
    if (target.empty()) {
      throw Error{ErrorDomain::Validation, 0, ctx.Format("Target path required"), std::nullopt,
                  ha::Retryability::kFatal, ctx.Stack()};
    }

    auto dir = target.parent_path();
    if (dir.empty()) {
      dir = WithContext(ctx, "resolving current working directory", [] {
        return std::filesystem::current_path();
      });
    }

    auto temp_path = MakeTempPath(dir, target);
    TempFileGuard cleanup(temp_path);

    int fd = WithContext(ctx, "opening temporary payload file", [&]() {
      int handle = ::open(temp_path.c_str(), O_CREAT | O_WRONLY | O_TRUNC | O_CLOEXEC, 0600);
      if (handle < 0) {
        const int saved_errno = errno;
        ThrowIoError(ctx,
                     saved_errno,
                     std::string(kAtomicReplaceErrorMessage) + ": open failed",
                     saved_errno,
                     ClassifyNativeError(saved_errno));
      }
      return handle;
    });

    try {
      WithContext(ctx, "writing payload", [&] { WriteAll(fd, payload, ctx); });
      WithContext(ctx, "syncing payload", [&] { SyncFileWithRetry(fd, ctx); });
    } catch (...) {
      ::close(fd);
      throw;
    }

    WithContext(ctx, "closing temporary payload file", [&] {
      if (::close(fd) != 0) {
        const int saved_errno = errno;
        ThrowIoError(ctx,
                     saved_errno,
                     std::string(kAtomicReplaceErrorMessage) + ": close failed",
                     saved_errno,
                     ClassifyNativeError(saved_errno));
      }
    });

    if (hooks.before_rename) {
      WithContext(ctx, "executing before_rename hook", [&] { hooks.before_rename(temp_path, target); });
    }

    WithContext(ctx, "renaming temporary file into place", [&] {
      if (::rename(temp_path.c_str(), target.c_str()) != 0) {
        const int err = errno;
        ThrowIoError(ctx,
                     err,
                     std::string(kAtomicReplaceErrorMessage) + ": rename failed",
                     err,
                     ClassifyNativeError(err));
      }
    });

    cleanup.Release();
    WithContext(ctx, "syncing directory metadata", [&] { SyncDirectory(dir); });
  } catch (const Error& err) {
    if (err.context.empty()) {
      throw AugmentError(err, ctx);
    }
    throw;
  } catch (const std::system_error& sys_err) {
    RethrowSystemError(sys_err, ctx);
  }
}

std::optional<std::vector<uint8_t>> ReadFileBytes(const std::filesystem::path& path) {
  std::error_code ec;
  const bool exists = std::filesystem::exists(path, ec);
  if (ec) {
    throw Error{ErrorDomain::IO, ec.value(),
                "Failed to query " + ha::PathToUtf8String(path) + ": " + ec.message(),
                ec.value(), ClassifyNativeError(ec.value())};
  }
  if (!exists) {
    return std::nullopt;
  }
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    throw Error{ErrorDomain::IO, errors::io::kStoreReadFailed,
                "Failed to open " + ha::PathToUtf8String(path)};
  }
  std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  if (in.bad()) {
    throw Error{ErrorDomain::IO, errors::io::kStoreReadFailed,
                "Failed to read " + ha::PathToUtf8String(path)};
  }
  return bytes;
}

bool RemoveDurably(const std::filesystem::path& path) {
  std::error_code ec;
  const bool removed = std::filesystem::remove(path, ec);
  if (ec) {
    throw Error{ErrorDomain::IO, ec.value(),
                "Failed to remove " + ha::PathToUtf8String(path) + ": " + ec.message(),
                ec.value(), ClassifyNativeError(ec.value())};
  }
  if (removed) {
    auto dir = path.parent_path();
    SyncDirectory(dir.empty() ? std::filesystem::current_path() : dir);
  }
  return removed;
}

}  // namespace ha::storage
