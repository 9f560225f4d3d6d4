#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <span>
#include <vector>

#include "ha/error.h"

namespace ha::storage {

struct AtomicReplaceHooks { // test seam for crash simulation
  std::function<void(const std::filesystem::path&, const std::filesystem::path&)> before_rename;
};

// Performs an atomic replace of the target file by writing the payload to a
// temporary file on the same filesystem, syncing it to disk, then renaming it
// into place.
void AtomicReplace(const std::filesystem::path& target, std::span<const uint8_t> payload,
                   const AtomicReplaceHooks& hooks = {});

// Reads a whole file. Returns nullopt when the file does not exist; throws
// ha::Error (IO) on any other failure.
std::optional<std::vector<uint8_t>> ReadFileBytes(const std::filesystem::path& path);

// Removes |path| and syncs its directory. Returns false when nothing existed.
bool RemoveDurably(const std::filesystem::path& path);

}  // namespace ha::storage
