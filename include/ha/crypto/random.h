#pragma once

#include <span>

#include "ha/common.h"

namespace ha::crypto {

void SystemRandomBytes(std::span<uint8_t> out);

}  // namespace ha::crypto
