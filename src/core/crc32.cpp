#include "crc32.hpp"

#include <zlib.h>

#include <algorithm>
#include <limits>

namespace sevenzcpp::core {

void Crc32::Update(std::span<const std::byte> bytes) {
  // zlib takes a uInt length, so feed oversized buffers in pieces.
  constexpr std::size_t kMaxChunk = std::numeric_limits<uInt>::max();
  while (!bytes.empty()) {
    const auto chunk = std::min(bytes.size(), kMaxChunk);
    state_ = crc32(state_, reinterpret_cast<const Bytef*>(bytes.data()), static_cast<uInt>(chunk));
    bytes = bytes.subspan(chunk);
  }
}

std::uint32_t Crc32::Finalize() const {
  return static_cast<std::uint32_t>(state_ & 0xFFFFFFFFUL);
}

std::uint32_t Crc32Digest(std::span<const std::byte> bytes) {
  Crc32 crc;
  crc.Update(bytes);
  return crc.Finalize();
}

}  // namespace sevenzcpp::core
