#pragma once

#include <cstddef>
#include <cstdint>
#include <span>

namespace sevenzcpp::core {

// Standard CRC-32 (IEEE 802.3 polynomial), as stored in 7z headers.
class Crc32 {
 public:
  void Update(std::span<const std::byte> bytes);
  [[nodiscard]] std::uint32_t Finalize() const;

 private:
  unsigned long state_ = 0;
};

[[nodiscard]] std::uint32_t Crc32Digest(std::span<const std::byte> bytes);

}  // namespace sevenzcpp::core
