#pragma once

#include "sevenzcpp/archive.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

namespace sevenzcpp {

enum class MethodId : std::uint64_t {
  kCopy = 0x00,
  kDelta = 0x03,
  kLzma2 = 0x21,
  kLzma = 0x030101,
  kDeflate = 0x040108,
  kBzip2 = 0x040202,
};

// Big-endian value of a method id byte sequence. Throws when longer than 8 bytes.
[[nodiscard]] std::uint64_t MethodIdValue(std::span<const std::byte> method_id);

// Decodes one coder. Implementations are shared across folder-decode workers, so
// Decode must be safe to call concurrently.
class Decoder {
 public:
  virtual ~Decoder() = default;

  // `inputs` holds one byte range per coder input stream, in coder input order.
  // `expected_size` is the declared output size when the header carries one.
  virtual std::vector<std::byte> Decode(const Coder& coder,
                                        std::span<const std::span<const std::byte>> inputs,
                                        std::optional<std::uint64_t> expected_size) const = 0;
};

class BuiltinDecoder final : public Decoder {
 public:
  std::vector<std::byte> Decode(const Coder& coder,
                                std::span<const std::span<const std::byte>> inputs,
                                std::optional<std::uint64_t> expected_size) const override;

  [[nodiscard]] static bool Supports(std::span<const std::byte> method_id);
};

}  // namespace sevenzcpp
