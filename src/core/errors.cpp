#include "sevenzcpp/errors.hpp"

#include <array>

namespace sevenzcpp {
namespace {

std::string HexCrc(std::uint32_t value) {
  constexpr std::array<char, 16> kDigits = {'0', '1', '2', '3', '4', '5', '6', '7',
                                            '8', '9', 'a', 'b', 'c', 'd', 'e', 'f'};
  std::string out = "0x00000000";
  for (std::size_t i = 0; i < 8; ++i) {
    out[out.size() - 1 - i] = kDigits[(value >> (4U * i)) & 0xFU];
  }
  return out;
}

}  // namespace

StructuralError::StructuralError(const std::string& message)
    : std::runtime_error("7z structural error: " + message) {}

DecodeError::DecodeError(std::size_t folder_index, const std::string& message)
    : std::runtime_error("7z decode error in folder " + std::to_string(folder_index) + ": " + message),
      folder_index_(folder_index) {}

IntegrityError::IntegrityError(std::size_t file_index, std::uint32_t expected_crc, std::uint32_t actual_crc)
    : std::runtime_error("7z integrity error for file " + std::to_string(file_index) +
                         ": crc mismatch, expected " + HexCrc(expected_crc) + " got " + HexCrc(actual_crc)),
      file_index_(file_index),
      expected_crc_(expected_crc),
      actual_crc_(actual_crc) {}

}  // namespace sevenzcpp
