#pragma once

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace sevenzcpp {

// Header-derived counts contradict each other. Fatal to the whole read session.
class StructuralError : public std::runtime_error {
 public:
  explicit StructuralError(const std::string& message);
};

// A folder could not be decoded. Fatal to that folder and every file it backs.
class DecodeError : public std::runtime_error {
 public:
  DecodeError(std::size_t folder_index, const std::string& message);

  [[nodiscard]] std::size_t folder_index() const noexcept { return folder_index_; }

 private:
  std::size_t folder_index_ = 0;
};

class IntegrityError : public std::runtime_error {
 public:
  IntegrityError(std::size_t file_index, std::uint32_t expected_crc, std::uint32_t actual_crc);

  [[nodiscard]] std::size_t file_index() const noexcept { return file_index_; }
  [[nodiscard]] std::uint32_t expected_crc() const noexcept { return expected_crc_; }
  [[nodiscard]] std::uint32_t actual_crc() const noexcept { return actual_crc_; }

 private:
  std::size_t file_index_ = 0;
  std::uint32_t expected_crc_ = 0;
  std::uint32_t actual_crc_ = 0;
};

}  // namespace sevenzcpp
