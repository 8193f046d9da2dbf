#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <vector>

namespace sevenzcpp {

class PackSource {
 public:
  virtual ~PackSource() = default;

  [[nodiscard]] virtual std::uint64_t size() const = 0;
  // Reads exactly `length` bytes at absolute `offset`. Throws on short reads.
  [[nodiscard]] virtual std::vector<std::byte> Read(std::uint64_t offset, std::size_t length) const = 0;
};

class MemoryPackSource final : public PackSource {
 public:
  explicit MemoryPackSource(std::vector<std::byte> bytes);

  [[nodiscard]] std::uint64_t size() const override;
  [[nodiscard]] std::vector<std::byte> Read(std::uint64_t offset, std::size_t length) const override;

 private:
  std::vector<std::byte> bytes_;
};

// Opens a fresh stream per read, so concurrent readers never share a position.
class FilePackSource final : public PackSource {
 public:
  explicit FilePackSource(std::filesystem::path path);

  [[nodiscard]] std::uint64_t size() const override;
  [[nodiscard]] std::vector<std::byte> Read(std::uint64_t offset, std::size_t length) const override;

 private:
  std::filesystem::path path_;
};

}  // namespace sevenzcpp
