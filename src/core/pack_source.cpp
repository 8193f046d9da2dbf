#include "sevenzcpp/pack_source.hpp"

#include <algorithm>
#include <fstream>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>

namespace sevenzcpp {
namespace {

std::runtime_error SourceError(const std::string& message) {
  return std::runtime_error("pack source: " + message);
}

}  // namespace

MemoryPackSource::MemoryPackSource(std::vector<std::byte> bytes) : bytes_(std::move(bytes)) {}

std::uint64_t MemoryPackSource::size() const {
  return bytes_.size();
}

std::vector<std::byte> MemoryPackSource::Read(std::uint64_t offset, std::size_t length) const {
  if (offset > bytes_.size() || length > bytes_.size() - offset) {
    throw SourceError("short read at offset " + std::to_string(offset) + " length " + std::to_string(length));
  }
  const auto begin = bytes_.begin() + static_cast<std::ptrdiff_t>(offset);
  return std::vector<std::byte>(begin, begin + static_cast<std::ptrdiff_t>(length));
}

FilePackSource::FilePackSource(std::filesystem::path path) : path_(std::move(path)) {}

std::uint64_t FilePackSource::size() const {
  std::error_code ec;
  const auto size = std::filesystem::file_size(path_, ec);
  if (ec) {
    throw SourceError("failed to read file size: " + ec.message());
  }
  return size;
}

std::vector<std::byte> FilePackSource::Read(std::uint64_t offset, std::size_t length) const {
  if (length == 0) {
    return {};
  }
  std::ifstream in(path_, std::ios::binary);
  if (!in) {
    throw SourceError("failed to open file for read: " + path_.string());
  }
  // Lengths come from the header, so check them before allocating the buffer.
  const auto file_size = size();
  if (offset > file_size || length > file_size - offset) {
    throw SourceError("short read at offset " + std::to_string(offset) + " length " + std::to_string(length));
  }
  in.seekg(static_cast<std::streamoff>(offset), std::ios::beg);
  if (!in) {
    throw SourceError("failed to seek to offset " + std::to_string(offset));
  }
  std::vector<std::byte> out(length);
  in.read(reinterpret_cast<char*>(out.data()), static_cast<std::streamsize>(length));
  if (in.gcount() != static_cast<std::streamsize>(length)) {
    throw SourceError("short read at offset " + std::to_string(offset) + " length " + std::to_string(length));
  }
  return out;
}

}  // namespace sevenzcpp
