#include "sevenzcpp/archive.hpp"

#include "sevenzcpp/errors.hpp"

#include <limits>
#include <string>
#include <utility>

namespace sevenzcpp {

std::uint64_t Folder::TotalInputStreams() const {
  std::uint64_t total = 0;
  for (const auto& coder : coders) {
    total += coder.num_in_streams;
  }
  return total;
}

std::uint64_t Folder::TotalOutputStreams() const {
  std::uint64_t total = 0;
  for (const auto& coder : coders) {
    total += coder.num_out_streams;
  }
  return total;
}

std::optional<std::size_t> Folder::FindBindPairForInStream(std::uint64_t in_index) const {
  for (std::size_t i = 0; i < bind_pairs.size(); ++i) {
    if (bind_pairs[i].in_index == in_index) {
      return i;
    }
  }
  return std::nullopt;
}

std::optional<std::size_t> Folder::FindBindPairForOutStream(std::uint64_t out_index) const {
  for (std::size_t i = 0; i < bind_pairs.size(); ++i) {
    if (bind_pairs[i].out_index == out_index) {
      return i;
    }
  }
  return std::nullopt;
}

std::optional<std::uint32_t> SubStreamsInfo::Crc(std::size_t substream_index) const {
  if (substream_index >= has_crc_.size() || !has_crc_[substream_index]) {
    return std::nullopt;
  }
  return crcs_[substream_index];
}

void SubStreamsInfoBuilder::AddFolder(std::uint64_t substream_count) {
  substreams_per_folder_.push_back(substream_count);
}

void SubStreamsInfoBuilder::AddUnpackSize(std::uint64_t size) {
  unpack_sizes_.push_back(size);
}

void SubStreamsInfoBuilder::AddCrc(std::uint32_t crc) {
  has_crc_.push_back(true);
  crcs_.push_back(crc);
}

void SubStreamsInfoBuilder::AddMissingCrc() {
  has_crc_.push_back(false);
  crcs_.push_back(0);
}

SubStreamsInfo SubStreamsInfoBuilder::Freeze() && {
  std::uint64_t declared = 0;
  for (const auto count : substreams_per_folder_) {
    if (count > std::numeric_limits<std::uint64_t>::max() - declared) {
      throw StructuralError("substream count overflow");
    }
    declared += count;
  }
  if (declared != unpack_sizes_.size()) {
    throw StructuralError("folders declare " + std::to_string(declared) + " substreams but " +
                          std::to_string(unpack_sizes_.size()) + " unpack sizes were read");
  }
  if (!has_crc_.empty() && has_crc_.size() != unpack_sizes_.size()) {
    throw StructuralError("substream digest count " + std::to_string(has_crc_.size()) +
                          " does not match substream count " + std::to_string(unpack_sizes_.size()));
  }

  SubStreamsInfo info;
  info.substreams_per_folder_ = std::move(substreams_per_folder_);
  info.unpack_sizes_ = std::move(unpack_sizes_);
  if (has_crc_.empty()) {
    info.has_crc_.assign(info.unpack_sizes_.size(), false);
    info.crcs_.assign(info.unpack_sizes_.size(), 0);
  } else {
    info.has_crc_ = std::move(has_crc_);
    info.crcs_ = std::move(crcs_);
  }
  return info;
}

std::optional<std::uint32_t> Archive::PackCrc(std::size_t pack_stream_index) const {
  if (pack_stream_index >= pack_crcs_defined.size() || !pack_crcs_defined[pack_stream_index] ||
      pack_stream_index >= pack_crcs.size()) {
    return std::nullopt;
  }
  return pack_crcs[pack_stream_index];
}

}  // namespace sevenzcpp
