#pragma once

#include "sevenzcpp/archive.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace sevenzcpp {

struct FolderStreamInfo {
  std::uint64_t first_pack_stream_index = 0;
  std::uint64_t pack_stream_count = 0;
  // Absolute offset and total compressed length of the folder's pack streams.
  std::uint64_t pack_offset = 0;
  std::uint64_t packed_length = 0;
  std::uint64_t unpack_length = 0;
  std::uint64_t first_substream_index = 0;
  std::uint64_t substream_count = 0;
  std::optional<std::size_t> first_file_index;

  bool operator==(const FolderStreamInfo&) const = default;
};

struct FileStreamInfo {
  std::size_t file_index = 0;
  std::size_t folder_index = 0;
  std::uint64_t substream_index = 0;
  std::uint64_t offset = 0;
  std::uint64_t size = 0;
  std::optional<std::uint32_t> expected_crc;

  bool operator==(const FileStreamInfo&) const = default;
};

struct StreamMap {
  std::vector<FolderStreamInfo> folders;
  std::vector<std::uint64_t> pack_stream_offsets;
  // Aligned with Archive::files; empty for entries without content.
  std::vector<std::optional<std::size_t>> file_folder_index;
  // Aligned with Archive::files; index into `files` for entries with content.
  std::vector<std::optional<std::size_t>> file_stream_index;
  // One entry per file with content, in file order.
  std::vector<FileStreamInfo> files;
  std::uint64_t pack_end = 0;

  [[nodiscard]] const FileStreamInfo* FindFile(std::size_t file_index) const;

  bool operator==(const StreamMap&) const = default;
};

// Derives pack ranges, folder output lengths, the per-file offset table and the
// resolved expected CRCs. Throws StructuralError on inconsistent counts.
[[nodiscard]] StreamMap DeriveStreamMap(const Archive& archive);

}  // namespace sevenzcpp
