#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace sevenzcpp {

struct Coder {
  std::vector<std::byte> method_id;
  std::uint32_t num_in_streams = 1;
  std::uint32_t num_out_streams = 1;
  std::vector<std::byte> properties;
};

// Routes output stream `out_index` into input stream `in_index`. Both indices are
// folder-global: the concatenation of every coder's streams in coder order.
struct BindPair {
  std::uint64_t in_index = 0;
  std::uint64_t out_index = 0;
};

struct Folder {
  std::vector<Coder> coders;
  std::vector<BindPair> bind_pairs;
  // Global input indices fed from the pack region, in pack order. May be left
  // empty when the folder has exactly one unbound input.
  std::vector<std::uint64_t> packed_streams;
  // Declared size of every global output stream. Empty when unknown.
  std::vector<std::uint64_t> unpack_sizes;
  std::optional<std::uint32_t> unpack_crc;

  [[nodiscard]] std::uint64_t TotalInputStreams() const;
  [[nodiscard]] std::uint64_t TotalOutputStreams() const;
  [[nodiscard]] std::optional<std::size_t> FindBindPairForInStream(std::uint64_t in_index) const;
  [[nodiscard]] std::optional<std::size_t> FindBindPairForOutStream(std::uint64_t out_index) const;
};

enum class EntryKind {
  kDirectory,
  kEmptyFile,
  kFile,
};

struct FileEntry {
  std::string name;
  EntryKind kind = EntryKind::kFile;

  [[nodiscard]] bool HasStream() const { return kind == EntryKind::kFile; }
};

// Frozen per-substream sizes and CRCs. Only SubStreamsInfoBuilder creates a
// populated instance.
class SubStreamsInfo {
 public:
  SubStreamsInfo() = default;

  [[nodiscard]] std::size_t folder_count() const { return substreams_per_folder_.size(); }
  [[nodiscard]] std::uint64_t total_substreams() const { return unpack_sizes_.size(); }
  [[nodiscard]] const std::vector<std::uint64_t>& substreams_per_folder() const { return substreams_per_folder_; }
  [[nodiscard]] const std::vector<std::uint64_t>& unpack_sizes() const { return unpack_sizes_; }
  [[nodiscard]] const std::vector<bool>& has_crc() const { return has_crc_; }
  [[nodiscard]] const std::vector<std::uint32_t>& crcs() const { return crcs_; }

  [[nodiscard]] std::optional<std::uint32_t> Crc(std::size_t substream_index) const;

 private:
  friend class SubStreamsInfoBuilder;

  std::vector<std::uint64_t> substreams_per_folder_{};
  std::vector<std::uint64_t> unpack_sizes_{};
  std::vector<bool> has_crc_{};
  std::vector<std::uint32_t> crcs_{};
};

class SubStreamsInfoBuilder {
 public:
  void AddFolder(std::uint64_t substream_count);
  void AddUnpackSize(std::uint64_t size);
  void AddCrc(std::uint32_t crc);
  void AddMissingCrc();

  // Validates the accumulated sequences and moves them into a SubStreamsInfo.
  // Throws StructuralError when the counts disagree.
  [[nodiscard]] SubStreamsInfo Freeze() &&;

 private:
  std::vector<std::uint64_t> substreams_per_folder_{};
  std::vector<std::uint64_t> unpack_sizes_{};
  std::vector<bool> has_crc_{};
  std::vector<std::uint32_t> crcs_{};
};

struct Archive {
  // Absolute offset of the first packed stream.
  std::uint64_t pack_pos = 0;
  std::vector<std::uint64_t> pack_sizes;
  // Either empty or aligned with pack_sizes. pack_crcs[i] is meaningful only
  // where pack_crcs_defined[i] is set.
  std::vector<bool> pack_crcs_defined;
  std::vector<std::uint32_t> pack_crcs;
  std::vector<Folder> folders;
  // Absent means every folder holds exactly one substream of its declared size.
  std::optional<SubStreamsInfo> sub_streams_info;
  std::vector<FileEntry> files;

  [[nodiscard]] std::optional<std::uint32_t> PackCrc(std::size_t pack_stream_index) const;
};

}  // namespace sevenzcpp
