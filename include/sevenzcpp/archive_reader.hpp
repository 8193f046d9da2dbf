#pragma once

#include "sevenzcpp/archive.hpp"
#include "sevenzcpp/decoder.hpp"
#include "sevenzcpp/pack_source.hpp"
#include "sevenzcpp/stream_map.hpp"
#include "sevenzcpp/types.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <future>
#include <memory>
#include <mutex>
#include <vector>

namespace sevenzcpp {

class ArchiveReader {
 public:
  // Derives the stream map up front; throws StructuralError before any decode
  // work when the header is inconsistent. A null decoder selects BuiltinDecoder.
  ArchiveReader(Archive archive,
                std::shared_ptr<const PackSource> source,
                std::shared_ptr<const Decoder> decoder = nullptr,
                ReaderConfig config = {});

  ArchiveReader(const ArchiveReader&) = delete;
  ArchiveReader& operator=(const ArchiveReader&) = delete;
  ~ArchiveReader() = default;

  [[nodiscard]] const Archive& archive() const { return archive_; }
  [[nodiscard]] const StreamMap& stream_map() const { return stream_map_; }
  [[nodiscard]] const ReaderConfig& config() const { return config_; }

  // Decodes a folder without touching the cache.
  [[nodiscard]] std::vector<std::byte> DecodeFolder(std::size_t folder_index) const;

  // Returns one file's content. The backing folder is decoded on first use and
  // reused by later calls for sibling files.
  ExtractedFile Extract(std::size_t file_index);

  // Decodes every folder (in parallel up to decode_concurrency) and returns one
  // result per file with content, in file order. Decode and integrity failures
  // are collected per file. Setting `cancel` skips folders not yet started.
  std::vector<ExtractResult> ExtractAll(const std::atomic<bool>* cancel = nullptr);

  void ReleaseFolder(std::size_t folder_index);
  [[nodiscard]] std::size_t cached_folder_count() const;

 private:
  using FolderBuffer = std::shared_ptr<const std::vector<std::byte>>;

  // `result` is valid from the moment a caller claims the decode, so concurrent
  // callers wait on the same decode. A stored DecodeError is rethrown by get().
  struct CachedFolder {
    std::shared_future<FolderBuffer> result;
    std::uint64_t generation = 0;
    bool decoded = false;
  };

  FolderBuffer FolderOutput(std::size_t folder_index);
  void MarkDecoded(std::size_t folder_index, std::uint64_t generation);
  void ForgetFolder(std::size_t folder_index, std::uint64_t generation);
  [[nodiscard]] ExtractedFile Demultiplex(const std::vector<std::byte>& folder_output,
                                          const FileStreamInfo& info) const;

  Archive archive_;
  StreamMap stream_map_;
  std::shared_ptr<const PackSource> source_;
  std::shared_ptr<const Decoder> decoder_;
  ReaderConfig config_{};
  mutable std::mutex mutex_;
  std::vector<CachedFolder> folder_cache_{};
};

}  // namespace sevenzcpp
