#include "sevenzcpp/archive_reader.hpp"

#include "crc32.hpp"
#include "folder_decoder.hpp"
#include "sevenzcpp/errors.hpp"

#include <algorithm>
#include <future>
#include <span>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>

namespace sevenzcpp {
namespace {

std::runtime_error ReaderError(const std::string& message) {
  return std::runtime_error("archive_reader: " + message);
}

struct FolderOutcome {
  std::shared_ptr<const std::vector<std::byte>> output;
  std::string error;
  bool cancelled = false;
};

}  // namespace

ArchiveReader::ArchiveReader(Archive archive,
                             std::shared_ptr<const PackSource> source,
                             std::shared_ptr<const Decoder> decoder,
                             ReaderConfig config)
    : archive_(std::move(archive)),
      stream_map_(DeriveStreamMap(archive_)),
      source_(std::move(source)),
      decoder_(decoder != nullptr ? std::move(decoder) : std::make_shared<BuiltinDecoder>()),
      config_(config),
      folder_cache_(archive_.folders.size()) {
  if (source_ == nullptr) {
    throw ReaderError("pack source is required");
  }
}

std::vector<std::byte> ArchiveReader::DecodeFolder(std::size_t folder_index) const {
  if (folder_index >= archive_.folders.size()) {
    throw ReaderError("folder index out of range: " + std::to_string(folder_index));
  }
  return core::DecodeFolderOutput(archive_, stream_map_, folder_index, *source_, *decoder_, config_);
}

ExtractedFile ArchiveReader::Extract(std::size_t file_index) {
  if (file_index >= archive_.files.size()) {
    throw ReaderError("file index out of range: " + std::to_string(file_index));
  }
  const auto* info = stream_map_.FindFile(file_index);
  if (info == nullptr) {
    ExtractedFile empty;
    empty.file_index = file_index;
    return empty;
  }

  const auto output = FolderOutput(info->folder_index);
  auto file = Demultiplex(*output, *info);
  if (file.crc_status == CrcStatus::kMismatch && config_.crc_policy == CrcPolicy::kThrow) {
    throw IntegrityError(file_index, *file.expected_crc, file.actual_crc);
  }
  return file;
}

std::vector<ExtractResult> ArchiveReader::ExtractAll(const std::atomic<bool>* cancel) {
  std::vector<std::size_t> backed_folders;
  for (std::size_t i = 0; i < stream_map_.folders.size(); ++i) {
    if (stream_map_.folders[i].first_file_index.has_value()) {
      backed_folders.push_back(i);
    }
  }

  // Each worker writes only the outcome slot of the folder it claimed.
  std::vector<FolderOutcome> outcomes(archive_.folders.size());
  auto decode_one = [&](std::size_t folder_index) {
    auto& outcome = outcomes[folder_index];
    if (cancel != nullptr && cancel->load(std::memory_order_acquire)) {
      outcome.cancelled = true;
      return;
    }
    try {
      outcome.output = FolderOutput(folder_index);
    } catch (const DecodeError& ex) {
      outcome.error = ex.what();
    }
  };

  const std::size_t worker_count =
      config_.decode_concurrency > 1
          ? std::min(backed_folders.size(), static_cast<std::size_t>(config_.decode_concurrency))
          : 1ULL;
  if (worker_count <= 1) {
    for (const auto folder_index : backed_folders) {
      decode_one(folder_index);
    }
  } else {
    std::atomic<std::size_t> next_index{0};
    std::atomic<bool> stop_workers{false};
    std::exception_ptr first_error{};
    std::mutex error_mutex{};

    auto worker = [&]() {
      while (true) {
        if (stop_workers.load(std::memory_order_acquire)) {
          return;
        }
        const auto index = next_index.fetch_add(1);
        if (index >= backed_folders.size()) {
          return;
        }
        try {
          decode_one(backed_folders[index]);
        } catch (...) {
          std::lock_guard<std::mutex> error_lock(error_mutex);
          if (first_error == nullptr) {
            first_error = std::current_exception();
          }
          stop_workers.store(true, std::memory_order_release);
          return;
        }
      }
    };

    std::vector<std::thread> workers{};
    workers.reserve(worker_count);
    for (std::size_t i = 0; i < worker_count; ++i) {
      workers.emplace_back(worker);
    }
    for (auto& thread : workers) {
      thread.join();
    }
    if (first_error != nullptr) {
      std::rethrow_exception(first_error);
    }
  }

  std::vector<ExtractResult> results;
  results.reserve(stream_map_.files.size());
  for (const auto& info : stream_map_.files) {
    ExtractResult result;
    result.file_index = info.file_index;
    const auto& outcome = outcomes[info.folder_index];
    if (outcome.cancelled) {
      result.status = ExtractStatus::kCancelled;
      result.error = "folder " + std::to_string(info.folder_index) + " skipped: extraction cancelled";
    } else if (outcome.output == nullptr) {
      result.status = ExtractStatus::kDecodeFailed;
      result.error = outcome.error;
    } else {
      result.file = Demultiplex(*outcome.output, info);
      if (result.file->crc_status == CrcStatus::kMismatch) {
        result.status = ExtractStatus::kIntegrityFailed;
        result.error = IntegrityError(info.file_index, *result.file->expected_crc, result.file->actual_crc).what();
      }
    }
    results.push_back(std::move(result));
  }
  return results;
}

void ArchiveReader::ReleaseFolder(std::size_t folder_index) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (folder_index >= folder_cache_.size()) {
    throw ReaderError("folder index out of range: " + std::to_string(folder_index));
  }
  auto& entry = folder_cache_[folder_index];
  entry.result = {};
  entry.decoded = false;
  ++entry.generation;
}

std::size_t ArchiveReader::cached_folder_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return static_cast<std::size_t>(std::count_if(folder_cache_.begin(), folder_cache_.end(),
                                                [](const CachedFolder& entry) { return entry.decoded; }));
}

ArchiveReader::FolderBuffer ArchiveReader::FolderOutput(std::size_t folder_index) {
  std::promise<FolderBuffer> promise;
  std::shared_future<FolderBuffer> pending;
  std::uint64_t generation = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& entry = folder_cache_[folder_index];
    if (entry.result.valid()) {
      pending = entry.result;
    } else {
      entry.result = promise.get_future().share();
      generation = entry.generation;
    }
  }
  if (pending.valid()) {
    // Decoded, failed, or in flight on another thread.
    return pending.get();
  }

  // Decode outside the lock so independent folders proceed in parallel.
  FolderBuffer output;
  try {
    output = std::make_shared<const std::vector<std::byte>>(
        core::DecodeFolderOutput(archive_, stream_map_, folder_index, *source_, *decoder_, config_));
  } catch (const DecodeError&) {
    promise.set_exception(std::current_exception());
    throw;
  } catch (...) {
    // Not a property of the folder: hand it to waiters, then let the next caller retry.
    promise.set_exception(std::current_exception());
    ForgetFolder(folder_index, generation);
    throw;
  }
  promise.set_value(output);
  MarkDecoded(folder_index, generation);
  return output;
}

void ArchiveReader::MarkDecoded(std::size_t folder_index, std::uint64_t generation) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto& entry = folder_cache_[folder_index];
  if (entry.generation == generation) {
    entry.decoded = true;
  }
}

void ArchiveReader::ForgetFolder(std::size_t folder_index, std::uint64_t generation) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto& entry = folder_cache_[folder_index];
  if (entry.generation == generation) {
    entry.result = {};
    entry.decoded = false;
    ++entry.generation;
  }
}

ExtractedFile ArchiveReader::Demultiplex(const std::vector<std::byte>& folder_output,
                                         const FileStreamInfo& info) const {
  if (info.offset > folder_output.size() || info.size > folder_output.size() - info.offset) {
    throw DecodeError(info.folder_index, "substream " + std::to_string(info.substream_index) +
                                             " extends past the folder output");
  }
  const auto slice = std::span<const std::byte>(folder_output).subspan(static_cast<std::size_t>(info.offset),
                                                                        static_cast<std::size_t>(info.size));
  ExtractedFile file;
  file.file_index = info.file_index;
  file.content.assign(slice.begin(), slice.end());
  file.actual_crc = core::Crc32Digest(slice);
  file.expected_crc = info.expected_crc;
  if (!info.expected_crc.has_value()) {
    file.crc_status = CrcStatus::kUnverifiable;
  } else if (*info.expected_crc == file.actual_crc) {
    file.crc_status = CrcStatus::kVerified;
  } else {
    file.crc_status = CrcStatus::kMismatch;
  }
  return file;
}

}  // namespace sevenzcpp
