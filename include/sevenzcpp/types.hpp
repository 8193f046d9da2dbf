#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace sevenzcpp {

enum class CrcPolicy {
  kThrow,
  kReport,
};

enum class CrcStatus {
  kVerified,
  kMismatch,
  kUnverifiable,
};

enum class ExtractStatus {
  kOk,
  kDecodeFailed,
  kIntegrityFailed,
  kCancelled,
};

struct ExtractedFile {
  std::size_t file_index = 0;
  std::vector<std::byte> content;
  CrcStatus crc_status = CrcStatus::kUnverifiable;
  std::optional<std::uint32_t> expected_crc;
  std::uint32_t actual_crc = 0;
};

struct ExtractResult {
  std::size_t file_index = 0;
  ExtractStatus status = ExtractStatus::kOk;
  std::optional<ExtractedFile> file;
  std::string error;
};

struct ReaderConfig {
  bool verify_pack_crcs = true;
  CrcPolicy crc_policy = CrcPolicy::kThrow;
  int decode_concurrency = 1;
  std::uint64_t max_folder_unpack_bytes = 1ULL << 30U;
};

}  // namespace sevenzcpp
