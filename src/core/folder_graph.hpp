#pragma once

#include "sevenzcpp/archive.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace sevenzcpp::core {

struct FolderGraph {
  std::uint64_t total_in_streams = 0;
  std::uint64_t total_out_streams = 0;
  std::uint64_t final_output = 0;
  // Global input indices read from the pack region, in pack order.
  std::vector<std::uint64_t> packed_inputs;
  // First global input/output index of each coder.
  std::vector<std::uint64_t> coder_in_start;
  std::vector<std::uint64_t> coder_out_start;

  [[nodiscard]] std::size_t CoderForOutStream(std::uint64_t out_index) const;
  [[nodiscard]] std::optional<std::size_t> PackedPosition(std::uint64_t in_index) const;
};

// Validates the coder/bind-pair topology and resolves the final output and the
// packed inputs. Throws StructuralError naming `folder_index` on any violation.
[[nodiscard]] FolderGraph ResolveFolderGraph(const Folder& folder, std::size_t folder_index);

// Declared size of the folder's final output, when the header carries one.
[[nodiscard]] std::optional<std::uint64_t> DeclaredUnpackSize(const Folder& folder, const FolderGraph& graph);

}  // namespace sevenzcpp::core
