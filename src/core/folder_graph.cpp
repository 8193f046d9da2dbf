#include "folder_graph.hpp"

#include "sevenzcpp/errors.hpp"

#include <algorithm>
#include <iterator>
#include <string>

namespace sevenzcpp::core {
namespace {

constexpr std::size_t kMaxCodersPerFolder = 64;
constexpr std::uint32_t kMaxStreamsPerCoder = 64;

StructuralError GraphError(std::size_t folder_index, const std::string& message) {
  return StructuralError("folder " + std::to_string(folder_index) + ": " + message);
}

enum class VisitState : std::uint8_t {
  kUnvisited,
  kInProgress,
  kDone,
};

// Walks coder dependencies through bind pairs and rejects cycles.
void VisitCoder(const Folder& folder,
                const FolderGraph& graph,
                std::size_t coder_index,
                std::vector<VisitState>& states,
                std::size_t folder_index) {
  if (states[coder_index] == VisitState::kDone) {
    return;
  }
  if (states[coder_index] == VisitState::kInProgress) {
    throw GraphError(folder_index, "bind pairs form a cycle through coder " + std::to_string(coder_index));
  }
  states[coder_index] = VisitState::kInProgress;
  const auto& coder = folder.coders[coder_index];
  for (std::uint32_t i = 0; i < coder.num_in_streams; ++i) {
    const auto in_index = graph.coder_in_start[coder_index] + i;
    if (const auto bind = folder.FindBindPairForInStream(in_index); bind.has_value()) {
      const auto producer = graph.CoderForOutStream(folder.bind_pairs[*bind].out_index);
      VisitCoder(folder, graph, producer, states, folder_index);
    }
  }
  states[coder_index] = VisitState::kDone;
}

}  // namespace

std::size_t FolderGraph::CoderForOutStream(std::uint64_t out_index) const {
  const auto it = std::upper_bound(coder_out_start.begin(), coder_out_start.end(), out_index);
  return static_cast<std::size_t>(std::distance(coder_out_start.begin(), it)) - 1;
}

std::optional<std::size_t> FolderGraph::PackedPosition(std::uint64_t in_index) const {
  const auto it = std::find(packed_inputs.begin(), packed_inputs.end(), in_index);
  if (it == packed_inputs.end()) {
    return std::nullopt;
  }
  return static_cast<std::size_t>(std::distance(packed_inputs.begin(), it));
}

FolderGraph ResolveFolderGraph(const Folder& folder, std::size_t folder_index) {
  if (folder.coders.empty()) {
    throw GraphError(folder_index, "folder has no coders");
  }
  if (folder.coders.size() > kMaxCodersPerFolder) {
    throw GraphError(folder_index, "too many coders: " + std::to_string(folder.coders.size()));
  }

  FolderGraph graph;
  graph.coder_in_start.reserve(folder.coders.size());
  graph.coder_out_start.reserve(folder.coders.size());
  for (std::size_t i = 0; i < folder.coders.size(); ++i) {
    const auto& coder = folder.coders[i];
    if (coder.num_in_streams == 0 || coder.num_out_streams == 0 ||
        coder.num_in_streams > kMaxStreamsPerCoder || coder.num_out_streams > kMaxStreamsPerCoder) {
      throw GraphError(folder_index, "coder " + std::to_string(i) + " declares an invalid stream count");
    }
    graph.coder_in_start.push_back(graph.total_in_streams);
    graph.coder_out_start.push_back(graph.total_out_streams);
    graph.total_in_streams += coder.num_in_streams;
    graph.total_out_streams += coder.num_out_streams;
  }

  std::vector<bool> in_bound(graph.total_in_streams, false);
  std::vector<bool> out_bound(graph.total_out_streams, false);
  for (const auto& pair : folder.bind_pairs) {
    if (pair.in_index >= graph.total_in_streams) {
      throw GraphError(folder_index, "bind pair input index " + std::to_string(pair.in_index) + " out of range");
    }
    if (pair.out_index >= graph.total_out_streams) {
      throw GraphError(folder_index, "bind pair output index " + std::to_string(pair.out_index) + " out of range");
    }
    if (in_bound[pair.in_index]) {
      throw GraphError(folder_index, "input stream " + std::to_string(pair.in_index) + " bound twice");
    }
    if (out_bound[pair.out_index]) {
      throw GraphError(folder_index, "output stream " + std::to_string(pair.out_index) + " bound twice");
    }
    in_bound[pair.in_index] = true;
    out_bound[pair.out_index] = true;
  }

  std::optional<std::uint64_t> final_output;
  for (std::uint64_t i = 0; i < graph.total_out_streams; ++i) {
    if (out_bound[i]) {
      continue;
    }
    if (final_output.has_value()) {
      throw GraphError(folder_index, "more than one unbound output stream");
    }
    final_output = i;
  }
  if (!final_output.has_value()) {
    throw GraphError(folder_index, "no unbound output stream");
  }
  graph.final_output = *final_output;

  const auto expected_packed = graph.total_in_streams - folder.bind_pairs.size();
  if (expected_packed == 0) {
    throw GraphError(folder_index, "every input stream is bound, nothing is read from the pack region");
  }
  if (folder.packed_streams.empty()) {
    if (expected_packed != 1) {
      throw GraphError(folder_index, "folder needs " + std::to_string(expected_packed) +
                                         " packed streams but lists none");
    }
    const auto it = std::find(in_bound.begin(), in_bound.end(), false);
    graph.packed_inputs.push_back(static_cast<std::uint64_t>(std::distance(in_bound.begin(), it)));
  } else {
    if (folder.packed_streams.size() != expected_packed) {
      throw GraphError(folder_index, "folder lists " + std::to_string(folder.packed_streams.size()) +
                                         " packed streams, expected " + std::to_string(expected_packed));
    }
    std::vector<bool> used(graph.total_in_streams, false);
    for (const auto in_index : folder.packed_streams) {
      if (in_index >= graph.total_in_streams || in_bound[in_index] || used[in_index]) {
        throw GraphError(folder_index, "invalid packed stream index " + std::to_string(in_index));
      }
      used[in_index] = true;
    }
    graph.packed_inputs = folder.packed_streams;
  }

  if (!folder.unpack_sizes.empty() && folder.unpack_sizes.size() != graph.total_out_streams) {
    throw GraphError(folder_index, "folder declares " + std::to_string(folder.unpack_sizes.size()) +
                                       " unpack sizes for " + std::to_string(graph.total_out_streams) +
                                       " output streams");
  }

  std::vector<VisitState> states(folder.coders.size(), VisitState::kUnvisited);
  for (std::size_t i = 0; i < folder.coders.size(); ++i) {
    VisitCoder(folder, graph, i, states, folder_index);
  }

  return graph;
}

std::optional<std::uint64_t> DeclaredUnpackSize(const Folder& folder, const FolderGraph& graph) {
  if (folder.unpack_sizes.empty()) {
    return std::nullopt;
  }
  return folder.unpack_sizes[graph.final_output];
}

}  // namespace sevenzcpp::core
