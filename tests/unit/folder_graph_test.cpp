#include "../../src/core/folder_graph.hpp"
#include "sevenzcpp/errors.hpp"
#include "../test_logger.hpp"

#include <cstdint>
#include <cstdlib>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

using sevenzcpp::BindPair;
using sevenzcpp::Coder;
using sevenzcpp::Folder;
using sevenzcpp::StructuralError;
using sevenzcpp::core::ResolveFolderGraph;
using sevenzcpp::tests::ExpectThrow;
using sevenzcpp::tests::Require;

Coder MakeCoder(std::uint8_t method, std::uint32_t in_streams = 1, std::uint32_t out_streams = 1) {
  Coder coder;
  coder.method_id = {static_cast<std::byte>(method)};
  coder.num_in_streams = in_streams;
  coder.num_out_streams = out_streams;
  return coder;
}

void RequirePackedFormula(const Folder& folder, const sevenzcpp::core::FolderGraph& graph) {
  Require(graph.packed_inputs.size() == folder.TotalInputStreams() - folder.bind_pairs.size(),
          "packed stream count must equal total inputs minus bind pairs");
}

void RunScenarioSingleCoder() {
  sevenzcpp::tests::Log("scenario: single coder without bind pairs");
  Folder folder;
  folder.coders.push_back(MakeCoder(0x21));
  const auto graph = ResolveFolderGraph(folder, 0);
  Require(graph.final_output == 0, "single coder output must be final");
  Require(graph.packed_inputs.size() == 1 && graph.packed_inputs[0] == 0, "single coder input must be packed");
  RequirePackedFormula(folder, graph);
}

void RunScenarioFilterChain() {
  sevenzcpp::tests::Log("scenario: filter fed by compressor");
  // Coder 0 is a delta filter whose input comes from coder 1 (LZMA) output.
  Folder folder;
  folder.coders.push_back(MakeCoder(0x03));
  folder.coders.push_back(MakeCoder(0x21));
  folder.bind_pairs.push_back(BindPair{0, 1});
  const auto graph = ResolveFolderGraph(folder, 3);
  sevenzcpp::tests::LogKV("final_output", graph.final_output);
  Require(graph.final_output == 0, "filter output must be final");
  Require(graph.packed_inputs.size() == 1 && graph.packed_inputs[0] == 1, "compressor input must be packed");
  Require(graph.CoderForOutStream(1) == 1, "output 1 belongs to coder 1");
  Require(!graph.PackedPosition(0).has_value(), "bound input must not be packed");
  RequirePackedFormula(folder, graph);
}

void RunScenarioMultiInputCoder() {
  sevenzcpp::tests::Log("scenario: four-input coder with three feeding compressors");
  // BCJ2-style layout: coder 0 takes four inputs, three of them from compressors.
  Folder folder;
  folder.coders.push_back(MakeCoder(0x1B, 4, 1));
  folder.coders.push_back(MakeCoder(0x21));
  folder.coders.push_back(MakeCoder(0x21));
  folder.coders.push_back(MakeCoder(0x21));
  folder.bind_pairs = {BindPair{0, 1}, BindPair{1, 2}, BindPair{2, 3}};
  folder.packed_streams = {3, 4, 5, 6};
  const auto graph = ResolveFolderGraph(folder, 0);
  Require(graph.total_in_streams == 7 && graph.total_out_streams == 4, "stream totals mismatch");
  Require(graph.final_output == 0, "multi-input coder output must be final");
  Require(graph.packed_inputs == std::vector<std::uint64_t>({3, 4, 5, 6}), "packed order must follow header");
  Require(graph.PackedPosition(5) == 2U, "packed position lookup mismatch");
  RequirePackedFormula(folder, graph);

  Folder implicit = folder;
  implicit.packed_streams.clear();
  ExpectThrow<StructuralError>("implicit packed list with four packed inputs",
                               [&]() { (void)ResolveFolderGraph(implicit, 0); },
                               "lists none");
}

void RunScenarioRejectedTopologies() {
  sevenzcpp::tests::Log("scenario: rejected topologies");

  ExpectThrow<StructuralError>("zero coders", []() { (void)ResolveFolderGraph(Folder{}, 4); }, "folder 4: folder has no coders");

  Folder two_finals;
  two_finals.coders = {MakeCoder(0x00), MakeCoder(0x00)};
  two_finals.packed_streams = {0, 1};
  ExpectThrow<StructuralError>("two final outputs", [&]() { (void)ResolveFolderGraph(two_finals, 0); },
                               "more than one unbound output");

  Folder no_final;
  no_final.coders = {MakeCoder(0x00, 2, 1), MakeCoder(0x00)};
  no_final.bind_pairs = {BindPair{0, 1}, BindPair{2, 0}};
  no_final.packed_streams = {1};
  ExpectThrow<StructuralError>("no final output", [&]() { (void)ResolveFolderGraph(no_final, 0); },
                               "no unbound output");

  Folder out_of_range;
  out_of_range.coders = {MakeCoder(0x03), MakeCoder(0x21)};
  out_of_range.bind_pairs = {BindPair{0, 7}};
  ExpectThrow<StructuralError>("bind pair out of range", [&]() { (void)ResolveFolderGraph(out_of_range, 0); },
                               "output index 7 out of range");

  Folder double_bound;
  double_bound.coders = {MakeCoder(0x03, 2, 1), MakeCoder(0x21), MakeCoder(0x21)};
  double_bound.bind_pairs = {BindPair{0, 1}, BindPair{0, 2}};
  ExpectThrow<StructuralError>("input bound twice", [&]() { (void)ResolveFolderGraph(double_bound, 0); },
                               "bound twice");

  Folder bad_packed;
  bad_packed.coders = {MakeCoder(0x03), MakeCoder(0x21)};
  bad_packed.bind_pairs = {BindPair{0, 1}};
  bad_packed.packed_streams = {0};
  ExpectThrow<StructuralError>("bound input listed as packed", [&]() { (void)ResolveFolderGraph(bad_packed, 0); },
                               "invalid packed stream index 0");

  Folder cycle;
  cycle.coders = {MakeCoder(0x00), MakeCoder(0x00, 2, 1), MakeCoder(0x00)};
  // Coder 1 and coder 2 feed each other; coder 0 stays final.
  cycle.bind_pairs = {BindPair{1, 2}, BindPair{3, 1}};
  cycle.packed_streams = {0, 2};
  ExpectThrow<StructuralError>("cycle through bind pairs", [&]() { (void)ResolveFolderGraph(cycle, 0); }, "cycle");

  Folder wrong_sizes;
  wrong_sizes.coders = {MakeCoder(0x03), MakeCoder(0x21)};
  wrong_sizes.bind_pairs = {BindPair{0, 1}};
  wrong_sizes.unpack_sizes = {10};
  ExpectThrow<StructuralError>("unpack sizes per output", [&]() { (void)ResolveFolderGraph(wrong_sizes, 0); },
                               "1 unpack sizes for 2 output streams");
}

void RunScenarioDeclaredSize() {
  sevenzcpp::tests::Log("scenario: declared final output size");
  Folder folder;
  folder.coders = {MakeCoder(0x03), MakeCoder(0x21)};
  folder.bind_pairs = {BindPair{0, 1}};
  folder.unpack_sizes = {60, 60};
  const auto graph = ResolveFolderGraph(folder, 0);
  Require(sevenzcpp::core::DeclaredUnpackSize(folder, graph) == 60U, "declared size mismatch");
  folder.unpack_sizes.clear();
  Require(!sevenzcpp::core::DeclaredUnpackSize(folder, graph).has_value(), "missing sizes must stay unknown");
}

}  // namespace

int main() {
  try {
    sevenzcpp::tests::Log("folder_graph_test: start");
    RunScenarioSingleCoder();
    RunScenarioFilterChain();
    RunScenarioMultiInputCoder();
    RunScenarioRejectedTopologies();
    RunScenarioDeclaredSize();
    sevenzcpp::tests::Log("folder_graph_test: finished");
    return EXIT_SUCCESS;
  } catch (const std::exception& ex) {
    sevenzcpp::tests::LogError(ex.what());
    return EXIT_FAILURE;
  }
}
