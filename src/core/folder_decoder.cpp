#include "folder_decoder.hpp"

#include "crc32.hpp"
#include "folder_graph.hpp"
#include "sevenzcpp/errors.hpp"

#include <limits>
#include <optional>
#include <span>
#include <string>
#include <utility>

namespace sevenzcpp::core {
namespace {

std::string MethodName(const Coder& coder) {
  static constexpr char kDigits[] = "0123456789abcdef";
  std::string out;
  for (const auto byte : coder.method_id) {
    const auto value = std::to_integer<std::uint8_t>(byte);
    out.push_back(kDigits[value >> 4U]);
    out.push_back(kDigits[value & 0xFU]);
  }
  return out.empty() ? std::string("(empty)") : out;
}

class FolderPipeline {
 public:
  FolderPipeline(const Folder& folder,
                 FolderGraph graph,
                 std::vector<std::vector<std::byte>> packed,
                 std::uint64_t unpack_length,
                 const Decoder& decoder,
                 std::size_t folder_index)
      : folder_(folder),
        graph_(std::move(graph)),
        packed_(std::move(packed)),
        unpack_length_(unpack_length),
        decoder_(decoder),
        folder_index_(folder_index),
        outputs_(static_cast<std::size_t>(graph_.total_out_streams)) {}

  std::vector<std::byte> Run() {
    auto output = std::move(Evaluate(graph_.final_output));
    if (output.size() < unpack_length_) {
      throw DecodeError(folder_index_, "decoded " + std::to_string(output.size()) + " bytes but " +
                                           std::to_string(unpack_length_) + " were expected");
    }
    output.resize(static_cast<std::size_t>(unpack_length_));
    return output;
  }

 private:
  std::optional<std::uint64_t> ExpectedSize(std::uint64_t out_index) const {
    if (!folder_.unpack_sizes.empty()) {
      return folder_.unpack_sizes[out_index];
    }
    if (out_index == graph_.final_output) {
      return unpack_length_;
    }
    return std::nullopt;
  }

  // Each coder runs once; bind pairs are acyclic after ResolveFolderGraph.
  std::vector<std::byte>& Evaluate(std::uint64_t out_index) {
    auto& slot = outputs_[static_cast<std::size_t>(out_index)];
    if (slot.has_value()) {
      return *slot;
    }

    const auto coder_index = graph_.CoderForOutStream(out_index);
    const auto& coder = folder_.coders[coder_index];
    if (coder.num_out_streams != 1) {
      throw DecodeError(folder_index_, "coder " + std::to_string(coder_index) + " has " +
                                           std::to_string(coder.num_out_streams) +
                                           " output streams, only single-output coders are supported");
    }

    std::vector<std::span<const std::byte>> inputs;
    inputs.reserve(coder.num_in_streams);
    for (std::uint32_t i = 0; i < coder.num_in_streams; ++i) {
      const auto in_index = graph_.coder_in_start[coder_index] + i;
      if (const auto bind = folder_.FindBindPairForInStream(in_index); bind.has_value()) {
        inputs.emplace_back(Evaluate(folder_.bind_pairs[*bind].out_index));
      } else if (const auto position = graph_.PackedPosition(in_index); position.has_value()) {
        inputs.emplace_back(packed_[*position]);
      } else {
        throw DecodeError(folder_index_, "input stream " + std::to_string(in_index) + " has no source");
      }
    }

    const auto expected = ExpectedSize(out_index);
    std::vector<std::byte> produced;
    try {
      produced = decoder_.Decode(coder, inputs, expected);
    } catch (const DecodeError&) {
      throw;
    } catch (const std::exception& ex) {
      throw DecodeError(folder_index_, "coder " + std::to_string(coder_index) + " (method " + MethodName(coder) +
                                           "): " + ex.what());
    }
    if (expected.has_value() && produced.size() != *expected) {
      throw DecodeError(folder_index_, "coder " + std::to_string(coder_index) + " produced " +
                                           std::to_string(produced.size()) + " bytes, declared " +
                                           std::to_string(*expected));
    }
    slot = std::move(produced);
    return *slot;
  }

  const Folder& folder_;
  FolderGraph graph_;
  std::vector<std::vector<std::byte>> packed_;
  std::uint64_t unpack_length_ = 0;
  const Decoder& decoder_;
  std::size_t folder_index_ = 0;
  std::vector<std::optional<std::vector<std::byte>>> outputs_;
};

}  // namespace

std::vector<std::byte> DecodeFolderOutput(const Archive& archive,
                                          const StreamMap& stream_map,
                                          std::size_t folder_index,
                                          const PackSource& source,
                                          const Decoder& decoder,
                                          const ReaderConfig& config) {
  if (folder_index >= archive.folders.size()) {
    throw DecodeError(folder_index, "folder index out of range");
  }
  const auto& folder = archive.folders[folder_index];
  const auto& info = stream_map.folders[folder_index];
  if (info.unpack_length > config.max_folder_unpack_bytes ||
      info.unpack_length > std::numeric_limits<std::size_t>::max()) {
    throw DecodeError(folder_index, "folder unpacks to " + std::to_string(info.unpack_length) +
                                        " bytes, above the configured limit");
  }

  auto graph = ResolveFolderGraph(folder, folder_index);

  std::vector<std::vector<std::byte>> packed;
  packed.reserve(static_cast<std::size_t>(info.pack_stream_count));
  for (std::uint64_t i = 0; i < info.pack_stream_count; ++i) {
    const auto stream_index = static_cast<std::size_t>(info.first_pack_stream_index + i);
    const auto size = archive.pack_sizes[stream_index];
    if (size > std::numeric_limits<std::size_t>::max()) {
      throw DecodeError(folder_index, "pack stream " + std::to_string(stream_index) + " is too large");
    }
    std::vector<std::byte> bytes;
    try {
      bytes = source.Read(stream_map.pack_stream_offsets[stream_index], static_cast<std::size_t>(size));
    } catch (const std::exception& ex) {
      throw DecodeError(folder_index, "pack stream " + std::to_string(stream_index) + ": " + ex.what());
    }
    if (config.verify_pack_crcs) {
      if (const auto expected = archive.PackCrc(stream_index); expected.has_value() && Crc32Digest(bytes) != *expected) {
        throw DecodeError(folder_index, "pack stream " + std::to_string(stream_index) + " CRC mismatch");
      }
    }
    packed.push_back(std::move(bytes));
  }

  FolderPipeline pipeline(folder, std::move(graph), std::move(packed), info.unpack_length, decoder, folder_index);
  return pipeline.Run();
}

}  // namespace sevenzcpp::core
