#include "sevenzcpp/stream_map.hpp"

#include "folder_graph.hpp"
#include "sevenzcpp/errors.hpp"

#include <limits>
#include <string>

namespace sevenzcpp {
namespace {

std::uint64_t CheckedAdd(std::uint64_t lhs, std::uint64_t rhs, const char* context) {
  if (rhs > std::numeric_limits<std::uint64_t>::max() - lhs) {
    throw StructuralError(std::string(context) + " overflows");
  }
  return lhs + rhs;
}

struct SubstreamSlot {
  std::uint64_t size = 0;
  std::optional<std::uint32_t> expected_crc;
};

void ValidatePackCrcs(const Archive& archive) {
  if (!archive.pack_crcs_defined.empty() && archive.pack_crcs_defined.size() != archive.pack_sizes.size()) {
    throw StructuralError("pack CRC presence bits cover " + std::to_string(archive.pack_crcs_defined.size()) +
                          " streams but " + std::to_string(archive.pack_sizes.size()) + " pack streams exist");
  }
  if (!archive.pack_crcs_defined.empty() && archive.pack_crcs.size() != archive.pack_sizes.size()) {
    throw StructuralError("pack CRC values are not aligned with pack sizes");
  }
}

// Pack streams are claimed by folders in a single left-to-right scan.
void AssignPackRanges(const Archive& archive,
                      const std::vector<core::FolderGraph>& graphs,
                      StreamMap& map) {
  map.pack_stream_offsets.reserve(archive.pack_sizes.size());
  std::uint64_t offset = archive.pack_pos;
  for (const auto size : archive.pack_sizes) {
    map.pack_stream_offsets.push_back(offset);
    offset = CheckedAdd(offset, size, "pack region end");
  }
  map.pack_end = offset;

  std::uint64_t next_pack_stream = 0;
  for (std::size_t i = 0; i < archive.folders.size(); ++i) {
    const auto count = static_cast<std::uint64_t>(graphs[i].packed_inputs.size());
    const auto remaining = archive.pack_sizes.size() - next_pack_stream;
    if (count > remaining) {
      throw StructuralError("folder " + std::to_string(i) + " needs " + std::to_string(count) +
                            " pack streams but only " + std::to_string(remaining) + " remain");
    }
    auto& folder = map.folders[i];
    folder.first_pack_stream_index = next_pack_stream;
    folder.pack_stream_count = count;
    folder.pack_offset = next_pack_stream < map.pack_stream_offsets.size()
                             ? map.pack_stream_offsets[next_pack_stream]
                             : map.pack_end;
    for (std::uint64_t j = 0; j < count; ++j) {
      folder.packed_length = CheckedAdd(folder.packed_length, archive.pack_sizes[next_pack_stream + j],
                                        "folder packed length");
    }
    next_pack_stream += count;
  }
  if (next_pack_stream != archive.pack_sizes.size()) {
    throw StructuralError(std::to_string(archive.pack_sizes.size() - next_pack_stream) +
                          " pack streams are not claimed by any folder");
  }
}

// Sizes folders and lists every substream with its resolved expected CRC.
std::vector<SubstreamSlot> ResolveSubstreams(const Archive& archive,
                                             const std::vector<core::FolderGraph>& graphs,
                                             StreamMap& map) {
  std::vector<SubstreamSlot> slots;
  const auto& info = archive.sub_streams_info;
  if (info.has_value() && info->folder_count() != archive.folders.size()) {
    throw StructuralError("substream info covers " + std::to_string(info->folder_count()) + " folders but archive has " +
                          std::to_string(archive.folders.size()));
  }

  std::uint64_t next_substream = 0;
  for (std::size_t i = 0; i < archive.folders.size(); ++i) {
    const auto& folder = archive.folders[i];
    const auto declared = core::DeclaredUnpackSize(folder, graphs[i]);
    auto& out = map.folders[i];
    out.first_substream_index = next_substream;

    if (!info.has_value()) {
      if (!declared.has_value()) {
        throw StructuralError("folder " + std::to_string(i) + " declares no output size");
      }
      out.substream_count = 1;
      out.unpack_length = *declared;
      slots.push_back({*declared, folder.unpack_crc});
      ++next_substream;
      continue;
    }

    const auto count = info->substreams_per_folder()[i];
    out.substream_count = count;
    if (count == 0) {
      out.unpack_length = declared.value_or(0);
      continue;
    }

    std::uint64_t sum = 0;
    for (std::uint64_t j = 0; j < count; ++j) {
      const auto index = static_cast<std::size_t>(next_substream + j);
      const auto size = info->unpack_sizes()[index];
      sum = CheckedAdd(sum, size, "folder substream sizes");
      auto crc = info->Crc(index);
      if (!crc.has_value() && count == 1) {
        crc = folder.unpack_crc;
      }
      slots.push_back({size, crc});
    }
    if (declared.has_value() && sum != *declared) {
      throw StructuralError("folder " + std::to_string(i) + " substreams total " + std::to_string(sum) +
                            " bytes but the folder unpacks to " + std::to_string(*declared));
    }
    out.unpack_length = sum;
    next_substream += count;
  }
  return slots;
}

void BuildOffsetTable(const Archive& archive, const std::vector<SubstreamSlot>& slots, StreamMap& map) {
  map.file_folder_index.assign(archive.files.size(), std::nullopt);
  map.file_stream_index.assign(archive.files.size(), std::nullopt);

  std::size_t folder_index = 0;
  std::uint64_t next_in_folder = 0;
  std::uint64_t cursor = 0;
  std::uint64_t next_substream = 0;
  for (std::size_t i = 0; i < archive.files.size(); ++i) {
    if (!archive.files[i].HasStream()) {
      continue;
    }
    if (next_in_folder == 0) {
      while (folder_index < map.folders.size() && map.folders[folder_index].substream_count == 0) {
        ++folder_index;
      }
      if (folder_index >= map.folders.size()) {
        throw StructuralError("file " + std::to_string(i) + " has content but no substream is left for it");
      }
      map.folders[folder_index].first_file_index = i;
    }

    const auto& slot = slots[static_cast<std::size_t>(next_substream)];
    FileStreamInfo file;
    file.file_index = i;
    file.folder_index = folder_index;
    file.substream_index = next_substream;
    file.offset = cursor;
    file.size = slot.size;
    file.expected_crc = slot.expected_crc;
    map.file_folder_index[i] = folder_index;
    map.file_stream_index[i] = map.files.size();
    map.files.push_back(file);

    cursor += slot.size;
    ++next_substream;
    ++next_in_folder;
    if (next_in_folder >= map.folders[folder_index].substream_count) {
      ++folder_index;
      next_in_folder = 0;
      cursor = 0;
    }
  }

  if (next_substream != slots.size()) {
    throw StructuralError(std::to_string(map.files.size()) + " files have content but the archive declares " +
                          std::to_string(slots.size()) + " substreams");
  }
}

}  // namespace

const FileStreamInfo* StreamMap::FindFile(std::size_t file_index) const {
  if (file_index >= file_stream_index.size() || !file_stream_index[file_index].has_value()) {
    return nullptr;
  }
  return &files[*file_stream_index[file_index]];
}

StreamMap DeriveStreamMap(const Archive& archive) {
  ValidatePackCrcs(archive);

  std::vector<core::FolderGraph> graphs;
  graphs.reserve(archive.folders.size());
  for (std::size_t i = 0; i < archive.folders.size(); ++i) {
    graphs.push_back(core::ResolveFolderGraph(archive.folders[i], i));
  }

  StreamMap map;
  map.folders.resize(archive.folders.size());
  AssignPackRanges(archive, graphs, map);
  const auto slots = ResolveSubstreams(archive, graphs, map);
  BuildOffsetTable(archive, slots, map);
  return map;
}

}  // namespace sevenzcpp
