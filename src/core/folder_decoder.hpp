#pragma once

#include "sevenzcpp/archive.hpp"
#include "sevenzcpp/decoder.hpp"
#include "sevenzcpp/pack_source.hpp"
#include "sevenzcpp/stream_map.hpp"
#include "sevenzcpp/types.hpp"

#include <cstddef>
#include <vector>

namespace sevenzcpp::core {

// Reads the folder's pack streams and runs its coder graph. Returns exactly
// `unpack_length` bytes of final output. Every failure is a DecodeError.
[[nodiscard]] std::vector<std::byte> DecodeFolderOutput(const Archive& archive,
                                                        const StreamMap& stream_map,
                                                        std::size_t folder_index,
                                                        const PackSource& source,
                                                        const Decoder& decoder,
                                                        const ReaderConfig& config);

}  // namespace sevenzcpp::core
