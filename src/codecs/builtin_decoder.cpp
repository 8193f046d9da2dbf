#include "sevenzcpp/decoder.hpp"

#include <bzlib.h>
#include <lzma.h>
#include <zlib.h>

#include <algorithm>
#include <cstdlib>
#include <limits>
#include <stdexcept>
#include <string>

namespace sevenzcpp {
namespace {

constexpr std::size_t kOutputChunk = 1U << 16U;

std::runtime_error CoderError(const std::string& message) {
  return std::runtime_error("builtin decoder: " + message);
}

std::span<const std::byte> SingleInput(std::span<const std::span<const std::byte>> inputs, const char* method) {
  if (inputs.size() != 1) {
    throw CoderError(std::string(method) + " expects one input stream, got " + std::to_string(inputs.size()));
  }
  return inputs[0];
}

// Size of the next output window: bounded by the declared size when known.
std::size_t NextWindow(std::size_t produced, std::optional<std::uint64_t> expected_size) {
  if (!expected_size.has_value()) {
    return kOutputChunk;
  }
  return static_cast<std::size_t>(std::min<std::uint64_t>(kOutputChunk, *expected_size - produced));
}

bool Finished(std::size_t produced, std::optional<std::uint64_t> expected_size) {
  return expected_size.has_value() && produced >= *expected_size;
}

std::string HexMethodId(std::span<const std::byte> method_id) {
  static constexpr char kDigits[] = "0123456789abcdef";
  std::string hex;
  for (const auto byte : method_id) {
    const auto value = std::to_integer<std::uint8_t>(byte);
    hex.push_back(kDigits[value >> 4U]);
    hex.push_back(kDigits[value & 0xFU]);
  }
  return hex;
}

std::vector<std::byte> DecodeCopy(std::span<const std::byte> input) {
  return std::vector<std::byte>(input.begin(), input.end());
}

std::vector<std::byte> DecodeDelta(std::span<const std::byte> properties, std::span<const std::byte> input) {
  if (properties.size() != 1) {
    throw CoderError("delta properties must be exactly one byte");
  }
  const std::size_t distance = static_cast<std::size_t>(std::to_integer<std::uint8_t>(properties[0])) + 1U;
  std::vector<std::byte> out(input.size());
  for (std::size_t i = 0; i < input.size(); ++i) {
    const auto previous = i >= distance ? std::to_integer<std::uint8_t>(out[i - distance]) : std::uint8_t{0};
    out[i] = static_cast<std::byte>(static_cast<std::uint8_t>(std::to_integer<std::uint8_t>(input[i]) + previous));
  }
  return out;
}

const char* LzmaErrorText(lzma_ret ret) {
  switch (ret) {
    case LZMA_MEM_ERROR:
      return "out of memory";
    case LZMA_MEMLIMIT_ERROR:
      return "memory limit reached";
    case LZMA_FORMAT_ERROR:
      return "format not recognized";
    case LZMA_OPTIONS_ERROR:
      return "unsupported options";
    case LZMA_DATA_ERROR:
      return "corrupt data";
    case LZMA_BUF_ERROR:
      return "truncated input";
    default:
      return "internal error";
  }
}

class LzmaStreamGuard {
 public:
  explicit LzmaStreamGuard(lzma_stream& stream) : stream_(stream) {}
  LzmaStreamGuard(const LzmaStreamGuard&) = delete;
  LzmaStreamGuard& operator=(const LzmaStreamGuard&) = delete;
  ~LzmaStreamGuard() { lzma_end(&stream_); }

 private:
  lzma_stream& stream_;
};

// 7z stores LZMA and LZMA2 without a container, so both go through the raw decoder
// with properties decoded from the coder's property blob.
std::vector<std::byte> DecodeLzmaRaw(lzma_vli filter_id,
                                     std::span<const std::byte> properties,
                                     std::span<const std::byte> input,
                                     std::optional<std::uint64_t> expected_size) {
  lzma_filter filters[2];
  filters[0].id = filter_id;
  filters[0].options = nullptr;
  filters[1].id = LZMA_VLI_UNKNOWN;
  filters[1].options = nullptr;

  const auto props_ret = lzma_properties_decode(&filters[0], nullptr,
                                                reinterpret_cast<const std::uint8_t*>(properties.data()),
                                                properties.size());
  if (props_ret != LZMA_OK) {
    throw CoderError(std::string("invalid LZMA properties: ") + LzmaErrorText(props_ret));
  }

  lzma_stream stream = LZMA_STREAM_INIT;
  const auto init_ret = lzma_raw_decoder(&stream, filters);
  std::free(filters[0].options);
  if (init_ret != LZMA_OK) {
    throw CoderError(std::string("lzma_raw_decoder failed: ") + LzmaErrorText(init_ret));
  }
  LzmaStreamGuard guard(stream);

  stream.next_in = reinterpret_cast<const std::uint8_t*>(input.data());
  stream.avail_in = input.size();

  std::vector<std::byte> out;
  std::size_t produced = 0;
  while (!Finished(produced, expected_size)) {
    const auto window = NextWindow(produced, expected_size);
    out.resize(produced + window);
    stream.next_out = reinterpret_cast<std::uint8_t*>(out.data() + produced);
    stream.avail_out = window;
    const auto ret = lzma_code(&stream, LZMA_RUN);
    produced += window - stream.avail_out;
    if (ret == LZMA_STREAM_END) {
      break;
    }
    if (ret != LZMA_OK) {
      throw CoderError(std::string("lzma_code failed: ") + LzmaErrorText(ret));
    }
  }
  out.resize(produced);
  return out;
}

class InflateGuard {
 public:
  explicit InflateGuard(z_stream& stream) : stream_(stream) {}
  InflateGuard(const InflateGuard&) = delete;
  InflateGuard& operator=(const InflateGuard&) = delete;
  ~InflateGuard() { inflateEnd(&stream_); }

 private:
  z_stream& stream_;
};

std::vector<std::byte> DecodeDeflate(std::span<const std::byte> input, std::optional<std::uint64_t> expected_size) {
  z_stream stream{};
  if (inflateInit2(&stream, -MAX_WBITS) != Z_OK) {
    throw CoderError(std::string("inflateInit2 failed: ") + (stream.msg != nullptr ? stream.msg : "unknown"));
  }
  InflateGuard guard(stream);

  constexpr std::size_t kMaxInput = std::numeric_limits<uInt>::max();
  std::size_t consumed = 0;
  std::vector<std::byte> out;
  std::size_t produced = 0;
  while (!Finished(produced, expected_size)) {
    if (stream.avail_in == 0 && consumed < input.size()) {
      const auto chunk = std::min(input.size() - consumed, kMaxInput);
      stream.next_in = reinterpret_cast<Bytef*>(const_cast<std::byte*>(input.data() + consumed));
      stream.avail_in = static_cast<uInt>(chunk);
      consumed += chunk;
    }
    const auto window = NextWindow(produced, expected_size);
    out.resize(produced + window);
    stream.next_out = reinterpret_cast<Bytef*>(out.data() + produced);
    stream.avail_out = static_cast<uInt>(window);
    const auto ret = inflate(&stream, Z_NO_FLUSH);
    produced += window - stream.avail_out;
    if (ret == Z_STREAM_END) {
      break;
    }
    if (ret == Z_BUF_ERROR) {
      throw CoderError("truncated deflate stream");
    }
    if (ret != Z_OK) {
      throw CoderError(std::string("inflate failed: ") + (stream.msg != nullptr ? stream.msg : "corrupt data"));
    }
  }
  out.resize(produced);
  return out;
}

class Bzip2Guard {
 public:
  explicit Bzip2Guard(bz_stream& stream) : stream_(stream) {}
  Bzip2Guard(const Bzip2Guard&) = delete;
  Bzip2Guard& operator=(const Bzip2Guard&) = delete;
  ~Bzip2Guard() { BZ2_bzDecompressEnd(&stream_); }

 private:
  bz_stream& stream_;
};

std::vector<std::byte> DecodeBzip2(std::span<const std::byte> input, std::optional<std::uint64_t> expected_size) {
  bz_stream stream{};
  if (BZ2_bzDecompressInit(&stream, 0, 0) != BZ_OK) {
    throw CoderError("BZ2_bzDecompressInit failed");
  }
  Bzip2Guard guard(stream);

  constexpr std::size_t kMaxInput = std::numeric_limits<unsigned int>::max();
  std::size_t consumed = 0;
  std::vector<std::byte> out;
  std::size_t produced = 0;
  while (!Finished(produced, expected_size)) {
    if (stream.avail_in == 0 && consumed < input.size()) {
      const auto chunk = std::min(input.size() - consumed, kMaxInput);
      stream.next_in = reinterpret_cast<char*>(const_cast<std::byte*>(input.data() + consumed));
      stream.avail_in = static_cast<unsigned int>(chunk);
      consumed += chunk;
    }
    const auto window = NextWindow(produced, expected_size);
    out.resize(produced + window);
    stream.next_out = reinterpret_cast<char*>(out.data() + produced);
    stream.avail_out = static_cast<unsigned int>(window);
    const auto ret = BZ2_bzDecompress(&stream);
    const auto step = window - stream.avail_out;
    produced += step;
    if (ret == BZ_STREAM_END) {
      break;
    }
    if (ret != BZ_OK) {
      throw CoderError("BZ2_bzDecompress failed with code " + std::to_string(ret));
    }
    if (step == 0 && stream.avail_in == 0 && consumed >= input.size()) {
      throw CoderError("truncated bzip2 stream");
    }
  }
  out.resize(produced);
  return out;
}

}  // namespace

std::uint64_t MethodIdValue(std::span<const std::byte> method_id) {
  if (method_id.size() > 8) {
    throw CoderError("method id longer than 8 bytes");
  }
  std::uint64_t value = 0;
  for (const auto byte : method_id) {
    value = (value << 8U) | std::to_integer<std::uint8_t>(byte);
  }
  return value;
}

bool BuiltinDecoder::Supports(std::span<const std::byte> method_id) {
  if (method_id.size() > 8) {
    return false;
  }
  switch (static_cast<MethodId>(MethodIdValue(method_id))) {
    case MethodId::kCopy:
    case MethodId::kDelta:
    case MethodId::kLzma2:
    case MethodId::kLzma:
    case MethodId::kDeflate:
    case MethodId::kBzip2:
      return true;
  }
  return false;
}

std::vector<std::byte> BuiltinDecoder::Decode(const Coder& coder,
                                              std::span<const std::span<const std::byte>> inputs,
                                              std::optional<std::uint64_t> expected_size) const {
  switch (static_cast<MethodId>(MethodIdValue(coder.method_id))) {
    case MethodId::kCopy:
      return DecodeCopy(SingleInput(inputs, "copy"));
    case MethodId::kDelta:
      return DecodeDelta(coder.properties, SingleInput(inputs, "delta"));
    case MethodId::kLzma2:
      return DecodeLzmaRaw(LZMA_FILTER_LZMA2, coder.properties, SingleInput(inputs, "lzma2"), expected_size);
    case MethodId::kLzma:
      return DecodeLzmaRaw(LZMA_FILTER_LZMA1, coder.properties, SingleInput(inputs, "lzma"), expected_size);
    case MethodId::kDeflate:
      return DecodeDeflate(SingleInput(inputs, "deflate"), expected_size);
    case MethodId::kBzip2:
      return DecodeBzip2(SingleInput(inputs, "bzip2"), expected_size);
  }
  throw CoderError("unsupported compression method 0x" + HexMethodId(coder.method_id));
}

}  // namespace sevenzcpp
