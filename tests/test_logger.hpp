#pragma once

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <functional>
#include <iostream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace sevenzcpp::tests {

inline bool IsTruthy(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
  return value == "1" || value == "true" || value == "yes" || value == "on";
}

inline bool LoggingEnabled() {
  static const bool enabled = []() {
#if defined(NDEBUG)
    constexpr bool kDefault = false;
#else
    constexpr bool kDefault = true;
#endif
    const char* env = std::getenv("SEVENZCPP_TEST_LOG");
    if (env == nullptr) {
      return kDefault;
    }
    return IsTruthy(env);
  }();
  return enabled;
}

inline void Log(std::string_view message) {
  if (!LoggingEnabled()) {
    return;
  }
  std::cout << "[sevenzcpp-test] " << message << "\n";
}

inline void LogError(std::string_view message) {
  // Failures are always printed so CTest output explains a red test.
  std::cerr << "[sevenzcpp-test] ERROR: " << message << "\n";
}

inline void LogKV(std::string_view key, std::string_view value) {
  if (!LoggingEnabled()) {
    return;
  }
  std::cout << "[sevenzcpp-test] " << key << "=" << value << "\n";
}

inline void LogKV(std::string_view key, const std::string& value) {
  LogKV(key, std::string_view(value));
}

inline void LogKV(std::string_view key, const char* value) {
  LogKV(key, std::string_view(value != nullptr ? value : "(null)"));
}

inline void LogKV(std::string_view key, std::uint64_t value) {
  LogKV(key, std::to_string(value));
}

inline void LogKV(std::string_view key, bool value) {
  LogKV(key, std::string_view(value ? "true" : "false"));
}

inline void LogCrc(std::string_view key, std::uint32_t value) {
  static constexpr char kDigits[] = "0123456789abcdef";
  std::string hex = "0x00000000";
  for (std::size_t i = 0; i < 8; ++i) {
    hex[hex.size() - 1 - i] = kDigits[(value >> (4U * i)) & 0xFU];
  }
  LogKV(key, hex);
}

inline void Require(bool condition, const std::string& message) {
  if (!condition) {
    throw std::runtime_error(message);
  }
}

// Runs `fn` and requires it to throw `Expected` whose message contains `expected_substring`.
template <typename Expected>
void ExpectThrow(const std::string& name, const std::function<void()>& fn, const std::string& expected_substring) {
  try {
    fn();
  } catch (const Expected& ex) {
    const std::string message = ex.what();
    if (message.find(expected_substring) == std::string::npos) {
      throw std::runtime_error("unexpected error for " + name + ": " + message);
    }
    Log("expected exception in " + name + ": " + message);
    return;
  }
  throw std::runtime_error("expected throw: " + name);
}

inline std::vector<std::byte> BytesOf(std::string_view text) {
  std::vector<std::byte> out;
  out.reserve(text.size());
  for (const char ch : text) {
    out.push_back(static_cast<std::byte>(static_cast<unsigned char>(ch)));
  }
  return out;
}

}  // namespace sevenzcpp::tests
