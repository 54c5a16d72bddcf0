#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace polywatch::util {

inline constexpr std::uint64_t kFnv64Offset = 0xcbf29ce484222325ULL;
inline constexpr std::uint64_t kFnv64Prime = 0x100000001b3ULL;

// Streaming FNV-1a 64. Feeding "ab" then "c" equals feeding "abc".
class Fnv1a64 {
public:
  constexpr auto update(std::string_view bytes) noexcept -> Fnv1a64& {
    for (unsigned char c : bytes) {
      state_ ^= c;
      state_ *= kFnv64Prime;
    }
    return *this;
  }

  [[nodiscard]] constexpr auto digest() const noexcept -> std::uint64_t {
    return state_;
  }

  constexpr auto reset() noexcept -> void { state_ = kFnv64Offset; }

private:
  std::uint64_t state_{kFnv64Offset};
};

[[nodiscard]] constexpr auto fnv1a64(std::string_view bytes) noexcept
    -> std::uint64_t {
  return Fnv1a64{}.update(bytes).digest();
}

}  // namespace polywatch::util
