#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace lexrisk::core {

// Sha256 is an incremental FIPS 180-4 SHA-256 hasher.
// Feed bytes with update() any number of times, then call hex_digest() once.
// Calling update() after hex_digest() is a logic error; reset() starts a new digest.
class Sha256 {
 public:
  Sha256() noexcept;

  void update(std::string_view bytes) noexcept;

  // Finalizes the digest and returns it as 64 lower-case hex characters.
  [[nodiscard]] std::string hex_digest();

  void reset() noexcept;

 private:
  void compress(const std::uint8_t* block) noexcept;

  std::array<std::uint32_t, 8> state_{};
  std::array<std::uint8_t, 64> buffer_{};
  std::size_t buffered_{0};
  std::uint64_t total_bytes_{0};
};

// sha256_hex returns the SHA-256 digest of input as a lower-case hex string.
[[nodiscard]] std::string sha256_hex(std::string_view input);

}  // namespace lexrisk::core
