//! # CRC32C Checksums
//!
//! CRC32C (Castagnoli polynomial) used to stamp emitted modules with a
//! checksum of the corpus they were generated from, so a stale generated
//! module can be told apart from a fresh one.
//!
//! ```cpp
//! uint32_t sum = exprc::crc32c(corpus_text);
//! std::string tag = exprc::crc32c_hex(corpus_text);
//! ```

#ifndef EXPRC_COMMON_CRC32C_HPP
#define EXPRC_COMMON_CRC32C_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace exprc {

namespace detail {

/// Reflected Castagnoli polynomial.
inline constexpr uint32_t CRC32C_POLY = 0x82F63B78;

constexpr auto make_crc32c_table() -> std::array<uint32_t, 256> {
    std::array<uint32_t, 256> table{};
    for (uint32_t i = 0; i < 256; ++i) {
        uint32_t crc = i;
        for (int bit = 0; bit < 8; ++bit) {
            crc = (crc & 1) ? (crc >> 1) ^ CRC32C_POLY : crc >> 1;
        }
        table[i] = crc;
    }
    return table;
}

inline constexpr std::array<uint32_t, 256> CRC32C_TABLE = make_crc32c_table();

} // namespace detail

/// Computes the CRC32C of a byte range.
[[nodiscard]] inline uint32_t crc32c(const void* data, size_t len) noexcept {
    const auto* bytes = static_cast<const uint8_t*>(data);
    uint32_t crc = 0xFFFFFFFF;
    for (size_t i = 0; i < len; ++i) {
        crc = detail::CRC32C_TABLE[(crc ^ bytes[i]) & 0xFF] ^ (crc >> 8);
    }
    return crc ^ 0xFFFFFFFF;
}

[[nodiscard]] inline uint32_t crc32c(std::string_view str) noexcept {
    return crc32c(str.data(), str.size());
}

/// 16 hex chars: the CRC32C in the high half, the input length in the low half.
[[nodiscard]] inline std::string crc32c_hex(std::string_view str) {
    uint64_t combined =
        (static_cast<uint64_t>(crc32c(str)) << 32) | static_cast<uint64_t>(str.size() & 0xFFFFFFFF);

    static constexpr char HEX_CHARS[] = "0123456789abcdef";
    std::string hex(16, '0');
    for (int i = 15; i >= 0; --i) {
        hex[static_cast<size_t>(i)] = HEX_CHARS[combined & 0xF];
        combined >>= 4;
    }
    return hex;
}

} // namespace exprc

#endif // EXPRC_COMMON_CRC32C_HPP
