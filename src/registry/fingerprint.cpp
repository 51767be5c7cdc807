#include "registry/fingerprint.hpp"

#include "common/crc32c.hpp"

namespace exprc::registry {

namespace {

std::string hex64(uint64_t val) {
    static constexpr char HEX[] = "0123456789abcdef";
    std::string out(16, '0');
    for (int i = 15; i >= 0; --i) {
        out[static_cast<size_t>(i)] = HEX[val & 0xF];
        val >>= 4;
    }
    return out;
}

} // namespace

std::string Fingerprint::to_hex() const {
    return hex64(high) + hex64(low);
}

Fingerprint fingerprint_bytes(const void* data, size_t len) {
    if (!data || len == 0) {
        return {};
    }

    const auto* bytes = static_cast<const uint8_t*>(data);
    size_t half = len / 2;

    // High: CRC32C of everything, then of the first half mixed with the length
    uint32_t crc_all = exprc::crc32c(bytes, len);
    uint32_t crc_head = exprc::crc32c(bytes, half > 0 ? half : len);
    uint64_t hi = (static_cast<uint64_t>(crc_all) << 32) |
                  static_cast<uint64_t>(crc_head ^ static_cast<uint32_t>(len));

    // Low: CRC32C of the second half combined with a salt
    static constexpr uint32_t SALT = 0x9E3779B9; // golden ratio
    uint32_t crc_tail = exprc::crc32c(bytes + half, len - half);
    uint64_t lo = (static_cast<uint64_t>(crc_tail) << 32) |
                  static_cast<uint64_t>(SALT ^ static_cast<uint32_t>(len >> 1));

    return {hi, lo};
}

Fingerprint fingerprint_string(const std::string& str) {
    return fingerprint_bytes(str.data(), str.size());
}

Fingerprint fingerprint_combine(Fingerprint a, Fingerprint b) {
    uint64_t hi = a.high ^ (b.high * 0x517CC1B727220A95ULL + 1);
    uint64_t lo = a.low ^ (b.low * 0x6C62272E07BB0142ULL + 1);
    return {hi, lo};
}

Fingerprint spec_fingerprint(ast::ExpressionContext context, const std::string& serialized_tree) {
    return fingerprint_combine(fingerprint_string(std::string(ast::context_name(context))),
                               fingerprint_string(serialized_tree));
}

std::string function_name(ast::ExpressionContext context, Fingerprint fingerprint) {
    return std::string(ast::context_prefix(context)) + hex64(fingerprint.high);
}

} // namespace exprc::registry
