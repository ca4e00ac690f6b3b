#pragma once

#include <cstddef>
#include <cstdint>
#include <cstring>

namespace ckpt {

// ============================================================
// Deterministic digests shared by config hashing, seed derivation
// and run signatures. Byte-order follows the host; signatures are
// only compared between runs of the same build.
// ============================================================

inline std::uint32_t fnv1a32_begin() { return 2166136261u; }

inline std::uint32_t fnv1a32_update(std::uint32_t h, const void* data, std::size_t len) {
    const std::uint8_t* p = reinterpret_cast<const std::uint8_t*>(data);
    for (std::size_t i = 0; i < len; ++i) {
        h ^= static_cast<std::uint32_t>(p[i]);
        h *= 16777619u;
    }
    return h;
}

inline std::uint32_t fnv1a32_add_u32(std::uint32_t h, std::uint32_t v) {
    return fnv1a32_update(h, &v, sizeof(v));
}

inline std::uint32_t fnv1a32_add_i32(std::uint32_t h, std::int32_t v) {
    return fnv1a32_update(h, &v, sizeof(v));
}

inline std::uint32_t fnv1a32_add_f64(std::uint32_t h, double v) {
    std::uint64_t bits = 0;
    static_assert(sizeof(bits) == sizeof(v), "unexpected double size");
    std::memcpy(&bits, &v, sizeof(v));
    return fnv1a32_update(h, &bits, sizeof(bits));
}

inline std::uint32_t fnv1a32_add_f32(std::uint32_t h, float v) {
    std::uint32_t bits = 0;
    static_assert(sizeof(bits) == sizeof(v), "unexpected float size");
    std::memcpy(&bits, &v, sizeof(v));
    return fnv1a32_update(h, &bits, sizeof(bits));
}

inline std::uint32_t fnv1a32_text(const char* s) {
    if (!s) return 0;
    return fnv1a32_update(fnv1a32_begin(), s, std::strlen(s));
}

// CRC-32 (IEEE 802.3, reflected). Table is built on first use.
std::uint32_t crc32_update(std::uint32_t crc, const void* data, std::size_t len);

inline std::uint32_t crc32_add_f32(std::uint32_t crc, float v) {
    std::uint32_t bits = 0;
    std::memcpy(&bits, &v, sizeof(v));
    return crc32_update(crc, &bits, sizeof(bits));
}

inline std::uint32_t crc32_add_u32(std::uint32_t crc, std::uint32_t v) {
    return crc32_update(crc, &v, sizeof(v));
}

} // namespace ckpt
