/**
 * @file endian.hh
 * @brief Host byte order detection and big-endian field access
 */

#pragma once

#include <cstdint>
#include <cstring>

#include <pngchunk/pngchunk_config.h>

namespace pngchunk {
    // Platform endianness detection using CMake-generated config
#if LIBPNGCHUNK_BIG_ENDIAN
    constexpr bool is_big_endian = true;
#else
    constexpr bool is_big_endian = false;
#endif

    inline std::uint32_t swap32(std::uint32_t x) {
        return ((x << 24) | ((x << 8) & 0x00FF0000) |
                ((x >> 8) & 0x0000FF00) | (x >> 24));
    }

    // Conditional byte swapping based on platform
    inline std::uint32_t swap32be(std::uint32_t x) {
        return is_big_endian ? x : swap32(x);
    }

    /**
     * @brief Read a big-endian 32-bit unsigned value
     * @param src Pointer to at least 4 readable bytes (no alignment required)
     */
    inline std::uint32_t load_be32(const void* src) {
        std::uint32_t value;
        std::memcpy(&value, src, 4);
        return swap32be(value);
    }

    /**
     * @brief Write a 32-bit unsigned value in big-endian order
     * @param dst Pointer to at least 4 writable bytes (no alignment required)
     */
    inline void store_be32(void* dst, std::uint32_t value) {
        value = swap32be(value);
        std::memcpy(dst, &value, 4);
    }
}
