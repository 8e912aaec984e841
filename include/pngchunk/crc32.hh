/**
 * @file crc32.hh
 * @brief CRC-32 (IEEE 802.3 polynomial, as used by PNG and zlib)
 */

#pragma once

#include <cstddef>
#include <cstdint>

#include <pngchunk/export_pngchunk.h>

namespace pngchunk {

    /**
     * @brief Continue a running CRC-32 over more bytes
     * @param crc Value returned by a previous call, or 0 to start
     * @param data Bytes to add
     * @param size Number of bytes
     */
    PNGCHUNK_EXPORT std::uint32_t crc32_update(std::uint32_t crc, const void* data, std::size_t size) noexcept;

    inline std::uint32_t crc32(const void* data, std::size_t size) noexcept {
        return crc32_update(0, data, size);
    }

} // namespace pngchunk
