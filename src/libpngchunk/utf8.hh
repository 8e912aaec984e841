#pragma once

#include <cstddef>
#include <cstdint>

namespace pngchunk {

    /**
     * @brief Check that a byte sequence is well-formed UTF-8
     *
     * Rejects overlong forms, surrogates (U+D800..U+DFFF) and code points
     * above U+10FFFF.
     *
     * @return Offset of the first invalid byte, or size if the whole input is valid
     */
    std::size_t utf8_invalid_offset(const std::uint8_t* data, std::size_t size) noexcept;

    inline bool is_valid_utf8(const std::uint8_t* data, std::size_t size) noexcept {
        return utf8_invalid_offset(data, size) == size;
    }

} // namespace pngchunk
