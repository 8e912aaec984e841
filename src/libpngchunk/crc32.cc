#include <pngchunk/crc32.hh>

#include <algorithm>
#include <limits>

#include <zlib.h>

namespace pngchunk {

    std::uint32_t crc32_update(std::uint32_t crc, const void* data, std::size_t size) noexcept {
        auto* p = static_cast<const Bytef*>(data);
        uLong value = crc;

        // zlib takes a uInt length; feed larger buffers in pieces
        constexpr std::size_t max_step = std::numeric_limits<uInt>::max();
        while (size > 0) {
            const std::size_t step = std::min(size, max_step);
            value = ::crc32(value, p, static_cast<uInt>(step));
            p += step;
            size -= step;
        }
        return static_cast<std::uint32_t>(value);
    }

} // namespace pngchunk
