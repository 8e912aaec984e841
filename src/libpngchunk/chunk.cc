#include <pngchunk/chunk.hh>
#include <pngchunk/crc32.hh>
#include <pngchunk/endian.hh>
#include <pngchunk/exceptions.hh>

#include <algorithm>
#include <iomanip>
#include <sstream>
#include <limits>
#include <ostream>
#include <stdexcept>

#include "utf8.hh"

namespace pngchunk {

    namespace {
        std::uint32_t compute_crc(const chunk_type& type, const std::vector<std::uint8_t>& data) {
            std::uint32_t crc = crc32(type.bytes().data(), 4);
            return crc32_update(crc, data.data(), data.size());
        }

        std::uint32_t checked_length(const std::vector<std::uint8_t>& data) {
            if (data.size() > std::numeric_limits<std::uint32_t>::max()) {
                throw std::length_error(build_error_msg("Chunk payload of ", data.size(),
                                                        " bytes does not fit the 32-bit length field"));
            }
            return static_cast<std::uint32_t>(data.size());
        }
    }

    chunk::chunk(chunk_type type, std::vector<std::uint8_t> data)
        : m_length(checked_length(data))
        , m_type(type)
        , m_data(std::move(data))
        , m_crc(compute_crc(m_type, m_data)) {
    }

    chunk::chunk(chunk_type type, std::vector<std::uint8_t> data, std::uint32_t crc)
        : m_length(static_cast<std::uint32_t>(data.size()))
        , m_type(type)
        , m_data(std::move(data))
        , m_crc(crc) {
    }

    std::optional<chunk> chunk::decode(const std::uint8_t* bytes, std::size_t size, decode_status& status) {
        if (size < overhead) {
            status = {errc::too_short,
                      build_error_msg("Chunk needs at least ", overhead, " bytes, got ", size)};
            return std::nullopt;
        }

        const std::uint32_t declared_length = load_be32(bytes);
        if (size - overhead != declared_length) {
            status = {errc::length_mismatch,
                      build_error_msg("Chunk length field says ", declared_length,
                                      " payload bytes but the buffer holds ", size - overhead)};
            return std::nullopt;
        }

        // Any 4 bytes form a type code, so there is no error to carry here
        const chunk_type type = chunk_type::from_bytes(bytes + 4);
        std::vector<std::uint8_t> data(bytes + 8, bytes + 8 + declared_length);
        const std::uint32_t stored_crc = load_be32(bytes + 8 + declared_length);

        // CRC covers the type code and the payload
        const std::uint32_t actual_crc = crc32(bytes + 4, 4 + static_cast<std::size_t>(declared_length));
        if (actual_crc != stored_crc) {
            std::ostringstream oss;
            oss << "CRC mismatch in chunk " << type << ": stored 0x"
                << std::hex << std::setw(8) << std::setfill('0') << stored_crc
                << ", computed 0x" << std::setw(8) << actual_crc;
            status = {errc::checksum_mismatch, oss.str()};
            return std::nullopt;
        }

        return chunk(type, std::move(data), stored_crc);
    }

    chunk chunk::from_bytes(const void* data, std::size_t size) {
        decode_status status{};
        auto result = decode(static_cast<const std::uint8_t*>(data), size, status);
        if (!result) {
            throw_error(status.kind, status.message);
        }
        return std::move(*result);
    }

    std::optional<chunk> chunk::from_bytes(const void* data, std::size_t size, std::error_code& ec) {
        decode_status status{};
        auto result = decode(static_cast<const std::uint8_t*>(data), size, status);
        if (result) {
            ec.clear();
        } else {
            ec = make_error_code(status.kind);
        }
        return result;
    }

    std::string chunk::data_as_string() const {
        const std::size_t bad = utf8_invalid_offset(m_data.data(), m_data.size());
        if (bad != m_data.size()) {
            std::ostringstream oss;
            oss << "Payload of chunk " << m_type << " is not valid UTF-8 (offset " << bad << ")";
            throw encoding_error(oss.str());
        }
        return {m_data.begin(), m_data.end()};
    }

    std::optional<std::string> chunk::data_as_string(std::error_code& ec) const {
        if (!is_valid_utf8(m_data.data(), m_data.size())) {
            ec = make_error_code(errc::encoding_error);
            return std::nullopt;
        }
        ec.clear();
        return std::string(m_data.begin(), m_data.end());
    }

    void chunk::write_to(std::vector<std::uint8_t>& out) const {
        const std::size_t start = out.size();
        out.resize(start + total_size());
        std::uint8_t* p = out.data() + start;

        store_be32(p, m_length);
        m_type.to_bytes(p + 4);
        std::copy(m_data.begin(), m_data.end(), p + 8);
        store_be32(p + 8 + m_data.size(), m_crc);
    }

    std::vector<std::uint8_t> chunk::as_bytes() const {
        std::vector<std::uint8_t> out;
        out.reserve(total_size());
        write_to(out);
        return out;
    }

    std::ostream& operator<<(std::ostream& os, const chunk& c) {
        auto flags = os.flags();
        auto fill = os.fill();
        os << c.type() << ' ' << c.length() << " bytes crc=0x"
           << std::hex << std::setw(8) << std::setfill('0') << c.crc();
        os.flags(flags);
        os.fill(fill);
        return os;
    }

} // namespace pngchunk
