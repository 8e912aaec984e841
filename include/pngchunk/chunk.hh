/**
 * @file chunk.hh
 * @brief A PNG chunk: type code, payload and CRC-32
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

#include <pngchunk/chunk_type.hh>
#include <pngchunk/exceptions.hh>
#include <pngchunk/export_pngchunk.h>

namespace pngchunk {

    /**
     * @class chunk
     * @brief Immutable chunk value
     *
     * Wire layout (all integers big-endian):
     *
     * | offset | size | field                               |
     * |--------|------|-------------------------------------|
     * | 0      | 4    | payload length N                    |
     * | 4      | 4    | type code                           |
     * | 8      | N    | payload                             |
     * | 8+N    | 4    | CRC-32 over bytes [4, 8+N)          |
     *
     * The CRC always matches the type code and payload: it is computed on
     * construction and cross-checked when decoding.
     */
    class PNGCHUNK_EXPORT chunk {
    public:
        // Length, type and CRC fields around the payload
        static constexpr std::size_t overhead = 12;

        /**
         * @brief Build a chunk and compute its CRC
         * @param type Type code
         * @param data Payload, any content
         * @throws std::length_error if the payload does not fit the 32-bit length field
         */
        chunk(chunk_type type, std::vector<std::uint8_t> data);

        /**
         * @brief Decode one chunk frame
         *
         * The buffer must hold exactly one frame: no leading or trailing bytes.
         *
         * @param data Frame bytes
         * @param size Frame size
         * @throws parse_error errc::too_short, errc::length_mismatch or errc::checksum_mismatch
         */
        static chunk from_bytes(const void* data, std::size_t size);

        static chunk from_bytes(const std::vector<std::uint8_t>& bytes) {
            return from_bytes(bytes.data(), bytes.size());
        }

        /**
         * @brief Non-throwing form of from_bytes()
         * @param ec Set to the failure kind, cleared on success
         * @return The chunk, or std::nullopt on failure
         */
        static std::optional<chunk> from_bytes(const void* data, std::size_t size, std::error_code& ec);

        static std::optional<chunk> from_bytes(const std::vector<std::uint8_t>& bytes, std::error_code& ec) {
            return from_bytes(bytes.data(), bytes.size(), ec);
        }

        [[nodiscard]] std::uint32_t length() const noexcept { return m_length; }
        [[nodiscard]] const chunk_type& type() const noexcept { return m_type; }
        [[nodiscard]] const std::vector<std::uint8_t>& data() const noexcept { return m_data; }
        [[nodiscard]] std::uint32_t crc() const noexcept { return m_crc; }

        // Size of the encoded frame
        [[nodiscard]] std::size_t total_size() const noexcept { return overhead + m_data.size(); }

        /**
         * @brief Payload as UTF-8 text
         * @throws encoding_error if the payload is not valid UTF-8
         */
        [[nodiscard]] std::string data_as_string() const;
        [[nodiscard]] std::optional<std::string> data_as_string(std::error_code& ec) const;

        // Encode as length + type + payload + CRC
        [[nodiscard]] std::vector<std::uint8_t> as_bytes() const;

        // Append the encoded frame to out
        void write_to(std::vector<std::uint8_t>& out) const;

        bool operator==(const chunk& o) const {
            return m_length == o.m_length && m_type == o.m_type && m_crc == o.m_crc && m_data == o.m_data;
        }
        bool operator!=(const chunk& o) const { return !(*this == o); }

    private:
        chunk(chunk_type type, std::vector<std::uint8_t> data, std::uint32_t crc);

        struct decode_status {
            errc kind;
            std::string message;
        };

        static std::optional<chunk> decode(const std::uint8_t* bytes, std::size_t size, decode_status& status);

        std::uint32_t m_length;
        chunk_type m_type;
        std::vector<std::uint8_t> m_data;
        std::uint32_t m_crc;
    };

    // One line summary: type, length and CRC
    PNGCHUNK_EXPORT std::ostream& operator<<(std::ostream& os, const chunk& c);

} // namespace pngchunk
