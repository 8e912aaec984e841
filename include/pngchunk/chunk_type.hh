/**
 * @file chunk_type.hh
 * @brief Four byte chunk type code with PNG property bits
 */

#pragma once

#include <array>
#include <cstdint>
#include <cstring>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>

#include <pngchunk/export_pngchunk.h>

namespace pngchunk {

    // A-Z or a-z. Shared by text construction and is_valid()
    constexpr bool is_ascii_alpha(std::uint8_t c) noexcept {
        return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z');
    }

    /**
     * @class chunk_type
     * @brief The 4-byte type code of a chunk
     *
     * Bit 5 (0x20) of every byte is a property flag. For ASCII letters it is
     * the case bit: upper case means the bit is clear.
     *
     * | byte | bit 5 clear | bit 5 set      |
     * |------|-------------|----------------|
     * | 0    | critical    | ancillary      |
     * | 1    | public      | private        |
     * | 2    | conformant  | reserved (bad) |
     * | 3    | unsafe copy | safe to copy   |
     *
     * Raw-byte construction accepts any 4 bytes; conformance is a query
     * (is_valid()), not a constructor precondition.
     */
    class PNGCHUNK_EXPORT chunk_type {
    public:
        static constexpr std::uint8_t property_bit = 0x20;

        constexpr chunk_type() = default;

        constexpr chunk_type(std::uint8_t c0, std::uint8_t c1, std::uint8_t c2, std::uint8_t c3)
            : b{ c0, c1, c2, c3 } {}

        // Constructor from raw bytes, never fails
        static chunk_type from_bytes(const void* data) {
            chunk_type result;
            std::memcpy(result.b.data(), data, 4);
            return result;
        }

        /**
         * @brief Construct from text
         * @param text Exactly 4 ASCII letters, case preserved
         * @throws parse_error errc::invalid_length if text is not 4 bytes,
         *         errc::invalid_character if a byte is not an ASCII letter
         */
        static chunk_type from_string(std::string_view text);

        /**
         * @brief Non-throwing form of from_string()
         * @param text Candidate type code
         * @param ec Set to the failure kind, cleared on success
         * @return The type code, or std::nullopt on failure
         */
        static std::optional<chunk_type> from_string(std::string_view text, std::error_code& ec) noexcept;

        [[nodiscard]] const std::array<std::uint8_t, 4>& bytes() const noexcept { return b; }

        // All four bytes are ASCII letters and the reserved bit is clear
        [[nodiscard]] bool is_valid() const noexcept;

        [[nodiscard]] constexpr bool is_critical() const noexcept {
            return (b[0] & property_bit) == 0;
        }

        [[nodiscard]] constexpr bool is_public() const noexcept {
            return (b[1] & property_bit) == 0;
        }

        [[nodiscard]] constexpr bool is_reserved_bit_valid() const noexcept {
            return (b[2] & property_bit) == 0;
        }

        [[nodiscard]] constexpr bool is_safe_to_copy() const noexcept {
            return (b[3] & property_bit) != 0;
        }

        /**
         * @brief Render the code as text
         * @throws encoding_error if the bytes are not valid UTF-8
         */
        [[nodiscard]] std::string to_string() const;

        /**
         * @brief Non-throwing form of to_string()
         */
        [[nodiscard]] std::optional<std::string> to_string(std::error_code& ec) const;

        // Write to bytes
        void to_bytes(void* dest) const {
            std::memcpy(dest, b.data(), 4);
        }

        constexpr std::uint8_t operator[](std::size_t i) const { return b[i]; }

        bool operator==(const chunk_type& o) const { return b == o.b; }
        bool operator!=(const chunk_type& o) const { return !(*this == o); }
        bool operator<(const chunk_type& o) const { return b < o.b; }

    private:
        std::array<std::uint8_t, 4> b{};
    };

    // Quoted, with non-printable bytes escaped as \xNN
    PNGCHUNK_EXPORT std::ostream& operator<<(std::ostream& os, const chunk_type& t);

    struct chunk_type_hash {
        std::size_t operator()(const chunk_type& t) const noexcept {
            std::uint32_t v;
            std::memcpy(&v, t.bytes().data(), 4);
            return (static_cast<std::size_t>(v) * 0x9E3779B1u) ^ 0x85EBCA6Bu;
        }
    };

    // User-defined literal for compile-time type codes, e.g. "IHDR"_ct
    constexpr chunk_type operator""_ct(const char* str, std::size_t len) {
        if (len != 4) {
            throw std::invalid_argument("chunk type literal must be exactly 4 characters");
        }
        return {
            static_cast<std::uint8_t>(str[0]),
            static_cast<std::uint8_t>(str[1]),
            static_cast<std::uint8_t>(str[2]),
            static_cast<std::uint8_t>(str[3])
        };
    }

} // namespace pngchunk

namespace std {
    template<>
    struct hash<pngchunk::chunk_type> {
        std::size_t operator()(const pngchunk::chunk_type& t) const noexcept {
            return pngchunk::chunk_type_hash{}(t);
        }
    };
}
