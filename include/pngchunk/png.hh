/**
 * @file png.hh
 * @brief PNG file as a signature followed by an ordered list of chunks
 */

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <system_error>
#include <vector>

#include <pngchunk/chunk.hh>
#include <pngchunk/parse_options.hh>
#include <pngchunk/export_pngchunk.h>

namespace pngchunk {

    /**
     * @class png
     * @brief Chunk level view of a PNG file
     *
     * Chunk payloads are kept as opaque bytes; nothing is decompressed
     * or interpreted.
     */
    class PNGCHUNK_EXPORT png {
    public:
        static constexpr std::array<std::uint8_t, 8> signature = {
            0x89, 'P', 'N', 'G', '\r', '\n', 0x1A, '\n'
        };

        png() = default;
        explicit png(std::vector<chunk> chunks);

        /**
         * @brief Decode a whole file held in memory
         * @param data File bytes, starting with the signature
         * @param size File size
         * @param options Strictness, size limit and warning callback
         * @throws parse_error on a bad signature, a truncated or oversized frame,
         *         a non-conformant type (strict mode) or any chunk decoding error
         */
        static png from_bytes(const void* data, std::size_t size, const parse_options& options = {});

        static png from_bytes(const std::vector<std::uint8_t>& bytes, const parse_options& options = {}) {
            return from_bytes(bytes.data(), bytes.size(), options);
        }

        /**
         * @brief Non-throwing form of from_bytes()
         * @param ec Set to the failure kind, cleared on success
         */
        static std::optional<png> from_bytes(const void* data, std::size_t size,
                                             const parse_options& options, std::error_code& ec);

        static std::optional<png> from_bytes(const std::vector<std::uint8_t>& bytes,
                                             const parse_options& options, std::error_code& ec) {
            return from_bytes(bytes.data(), bytes.size(), options, ec);
        }

        /**
         * @brief Read and decode a file
         * @throws io_error if the file cannot be read, parse_error as from_bytes()
         */
        static png load(const std::filesystem::path& path, const parse_options& options = {});

        /**
         * @brief Non-throwing form of load()
         * @param ec errc::io_failure or the parse failure kind, cleared on success
         */
        static std::optional<png> load(const std::filesystem::path& path, const parse_options& options,
                                       std::error_code& ec);

        /**
         * @brief Encode and write to a file, replacing it
         * @throws io_error if the file cannot be written
         */
        void save(const std::filesystem::path& path) const;

        // Non-throwing form of save(); returns false and sets ec on failure
        bool save(const std::filesystem::path& path, std::error_code& ec) const;

        void append_chunk(chunk c);

        /**
         * @brief Remove the first chunk with the given type
         * @return The removed chunk
         * @throws parse_error errc::chunk_not_found if there is none
         */
        chunk remove_first_chunk(const chunk_type& type);

        /**
         * @brief Non-throwing form of remove_first_chunk()
         * @param ec errc::chunk_not_found if there is none, cleared on success
         */
        std::optional<chunk> remove_first_chunk(const chunk_type& type, std::error_code& ec);

        // First chunk with the given type, nullptr if none
        [[nodiscard]] const chunk* chunk_by_type(const chunk_type& type) const;

        [[nodiscard]] const std::vector<chunk>& chunks() const noexcept { return m_chunks; }
        [[nodiscard]] const std::array<std::uint8_t, 8>& header() const noexcept { return signature; }

        // Signature followed by every chunk frame
        [[nodiscard]] std::vector<std::uint8_t> as_bytes() const;

    private:
        std::vector<chunk> m_chunks;
    };

} // namespace pngchunk
