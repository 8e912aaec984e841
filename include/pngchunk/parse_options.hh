/**
 * @file parse_options.hh
 * @brief Parsing options and configuration for PNG files
 */

#pragma once

#include <functional>
#include <string_view>
#include <cstdint>

namespace pngchunk {

    /**
     * @struct parse_options
     * @brief Configuration options for parsing PNG files
     *
     * Controls strictness, size limits, and warning handling when a whole
     * file is decoded. Single chunk decoding is not affected by these
     * options.
     */
    struct parse_options {
        /**
         * @brief Strict parsing mode
         *
         * When true, oversized chunks and non-conformant type codes are errors.
         * When false, they are reported through on_warning and kept.
         */
        bool strict = true;

        /**
         * @brief Maximum allowed chunk payload size in bytes
         *
         * Default is 2^31 - 1, the largest length PNG permits.
         */
        std::uint64_t max_chunk_size = 0x7FFFFFFFu;

        /**
         * @typedef warning_handler
         * @brief Callback function type for handling warnings
         * @param offset File offset of the chunk the warning is about
         * @param category Warning category ("size_limit" or "chunk_type")
         * @param message Human-readable warning message
         */
        using warning_handler = std::function<void(
            std::uint64_t offset,
            std::string_view category,
            std::string_view message
        )>;

        /**
         * @brief Optional warning handler callback
         *
         * If not set, warnings are silently ignored.
         */
        warning_handler on_warning;
    };

} // namespace pngchunk
