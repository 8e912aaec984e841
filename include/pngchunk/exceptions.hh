/**
 * @file exceptions.hh
 * @brief Error kinds, exception classes and throwing macros for libpngchunk
 *
 * Every failure in the library has an error kind (@ref pngchunk::errc).
 * Throwing entry points report it through an exception derived from
 * @ref pngchunk::pngchunk_error; non-throwing overloads report it through
 * a std::error_code in the "pngchunk" category.
 */

#pragma once

#include <stdexcept>
#include <string>
#include <sstream>
#include <system_error>
#include <type_traits>

#include <pngchunk/export_pngchunk.h>

namespace pngchunk {

    /**
     * @enum errc
     * @brief Error kinds raised by the library
     */
    enum class errc {
        invalid_length = 1,   ///< Text type code is not exactly 4 bytes
        invalid_character,    ///< Text type code has a non ASCII-alphabetic byte
        encoding_error,       ///< Bytes are not valid UTF-8 text
        too_short,            ///< Chunk buffer shorter than the 12-byte frame
        length_mismatch,      ///< Declared length disagrees with the buffer size
        checksum_mismatch,    ///< Stored CRC differs from the recomputed one
        invalid_signature,    ///< File does not start with the PNG signature
        truncated_chunk,      ///< Chunk frame runs past the end of the file
        chunk_too_large,      ///< Declared length exceeds parse_options::max_chunk_size
        invalid_chunk_type,   ///< Non-conformant type code in strict mode
        chunk_not_found,      ///< No chunk with the requested type
        io_failure            ///< File could not be opened, read or written
    };

    /**
     * @brief The error category of @ref errc values
     *
     * A single immutable instance, name "pngchunk".
     */
    PNGCHUNK_EXPORT const std::error_category& pngchunk_category() noexcept;

    inline std::error_code make_error_code(errc e) noexcept {
        return {static_cast<int>(e), pngchunk_category()};
    }

    /**
     * @class pngchunk_error
     * @brief Base exception class for all library errors
     *
     * Carries the error kind so that callers can branch on it
     * without parsing the message.
     */
    class PNGCHUNK_EXPORT pngchunk_error : public std::runtime_error {
    public:
        pngchunk_error(errc kind, const std::string& msg)
            : std::runtime_error(msg), m_kind(kind) {}

        [[nodiscard]] errc kind() const noexcept { return m_kind; }
        [[nodiscard]] std::error_code code() const noexcept { return make_error_code(m_kind); }

    private:
        errc m_kind;
    };

    /**
     * @class parse_error
     * @brief Malformed chunk, type code or file content
     */
    class PNGCHUNK_EXPORT parse_error : public pngchunk_error {
    public:
        parse_error(errc kind, const std::string& msg)
            : pngchunk_error(kind, msg) {}
    };

    /**
     * @class encoding_error
     * @brief Bytes could not be rendered as UTF-8 text
     */
    class PNGCHUNK_EXPORT encoding_error : public pngchunk_error {
    public:
        explicit encoding_error(const std::string& msg)
            : pngchunk_error(errc::encoding_error, msg) {}
    };

    /**
     * @class io_error
     * @brief File access failed
     */
    class PNGCHUNK_EXPORT io_error : public pngchunk_error {
    public:
        explicit io_error(const std::string& msg)
            : pngchunk_error(errc::io_failure, msg) {}
    };

    /**
     * @brief Build error message from variadic arguments
     *
     * Uses C++17 fold expressions to concatenate all arguments into
     * a single error message string.
     */
    template<typename... Args>
    std::string build_error_msg(Args&&... args) {
        std::ostringstream oss;
        ((oss << args), ...);
        return oss.str();
    }

    /**
     * @brief Throw the exception class matching an error kind
     * @param kind Error kind
     * @param msg Human-readable message
     */
    [[noreturn]] PNGCHUNK_EXPORT void throw_error(errc kind, const std::string& msg);

    /**
     * @defgroup ExceptionMacros Exception Throwing Macros
     * @{
     */

    #define THROW_PARSE(kind, ...) \
        throw ::pngchunk::parse_error(kind, ::pngchunk::build_error_msg(__VA_ARGS__))

    #define THROW_PARSE_IF(condition, kind, ...) \
        do { if (condition) THROW_PARSE(kind, __VA_ARGS__); } while(0)

    #define THROW_IO(...) \
        throw ::pngchunk::io_error(::pngchunk::build_error_msg(__VA_ARGS__))

    #define THROW_IO_IF(condition, ...) \
        do { if (condition) THROW_IO(__VA_ARGS__); } while(0)

    #define THROW_IO_UNLESS(condition, ...) \
        do { if (!(condition)) THROW_IO(__VA_ARGS__); } while(0)

    /** @} */ // end of ExceptionMacros group

} // namespace pngchunk

namespace std {
    template<>
    struct is_error_code_enum<pngchunk::errc> : true_type {};
}
