#include <pngchunk/chunk_type.hh>
#include <pngchunk/exceptions.hh>

#include <algorithm>
#include <iomanip>
#include <sstream>

#include "utf8.hh"

namespace pngchunk {

    namespace {
        struct text_check {
            errc kind;
            std::size_t offset;
        };

        // Byte length is checked before content
        std::optional<text_check> check_text(std::string_view text) noexcept {
            if (text.size() != 4) {
                return text_check{errc::invalid_length, text.size()};
            }
            for (std::size_t i = 0; i < 4; ++i) {
                if (!is_ascii_alpha(static_cast<std::uint8_t>(text[i]))) {
                    return text_check{errc::invalid_character, i};
                }
            }
            return std::nullopt;
        }
    }

    chunk_type chunk_type::from_string(std::string_view text) {
        if (auto failure = check_text(text)) {
            if (failure->kind == errc::invalid_length) {
                THROW_PARSE(errc::invalid_length,
                            "Chunk type must be 4 bytes, got ", text.size());
            }
            THROW_PARSE(errc::invalid_character,
                        "Invalid character in chunk type at position ", failure->offset,
                        ": byte 0x", std::hex, std::setw(2), std::setfill('0'),
                        static_cast<unsigned>(static_cast<std::uint8_t>(text[failure->offset])));
        }
        return from_bytes(text.data());
    }

    std::optional<chunk_type> chunk_type::from_string(std::string_view text, std::error_code& ec) noexcept {
        if (auto failure = check_text(text)) {
            ec = make_error_code(failure->kind);
            return std::nullopt;
        }
        ec.clear();
        return from_bytes(text.data());
    }

    bool chunk_type::is_valid() const noexcept {
        return std::all_of(b.begin(), b.end(), is_ascii_alpha) && is_reserved_bit_valid();
    }

    std::string chunk_type::to_string() const {
        if (!is_valid_utf8(b.data(), b.size())) {
            std::ostringstream oss;
            oss << "Chunk type " << *this << " is not valid UTF-8";
            throw encoding_error(oss.str());
        }
        return {reinterpret_cast<const char*>(b.data()), b.size()};
    }

    std::optional<std::string> chunk_type::to_string(std::error_code& ec) const {
        if (!is_valid_utf8(b.data(), b.size())) {
            ec = make_error_code(errc::encoding_error);
            return std::nullopt;
        }
        ec.clear();
        return std::string(reinterpret_cast<const char*>(b.data()), b.size());
    }

    std::ostream& operator<<(std::ostream& os, const chunk_type& t) {
        os << '\'';
        for (std::uint8_t c : t.bytes()) {
            if (c >= 32 && c <= 126) {
                os << static_cast<char>(c);
            } else {
                // Escape non-printable characters
                auto flags = os.flags();
                auto fill = os.fill();
                os << "\\x" << std::hex << std::setfill('0') << std::setw(2)
                   << static_cast<unsigned>(c);
                os.flags(flags);
                os.fill(fill);
            }
        }
        os << '\'';
        return os;
    }

} // namespace pngchunk
