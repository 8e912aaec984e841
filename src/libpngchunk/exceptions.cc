#include <pngchunk/exceptions.hh>

namespace pngchunk {

    namespace {
        class pngchunk_category_impl : public std::error_category {
        public:
            const char* name() const noexcept override {
                return "pngchunk";
            }

            std::string message(int ev) const override {
                switch (static_cast<errc>(ev)) {
                    case errc::invalid_length:
                        return "chunk type must be exactly 4 bytes";
                    case errc::invalid_character:
                        return "chunk type must contain only ASCII letters";
                    case errc::encoding_error:
                        return "bytes are not valid UTF-8";
                    case errc::too_short:
                        return "chunk is shorter than 12 bytes";
                    case errc::length_mismatch:
                        return "chunk length field does not match the data size";
                    case errc::checksum_mismatch:
                        return "chunk CRC does not match its contents";
                    case errc::invalid_signature:
                        return "missing PNG signature";
                    case errc::truncated_chunk:
                        return "chunk extends past the end of the file";
                    case errc::chunk_too_large:
                        return "chunk exceeds the size limit";
                    case errc::invalid_chunk_type:
                        return "chunk type is not conformant";
                    case errc::chunk_not_found:
                        return "chunk not found";
                    case errc::io_failure:
                        return "I/O failure";
                }
                return "unknown pngchunk error";
            }
        };
    }

    const std::error_category& pngchunk_category() noexcept {
        static const pngchunk_category_impl instance;
        return instance;
    }

    void throw_error(errc kind, const std::string& msg) {
        switch (kind) {
            case errc::encoding_error:
                throw encoding_error(msg);
            case errc::io_failure:
                throw io_error(msg);
            default:
                throw parse_error(kind, msg);
        }
    }

} // namespace pngchunk
