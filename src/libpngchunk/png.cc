#include <pngchunk/png.hh>
#include <pngchunk/endian.hh>
#include <pngchunk/exceptions.hh>

#include <algorithm>
#include <fstream>
#include <iterator>

namespace pngchunk {

    png::png(std::vector<chunk> chunks)
        : m_chunks(std::move(chunks)) {
    }

    png png::from_bytes(const void* data, std::size_t size, const parse_options& options) {
        auto* bytes = static_cast<const std::uint8_t*>(data);

        THROW_PARSE_IF(size < signature.size() ||
                       !std::equal(signature.begin(), signature.end(), bytes),
                       errc::invalid_signature, "File does not start with the PNG signature");

        std::vector<chunk> chunks;
        std::size_t offset = signature.size();
        while (offset < size) {
            const std::size_t available = size - offset;
            THROW_PARSE_IF(available < chunk::overhead, errc::truncated_chunk,
                           "Chunk header at offset ", offset, " needs ", chunk::overhead,
                           " bytes, only ", available, " left");

            const std::uint32_t declared = load_be32(bytes + offset);
            const chunk_type type = chunk_type::from_bytes(bytes + offset + 4);

            if (declared > options.max_chunk_size) {
                const std::string msg = build_error_msg("Chunk ", type, " at offset ", offset,
                                                        " has size ", declared,
                                                        " which exceeds maximum allowed size of ",
                                                        options.max_chunk_size);
                THROW_PARSE_IF(options.strict, errc::chunk_too_large, msg);
                if (options.on_warning) {
                    options.on_warning(offset, "size_limit", msg);
                }
            }

            const std::size_t frame = chunk::overhead + static_cast<std::size_t>(declared);
            THROW_PARSE_IF(frame > available, errc::truncated_chunk,
                           "Chunk ", type, " at offset ", offset, " needs ", frame,
                           " bytes, only ", available, " left");

            if (!type.is_valid()) {
                const std::string msg = build_error_msg("Chunk ", type, " at offset ", offset,
                                                        " has a non-conformant type code");
                THROW_PARSE_IF(options.strict, errc::invalid_chunk_type, msg);
                if (options.on_warning) {
                    options.on_warning(offset, "chunk_type", msg);
                }
            }

            try {
                chunks.push_back(chunk::from_bytes(bytes + offset, frame));
            } catch (const parse_error& e) {
                // Add the file position to the chunk level message
                THROW_PARSE(e.kind(), e.what(), " (at offset ", offset, ")");
            }
            offset += frame;
        }

        return png(std::move(chunks));
    }

    std::optional<png> png::from_bytes(const void* data, std::size_t size,
                                       const parse_options& options, std::error_code& ec) {
        try {
            auto result = from_bytes(data, size, options);
            ec.clear();
            return result;
        } catch (const parse_error& e) {
            ec = e.code();
            return std::nullopt;
        }
    }

    png png::load(const std::filesystem::path& path, const parse_options& options) {
        std::ifstream file(path, std::ios::binary);
        THROW_IO_UNLESS(file, "Failed to open file: ", path.string());

        std::vector<std::uint8_t> bytes((std::istreambuf_iterator<char>(file)),
                                        std::istreambuf_iterator<char>());
        THROW_IO_IF(file.bad(), "Failed to read file: ", path.string());

        return from_bytes(bytes, options);
    }

    std::optional<png> png::load(const std::filesystem::path& path, const parse_options& options,
                                 std::error_code& ec) {
        try {
            auto result = load(path, options);
            ec.clear();
            return result;
        } catch (const pngchunk_error& e) {
            ec = e.code();
            return std::nullopt;
        }
    }

    void png::save(const std::filesystem::path& path) const {
        const auto bytes = as_bytes();

        std::ofstream file(path, std::ios::binary | std::ios::trunc);
        THROW_IO_UNLESS(file, "Failed to open file for writing: ", path.string());

        file.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
        file.flush();
        THROW_IO_UNLESS(file, "Failed to write file: ", path.string());
    }

    bool png::save(const std::filesystem::path& path, std::error_code& ec) const {
        try {
            save(path);
            ec.clear();
            return true;
        } catch (const io_error& e) {
            ec = e.code();
            return false;
        }
    }

    void png::append_chunk(chunk c) {
        m_chunks.push_back(std::move(c));
    }

    chunk png::remove_first_chunk(const chunk_type& type) {
        auto it = std::find_if(m_chunks.begin(), m_chunks.end(),
                               [&type](const chunk& c) { return c.type() == type; });
        THROW_PARSE_IF(it == m_chunks.end(), errc::chunk_not_found, "No chunk of type ", type);

        chunk removed = std::move(*it);
        m_chunks.erase(it);
        return removed;
    }

    std::optional<chunk> png::remove_first_chunk(const chunk_type& type, std::error_code& ec) {
        auto it = std::find_if(m_chunks.begin(), m_chunks.end(),
                               [&type](const chunk& c) { return c.type() == type; });
        if (it == m_chunks.end()) {
            ec = make_error_code(errc::chunk_not_found);
            return std::nullopt;
        }
        ec.clear();

        chunk removed = std::move(*it);
        m_chunks.erase(it);
        return removed;
    }

    const chunk* png::chunk_by_type(const chunk_type& type) const {
        auto it = std::find_if(m_chunks.begin(), m_chunks.end(),
                               [&type](const chunk& c) { return c.type() == type; });
        return it == m_chunks.end() ? nullptr : &*it;
    }

    std::vector<std::uint8_t> png::as_bytes() const {
        std::size_t total = signature.size();
        for (const auto& c : m_chunks) {
            total += c.total_size();
        }

        std::vector<std::uint8_t> out;
        out.reserve(total);
        out.insert(out.end(), signature.begin(), signature.end());
        for (const auto& c : m_chunks) {
            c.write_to(out);
        }
        return out;
    }

} // namespace pngchunk
