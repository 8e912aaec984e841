#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include <zlib.h>

#include "unittest_config.h"

// Path for a file the test may create and overwrite
inline std::filesystem::path output_path(const std::string& name) {
    static std::filesystem::path root(UNITTEST_PATH_TO_OUTPUT_FILES);
    return root / name;
}

inline std::vector<std::uint8_t> to_bytes(std::string_view text) {
    return {text.begin(), text.end()};
}

inline void append_be32(std::vector<std::uint8_t>& out, std::uint32_t v) {
    out.push_back(static_cast<std::uint8_t>(v >> 24));
    out.push_back(static_cast<std::uint8_t>(v >> 16));
    out.push_back(static_cast<std::uint8_t>(v >> 8));
    out.push_back(static_cast<std::uint8_t>(v));
}

// Reference CRC straight from zlib over type ++ payload
inline std::uint32_t reference_crc(std::string_view type, const std::vector<std::uint8_t>& payload) {
    uLong crc = crc32(0L, Z_NULL, 0);
    crc = crc32(crc, reinterpret_cast<const Bytef*>(type.data()), 4);
    crc = crc32(crc, payload.data(), static_cast<uInt>(payload.size()));
    return static_cast<std::uint32_t>(crc);
}

// Hand-assembled frame: length, type, payload, crc
inline std::vector<std::uint8_t> make_frame(std::uint32_t length, std::string_view type,
                                            const std::vector<std::uint8_t>& payload,
                                            std::uint32_t crc) {
    std::vector<std::uint8_t> out;
    append_be32(out, length);
    out.insert(out.end(), type.begin(), type.end());
    out.insert(out.end(), payload.begin(), payload.end());
    append_be32(out, crc);
    return out;
}

inline std::vector<std::uint8_t> make_frame(std::string_view type, const std::vector<std::uint8_t>& payload) {
    return make_frame(static_cast<std::uint32_t>(payload.size()), type, payload, reference_crc(type, payload));
}

inline std::vector<std::uint8_t> png_signature_bytes() {
    return {0x89, 'P', 'N', 'G', '\r', '\n', 0x1A, '\n'};
}
