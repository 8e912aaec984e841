#include <doctest/doctest.h>
#include <pngchunk/png.hh>
#include <pngchunk/exceptions.hh>

#include <algorithm>
#include <fstream>
#include <vector>

#include "test_utils.hh"

using namespace pngchunk;

namespace {
    std::vector<chunk> testing_chunks() {
        return {
            chunk(chunk_type::from_string("FrSt"), to_bytes("I am the first chunk")),
            chunk(chunk_type::from_string("miDl"), to_bytes("I am another chunk")),
            chunk(chunk_type::from_string("LASt"), to_bytes("I am the last chunk"))
        };
    }

    std::vector<std::uint8_t> testing_file_bytes() {
        auto bytes = png_signature_bytes();
        for (const auto& c : testing_chunks()) {
            auto frame = c.as_bytes();
            bytes.insert(bytes.end(), frame.begin(), frame.end());
        }
        return bytes;
    }
}

TEST_SUITE("PNG") {
    TEST_CASE("png construction") {
        SUBCASE("from chunks") {
            png file(testing_chunks());
            CHECK(file.chunks().size() == 3);
            CHECK(file.chunks()[1].type() == "miDl"_ct);
        }

        SUBCASE("header is the PNG signature") {
            png file;
            const auto expected = png_signature_bytes();
            CHECK(std::equal(file.header().begin(), file.header().end(), expected.begin(), expected.end()));
            CHECK(file.chunks().empty());
        }

        SUBCASE("as_bytes of an empty file is the signature") {
            CHECK(png().as_bytes() == png_signature_bytes());
        }
    }

    TEST_CASE("png parsing") {
        SUBCASE("valid file") {
            auto file = png::from_bytes(testing_file_bytes());
            REQUIRE(file.chunks().size() == 3);
            CHECK(file.chunks()[0].data_as_string() == "I am the first chunk");
            CHECK(file.chunks()[2].type().to_string() == "LASt");
        }

        SUBCASE("round trip") {
            const auto bytes = testing_file_bytes();
            CHECK(png::from_bytes(bytes).as_bytes() == bytes);
            CHECK(png(testing_chunks()).as_bytes() == bytes);
        }

        SUBCASE("signature only") {
            auto file = png::from_bytes(png_signature_bytes());
            CHECK(file.chunks().empty());
        }

        SUBCASE("bad signature") {
            auto bytes = testing_file_bytes();
            bytes[1] = 'X';
            try {
                (void)png::from_bytes(bytes);
                FAIL("Should have thrown exception");
            } catch (const parse_error& e) {
                CHECK(e.kind() == errc::invalid_signature);
            }
        }

        SUBCASE("shorter than the signature") {
            std::vector<std::uint8_t> bytes = {0x89, 'P', 'N'};
            std::error_code ec;
            CHECK_FALSE(png::from_bytes(bytes.data(), bytes.size(), {}, ec));
            CHECK(ec == errc::invalid_signature);
        }

        SUBCASE("truncated last chunk") {
            auto bytes = testing_file_bytes();
            bytes.pop_back();
            std::error_code ec;
            CHECK_FALSE(png::from_bytes(bytes.data(), bytes.size(), {}, ec));
            CHECK(ec == errc::truncated_chunk);
        }

        SUBCASE("dangling bytes after the last chunk") {
            auto bytes = testing_file_bytes();
            bytes.insert(bytes.end(), {0, 0, 0});
            std::error_code ec;
            CHECK_FALSE(png::from_bytes(bytes.data(), bytes.size(), {}, ec));
            CHECK(ec == errc::truncated_chunk);
        }

        SUBCASE("corrupted chunk") {
            auto bytes = testing_file_bytes();
            bytes[8 + 8] ^= 0x01;  // first payload byte of the first chunk
            std::error_code ec;
            CHECK_FALSE(png::from_bytes(bytes.data(), bytes.size(), {}, ec));
            CHECK(ec == errc::checksum_mismatch);
        }

        SUBCASE("non-throwing success") {
            const auto bytes = testing_file_bytes();
            std::error_code ec = make_error_code(errc::io_failure);
            auto file = png::from_bytes(bytes.data(), bytes.size(), {}, ec);
            REQUIRE(file);
            CHECK_FALSE(ec);
            CHECK(file->chunks().size() == 3);
        }

        SUBCASE("non-throwing from vector") {
            auto bytes = testing_file_bytes();
            std::error_code ec;
            auto file = png::from_bytes(bytes, {}, ec);
            REQUIRE(file);
            CHECK_FALSE(ec);
            CHECK(file->as_bytes() == bytes);

            bytes[0] = 0;
            CHECK_FALSE(png::from_bytes(bytes, {}, ec));
            CHECK(ec == errc::invalid_signature);
        }
    }

    TEST_CASE("png chunk editing") {
        SUBCASE("append") {
            png file(testing_chunks());
            file.append_chunk(chunk(chunk_type::from_string("TeSt"), to_bytes("Message")));
            REQUIRE(file.chunks().size() == 4);
            CHECK(file.chunks().back().type().to_string() == "TeSt");
            CHECK(file.chunks().back().data_as_string() == "Message");
        }

        SUBCASE("chunk by type") {
            png file(testing_chunks());
            const chunk* found = file.chunk_by_type("FrSt"_ct);
            REQUIRE(found != nullptr);
            CHECK(found->data_as_string() == "I am the first chunk");
            CHECK(file.chunk_by_type("NoNe"_ct) == nullptr);
        }

        SUBCASE("remove first chunk") {
            png file(testing_chunks());
            file.append_chunk(chunk(chunk_type::from_string("TeSt"), to_bytes("one")));
            file.append_chunk(chunk(chunk_type::from_string("TeSt"), to_bytes("two")));

            auto removed = file.remove_first_chunk("TeSt"_ct);
            CHECK(removed.data_as_string() == "one");
            REQUIRE(file.chunk_by_type("TeSt"_ct) != nullptr);
            CHECK(file.chunk_by_type("TeSt"_ct)->data_as_string() == "two");
            CHECK(file.chunks().size() == 4);
        }

        SUBCASE("remove missing chunk") {
            png file(testing_chunks());
            try {
                (void)file.remove_first_chunk("NoNe"_ct);
                FAIL("Should have thrown exception");
            } catch (const parse_error& e) {
                CHECK(e.kind() == errc::chunk_not_found);
            }
            CHECK(file.chunks().size() == 3);
        }

        SUBCASE("non-throwing remove") {
            png file(testing_chunks());
            std::error_code ec = make_error_code(errc::io_failure);
            auto removed = file.remove_first_chunk("miDl"_ct, ec);
            REQUIRE(removed);
            CHECK_FALSE(ec);
            CHECK(removed->data_as_string() == "I am another chunk");
            CHECK(file.chunks().size() == 2);

            CHECK_FALSE(file.remove_first_chunk("miDl"_ct, ec));
            CHECK(ec == errc::chunk_not_found);
            CHECK(file.chunks().size() == 2);
        }
    }

    TEST_CASE("png file I/O") {
        SUBCASE("save and load") {
            const auto path = output_path("save_and_load.png");
            png file(testing_chunks());
            file.append_chunk(chunk(chunk_type::from_string("ruSt"), to_bytes("hidden")));
            file.save(path);

            auto loaded = png::load(path);
            CHECK(loaded.as_bytes() == file.as_bytes());
            REQUIRE(loaded.chunk_by_type("ruSt"_ct) != nullptr);
            CHECK(loaded.chunk_by_type("ruSt"_ct)->data_as_string() == "hidden");
        }

        SUBCASE("save replaces existing content") {
            const auto path = output_path("replace.png");
            png(testing_chunks()).save(path);
            png().save(path);
            CHECK(png::load(path).chunks().empty());
        }

        SUBCASE("missing file") {
            try {
                (void)png::load(output_path("does_not_exist.png"));
                FAIL("Should have thrown exception");
            } catch (const io_error& e) {
                CHECK(e.kind() == errc::io_failure);
            }
        }

        SUBCASE("load reports parse errors") {
            const auto path = output_path("not_a_png.png");
            {
                std::ofstream out(path, std::ios::binary | std::ios::trunc);
                out << "definitely not a PNG file";
            }
            CHECK_THROWS_AS((void)png::load(path), parse_error);
        }

        SUBCASE("non-throwing save and load") {
            const auto path = output_path("non_throwing.png");
            const png file(testing_chunks());
            std::error_code ec = make_error_code(errc::io_failure);
            CHECK(file.save(path, ec));
            CHECK_FALSE(ec);

            ec = make_error_code(errc::io_failure);
            auto loaded = png::load(path, {}, ec);
            REQUIRE(loaded);
            CHECK_FALSE(ec);
            CHECK(loaded->as_bytes() == file.as_bytes());
        }

        SUBCASE("non-throwing load failures") {
            std::error_code ec;
            CHECK_FALSE(png::load(output_path("does_not_exist.png"), {}, ec));
            CHECK(ec == errc::io_failure);

            const auto path = output_path("not_a_png_either.png");
            {
                std::ofstream out(path, std::ios::binary | std::ios::trunc);
                out << "still not a PNG file";
            }
            CHECK_FALSE(png::load(path, {}, ec));
            CHECK(ec == errc::invalid_signature);
        }

        SUBCASE("non-throwing save failure") {
            // The parent directory does not exist
            const auto path = output_path("no_such_directory") / "out.png";
            std::error_code ec;
            CHECK_FALSE(png().save(path, ec));
            CHECK(ec == errc::io_failure);
        }
    }
}
