/**
 * @file pngme.cpp
 * @brief Hide text messages in PNG files as ancillary chunks
 *
 * Commands:
 *   encode <file> <type> <message> [output]
 *   decode <file> <type>
 *   remove <file> <type>
 *   print  <file>
 */

#include <pngchunk/png.hh>
#include <pngchunk/exceptions.hh>
#include <exception>
#include <iostream>
#include <iomanip>
#include <string>
#include <vector>

namespace {

class PngMessenger {
public:
    void encode(const std::string& filename, const std::string& type_text,
                const std::string& message, const std::string& output) {
        auto file = pngchunk::png::load(filename, lenient_options());
        auto type = pngchunk::chunk_type::from_string(type_text);

        file.append_chunk(pngchunk::chunk(type, std::vector<std::uint8_t>(message.begin(), message.end())));
        file.save(output);

        std::cout << "Encoded " << message.size() << " bytes into chunk " << type
                  << " of " << output << "\n";
    }

    void decode(const std::string& filename, const std::string& type_text) {
        auto file = pngchunk::png::load(filename, lenient_options());
        auto type = pngchunk::chunk_type::from_string(type_text);

        const pngchunk::chunk* found = file.chunk_by_type(type);
        THROW_PARSE_IF(found == nullptr, pngchunk::errc::chunk_not_found,
                       "No chunk of type ", type, " in ", filename);

        std::cout << found->data_as_string() << "\n";
    }

    void remove(const std::string& filename, const std::string& type_text) {
        auto file = pngchunk::png::load(filename, lenient_options());
        auto type = pngchunk::chunk_type::from_string(type_text);

        auto removed = file.remove_first_chunk(type);
        file.save(filename);

        std::cout << "Removed " << removed << " from " << filename << "\n";
    }

    void print(const std::string& filename) {
        auto file = pngchunk::png::load(filename, lenient_options());

        std::cout << "File: " << filename << "\n";
        std::cout << "Chunks: " << file.chunks().size() << "\n";
        std::cout << "=========================================\n";

        std::size_t offset = pngchunk::png::signature.size();
        for (const auto& c : file.chunks()) {
            const auto& t = c.type();
            std::cout << std::setw(10) << offset << "  " << c
                      << "  " << (t.is_critical() ? "critical" : "ancillary")
                      << ", " << (t.is_public() ? "public" : "private")
                      << ", " << (t.is_safe_to_copy() ? "safe-to-copy" : "unsafe-to-copy")
                      << (t.is_valid() ? "" : ", NON-CONFORMANT")
                      << "\n";
            offset += c.total_size();
        }

        if (warnings_ > 0) {
            std::cout << "\n" << warnings_ << " warning(s)\n";
        }
    }

private:
    pngchunk::parse_options lenient_options() {
        pngchunk::parse_options options;
        options.strict = false;
        options.on_warning = [this](std::uint64_t offset, std::string_view category, std::string_view msg) {
            ++warnings_;
            std::cerr << "Warning [" << category << "] at offset " << offset << ": " << msg << "\n";
        };
        return options;
    }

    int warnings_ = 0;
};

void usage(const char* prog) {
    std::cout << "Usage: " << prog << " <command> <file> [args]\n";
    std::cout << "\n";
    std::cout << "Hide and recover text messages in PNG chunks.\n";
    std::cout << "\n";
    std::cout << "Commands:\n";
    std::cout << "  encode <file> <type> <message> [output]\n";
    std::cout << "    Append a chunk holding the message (written to output if given)\n";
    std::cout << "  decode <file> <type>\n";
    std::cout << "    Print the message of the first chunk of that type\n";
    std::cout << "  remove <file> <type>\n";
    std::cout << "    Remove the first chunk of that type\n";
    std::cout << "  print <file>\n";
    std::cout << "    List all chunks\n";
    std::cout << "\n";
    std::cout << "Example:\n";
    std::cout << "  " << prog << " encode image.png ruSt \"hello\"\n";
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc < 3) {
        usage(argv[0]);
        return 1;
    }

    const std::string command = argv[1];
    PngMessenger messenger;

    try {
        if (command == "encode" && (argc == 5 || argc == 6)) {
            messenger.encode(argv[2], argv[3], argv[4], argc == 6 ? argv[5] : argv[2]);
        } else if (command == "decode" && argc == 4) {
            messenger.decode(argv[2], argv[3]);
        } else if (command == "remove" && argc == 4) {
            messenger.remove(argv[2], argv[3]);
        } else if (command == "print" && argc == 3) {
            messenger.print(argv[2]);
        } else {
            usage(argv[0]);
            return 1;
        }
    } catch (const pngchunk::pngchunk_error& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Unexpected error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
