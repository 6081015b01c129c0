/**
 * @file simple_example.cpp
 * @brief Simple example demonstrating basic pngme usage
 *
 * Reads a PNG file and prints each chunk with its length and the
 * properties encoded in the case of its type letters.
 */

#include <pngme/png.hh>
#include <pngme/exceptions.hh>
#include <iostream>
#include <fstream>

int main(int argc, char* argv[]) {
    if (argc != 2) {
        std::cout << "Usage: " << argv[0] << " <file>\n";
        std::cout << "\n";
        std::cout << "Simple example that lists all chunks in a PNG file.\n";
        return 1;
    }

    std::ifstream file(argv[1], std::ios::binary);
    if (!file) {
        std::cerr << "Error: Cannot open file '" << argv[1] << "'\n";
        return 1;
    }

    std::cout << "Parsing: " << argv[1] << "\n";
    std::cout << "====================\n\n";

    try {
        pngme::parse_options opts;
        opts.on_warning = [](std::uint64_t offset, std::string_view category, std::string_view message) {
            std::cerr << "Warning [" << category << "] at " << offset << ": " << message << "\n";
        };

        auto image = pngme::png::read(file, opts);
        for (const auto& chunk : image.chunks()) {
            const auto& type = chunk.type();
            std::cout << "Chunk: " << type << " (" << chunk.length() << " bytes)";
            std::cout << (type.is_critical() ? " critical" : " ancillary");
            std::cout << (type.is_public() ? " public" : " private");
            if (type.is_safe_to_copy()) {
                std::cout << " safe-to-copy";
            }
            std::cout << "\n";
        }

        std::cout << "\n" << image.size() << " chunks, parsing completed successfully!\n";

    } catch (const pngme::pngme_error& e) {
        std::cerr << "Error (" << e.kind() << "): " << e.what() << "\n";
        return 1;
    }

    return 0;
}
