/**
 * @file main.cc
 * @brief pngme - hide text messages in PNG chunks
 *
 * Usage:
 *   pngme encode <file> <chunk-type> <message> [output]
 *   pngme decode <file> <chunk-type>
 *   pngme remove <file> <chunk-type>
 *   pngme print <file>
 */

#include <cstdint>
#include <exception>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>

#include <pngchunk/commands.hh>
#include <pngchunk/exceptions.hh>
#include <pngchunk/parse_options.hh>
#include <pngchunk/pngchunk_config.h>

static void print_usage(const char* program) {
    std::cout << "pngme " << PNGCHUNK_VERSION << "\n\n";
    std::cout << "Usage: " << program << " <command> [arguments]\n\n";
    std::cout << "Commands:\n";
    std::cout << "  encode <file> <chunk-type> <message> [output]  Hide a message before IEND\n";
    std::cout << "  decode <file> <chunk-type>                     Print a hidden message\n";
    std::cout << "  remove <file> <chunk-type>                     Remove a chunk in place\n";
    std::cout << "  print <file>                                   List every chunk\n\n";
    std::cout << "Example:\n";
    std::cout << "  " << program << " encode image.png ruSt \"secret\" hidden.png\n";
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    std::string_view command = argv[1];
    int nargs = argc - 2;

    pngchunk::parse_options options;
    options.on_warning = [](std::uint64_t offset, std::string_view category, std::string_view message) {
        std::cerr << "Warning [" << category << "] at offset " << offset << ": " << message << "\n";
    };

    try {
        if (command == "encode" && (nargs == 3 || nargs == 4)) {
            std::optional<std::filesystem::path> output;
            if (nargs == 4) {
                output = argv[5];
            }
            pngchunk::encode(argv[2], argv[3], argv[4], output, std::cout, options);
        } else if (command == "decode" && nargs == 2) {
            pngchunk::decode(argv[2], argv[3], std::cout, options);
        } else if (command == "remove" && nargs == 2) {
            pngchunk::remove(argv[2], argv[3], std::cout, options);
        } else if (command == "print" && nargs == 1) {
            pngchunk::print_chunks(argv[2], std::cout, options);
        } else if (command == "-h" || command == "--help") {
            print_usage(argv[0]);
            return 0;
        } else {
            std::cerr << "Invalid command or arguments: " << command << "\n\n";
            print_usage(argv[0]);
            return 1;
        }
    } catch (const pngchunk::pngchunk_error& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
