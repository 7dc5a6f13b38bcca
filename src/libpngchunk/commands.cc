//
// Command implementations shared by the pngme tool and the tests
//

#include <ostream>
#include <utility>
#include <vector>

#include <pngchunk/commands.hh>
#include <pngchunk/chunk.hh>
#include <pngchunk/chunk_type.hh>
#include <pngchunk/exceptions.hh>
#include <pngchunk/file_io.hh>
#include <pngchunk/png.hh>

namespace pngchunk {

    namespace {
        png load(const std::filesystem::path& file, const parse_options& options) {
            auto bytes = read_file(file);
            return png::from_bytes(bytes.data(), bytes.size(), options);
        }
    }

    void encode(const std::filesystem::path& file, std::string_view type,
                std::string_view message,
                const std::optional<std::filesystem::path>& output,
                std::ostream& out, const parse_options& options) {
        auto new_type = chunk_type::from_string(type);
        THROW_FORMAT_IF(!new_type.is_valid(), invalid_chunk_type,
                        "Chunk type '", type, "' has the reserved bit set");

        auto image = load(file, options);

        auto end = image.remove_chunk(chunk_types::IEND.to_string_view());
        auto first = reinterpret_cast<const std::byte*>(message.data());
        image.append_chunk(chunk(new_type, std::vector<std::byte>(first, first + message.size())));
        image.append_chunk(std::move(end));

        write_file(output.value_or(default_output_path), image.to_bytes());
        out << "Message encoded successfully!\n";
    }

    void decode(const std::filesystem::path& file, std::string_view type,
                std::ostream& out, const parse_options& options) {
        auto image = load(file, options);

        const chunk* target = image.chunk_by_type(type);
        if (!target) {
            THROW_LOOKUP(type);
        }
        out << "Hidden message: " << target->data_as_string() << "\n";
    }

    void remove(const std::filesystem::path& file, std::string_view type,
                std::ostream& out, const parse_options& options) {
        auto image = load(file, options);

        image.remove_chunk(type);
        write_file(file, image.to_bytes());
        out << "Chunk removed successfully!\n";
    }

    void print_chunks(const std::filesystem::path& file, std::ostream& out,
                      const parse_options& options) {
        auto image = load(file, options);

        for (const auto& c : image.chunks()) {
            out << c << "\n";
        }
    }

} // namespace pngchunk
