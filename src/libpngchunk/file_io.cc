//
// Whole-file reading and writing
//

#include <fstream>
#include <system_error>

#include <pngchunk/file_io.hh>
#include <pngchunk/exceptions.hh>

namespace pngchunk {

    std::vector<std::byte> read_file(const std::filesystem::path& path) {
        std::error_code ec;
        THROW_IO_IF(!std::filesystem::is_regular_file(path, ec), "Not a regular file: ", path.string());

        std::ifstream file(path, std::ios::binary);
        THROW_IO_IF(!file, "Failed to open file: ", path.string());

        file.seekg(0, std::ios::end);
        auto end = file.tellg();
        THROW_IO_IF(end == std::streampos(-1), "Failed to get size of file: ", path.string());
        file.seekg(0, std::ios::beg);

        std::vector<std::byte> data(static_cast<std::size_t>(end));
        file.read(reinterpret_cast<char*>(data.data()), static_cast<std::streamsize>(data.size()));
        THROW_IO_IF(file.gcount() != static_cast<std::streamsize>(data.size()),
                    "Unexpected EOF in ", path.string(), ": requested ", data.size(),
                    " bytes, got ", file.gcount());
        return data;
    }

    void write_file(const std::filesystem::path& path, const std::vector<std::byte>& bytes) {
        std::ofstream file(path, std::ios::binary | std::ios::trunc);
        THROW_IO_IF(!file, "Failed to open file for writing: ", path.string());

        file.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
        file.flush();
        THROW_IO_IF(!file, "Failed to write file: ", path.string());
    }

} // namespace pngchunk
