/**
 * @file commands.hh
 * @brief Hide, reveal, remove and list chunks in PNG files
 *
 * Each command reads the whole file, works on the decoded chunk list and
 * writes the result back only after every step succeeded.
 */

#pragma once

#include <filesystem>
#include <iosfwd>
#include <optional>
#include <string_view>

#include <pngchunk/parse_options.hh>
#include <pngchunk/export_pngchunk.h>

namespace pngchunk {

    /// Output file used by encode() when none is given
    inline const std::filesystem::path default_output_path{"output.png"};

    /**
     * @brief Store a message in a new chunk placed just before IEND
     * @param file Source PNG
     * @param type Chunk type for the message, must pass chunk_type::is_valid()
     * @param message Text stored as chunk data
     * @param output Destination, default_output_path if not given
     * @param out Receives the success message
     * @param options Decoding options for the source file
     * @throws lookup_error if the source has no IEND chunk
     */
    PNGCHUNK_EXPORT void encode(const std::filesystem::path& file, std::string_view type,
                                std::string_view message,
                                const std::optional<std::filesystem::path>& output,
                                std::ostream& out, const parse_options& options = {});

    /**
     * @brief Print the message stored in the first chunk of a type
     * @throws lookup_error if no chunk has that type
     * @throws format_error (not_utf8) if the chunk data is not text
     */
    PNGCHUNK_EXPORT void decode(const std::filesystem::path& file, std::string_view type,
                                std::ostream& out, const parse_options& options = {});

    /**
     * @brief Remove the first chunk of a type and rewrite the file in place
     * @throws lookup_error if no chunk has that type
     */
    PNGCHUNK_EXPORT void remove(const std::filesystem::path& file, std::string_view type,
                                std::ostream& out, const parse_options& options = {});

    /// Print every chunk in file order
    PNGCHUNK_EXPORT void print_chunks(const std::filesystem::path& file, std::ostream& out,
                                      const parse_options& options = {});

} // namespace pngchunk
