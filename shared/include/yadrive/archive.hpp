/**
 * yadrive - Minimal zip archive writer (deflate via zlib, no zip64).
 */
#pragma once

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace yadrive::archive
{

    class ArchiveError : public std::runtime_error
    {
    public:
        explicit ArchiveError(const std::string &message);
    };

    struct ArchiveEntry
    {
        std::string name;
        std::uint64_t uncompressed_size{};
        std::uint64_t compressed_size{};
        std::uint32_t crc32{};
        bool is_directory{};
    };

    class ZipWriter
    {
    public:
        explicit ZipWriter(const std::filesystem::path &path);
        ~ZipWriter();

        ZipWriter(const ZipWriter &) = delete;
        ZipWriter &operator=(const ZipWriter &) = delete;

        void add_directory(std::string arcname);
        void add_file(const std::filesystem::path &source, std::string arcname);

        // Writes the central directory; the archive is unreadable until this runs.
        void finish();

        std::vector<ArchiveEntry> entries() const;

    private:
        struct Record
        {
            ArchiveEntry entry;
            std::uint16_t method{};
            std::uint32_t local_offset{};
        };

        std::uint32_t write_local_header(const std::string &name, std::uint16_t method);
        void patch_local_header(std::uint32_t offset, std::uint32_t crc, std::uint64_t compressed,
                                std::uint64_t uncompressed);

        std::filesystem::path path_;
        std::ofstream out_;
        std::vector<Record> records_;
        std::uint16_t dos_time_{};
        std::uint16_t dos_date_{};
        bool finished_{};
    };

    // Reads the central directory of an archive without extracting anything.
    std::vector<ArchiveEntry> list_entries(const std::filesystem::path &path);

} // namespace yadrive::archive
