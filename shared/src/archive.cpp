#include "yadrive/archive.hpp"

#include <algorithm>
#include <array>
#include <ctime>
#include <iterator>
#include <limits>
#include <system_error>

#include <zlib.h>

namespace yadrive::archive
{

    namespace
    {

        constexpr std::uint32_t kLocalHeaderSignature = 0x04034b50;
        constexpr std::uint32_t kCentralHeaderSignature = 0x02014b50;
        constexpr std::uint32_t kEndOfCentralDirSignature = 0x06054b50;
        constexpr std::uint16_t kVersion = 20;
        constexpr std::uint16_t kMethodStored = 0;
        constexpr std::uint16_t kMethodDeflated = 8;
        constexpr std::uint32_t kDirectoryAttribute = 0x10;
        constexpr std::size_t kEndRecordSize = 22;
        constexpr std::size_t kCentralHeaderSize = 46;
        constexpr std::size_t kChunkSize = 64 * 1024;
        constexpr std::uint64_t kMaxFieldValue = std::numeric_limits<std::uint32_t>::max();
        // the end record counts entries in 16 bits
        constexpr std::size_t kMaxEntries = std::numeric_limits<std::uint16_t>::max();

        void put_u16(std::ostream &out, std::uint16_t value)
        {
            const std::array<char, 2> bytes{static_cast<char>(value & 0xFF), static_cast<char>((value >> 8) & 0xFF)};
            out.write(bytes.data(), bytes.size());
        }

        void put_u32(std::ostream &out, std::uint32_t value)
        {
            const std::array<char, 4> bytes{
                static_cast<char>(value & 0xFF),
                static_cast<char>((value >> 8) & 0xFF),
                static_cast<char>((value >> 16) & 0xFF),
                static_cast<char>((value >> 24) & 0xFF),
            };
            out.write(bytes.data(), bytes.size());
        }

        std::uint16_t get_u16(const std::vector<unsigned char> &data, std::size_t at)
        {
            return static_cast<std::uint16_t>(data[at] | (data[at + 1] << 8));
        }

        std::uint32_t get_u32(const std::vector<unsigned char> &data, std::size_t at)
        {
            return static_cast<std::uint32_t>(data[at]) | (static_cast<std::uint32_t>(data[at + 1]) << 8) |
                   (static_cast<std::uint32_t>(data[at + 2]) << 16) | (static_cast<std::uint32_t>(data[at + 3]) << 24);
        }

        std::string normalize_arcname(std::string name)
        {
            std::replace(name.begin(), name.end(), '\\', '/');
            const auto first = name.find_first_not_of('/');
            if (first == std::string::npos)
            {
                return {};
            }
            return name.substr(first);
        }

        std::uint32_t checked_u32(std::uint64_t value, const char *what)
        {
            if (value > kMaxFieldValue)
            {
                throw ArchiveError(std::string(what) + " exceeds the 4 GiB zip limit");
            }
            return static_cast<std::uint32_t>(value);
        }

        class DeflateStream
        {
        public:
            DeflateStream()
            {
                if (deflateInit2(&stream_, Z_DEFAULT_COMPRESSION, Z_DEFLATED, -MAX_WBITS, 8, Z_DEFAULT_STRATEGY) != Z_OK)
                {
                    throw ArchiveError("deflateInit2 failed");
                }
            }
            ~DeflateStream() { deflateEnd(&stream_); }

            DeflateStream(const DeflateStream &) = delete;
            DeflateStream &operator=(const DeflateStream &) = delete;

            z_stream *get() { return &stream_; }

        private:
            z_stream stream_{};
        };

    } // namespace

    ArchiveError::ArchiveError(const std::string &message) : std::runtime_error(message) {}

    ZipWriter::ZipWriter(const std::filesystem::path &path)
        : path_(path), out_(path, std::ios::binary | std::ios::trunc)
    {
        if (!out_.is_open())
        {
            throw ArchiveError("Could not create archive: " + path.string());
        }
        const std::time_t now = std::time(nullptr);
        std::tm local{};
        localtime_r(&now, &local);
        dos_time_ = static_cast<std::uint16_t>((local.tm_hour << 11) | (local.tm_min << 5) | (local.tm_sec / 2));
        dos_date_ = static_cast<std::uint16_t>(((std::max(local.tm_year, 80) - 80) << 9) | ((local.tm_mon + 1) << 5) |
                                               local.tm_mday);
    }

    ZipWriter::~ZipWriter()
    {
        if (!finished_)
        {
            out_.close();
            std::error_code ec;
            std::filesystem::remove(path_, ec);
        }
    }

    std::uint32_t ZipWriter::write_local_header(const std::string &name, std::uint16_t method)
    {
        if (records_.size() >= kMaxEntries)
        {
            throw ArchiveError("Archive " + path_.string() + " would exceed " + std::to_string(kMaxEntries) +
                               " entries");
        }
        if (name.size() > std::numeric_limits<std::uint16_t>::max())
        {
            throw ArchiveError("Archive name too long: " + name.substr(0, 64) + "...");
        }
        const auto offset = checked_u32(static_cast<std::uint64_t>(out_.tellp()), "Archive size");
        put_u32(out_, kLocalHeaderSignature);
        put_u16(out_, kVersion);
        put_u16(out_, 0);
        put_u16(out_, method);
        put_u16(out_, dos_time_);
        put_u16(out_, dos_date_);
        put_u32(out_, 0);
        put_u32(out_, 0);
        put_u32(out_, 0);
        put_u16(out_, static_cast<std::uint16_t>(name.size()));
        put_u16(out_, 0);
        out_.write(name.data(), static_cast<std::streamsize>(name.size()));
        return offset;
    }

    void ZipWriter::patch_local_header(std::uint32_t offset, std::uint32_t crc, std::uint64_t compressed,
                                       std::uint64_t uncompressed)
    {
        const auto end = out_.tellp();
        out_.seekp(static_cast<std::streamoff>(offset) + 14);
        put_u32(out_, crc);
        put_u32(out_, checked_u32(compressed, "Compressed size"));
        put_u32(out_, checked_u32(uncompressed, "File size"));
        out_.seekp(end);
    }

    void ZipWriter::add_directory(std::string arcname)
    {
        arcname = normalize_arcname(std::move(arcname));
        if (arcname.empty())
        {
            return;
        }
        if (arcname.back() != '/')
        {
            arcname.push_back('/');
        }
        Record record;
        record.entry.name = arcname;
        record.entry.is_directory = true;
        record.method = kMethodStored;
        record.local_offset = write_local_header(arcname, kMethodStored);
        records_.push_back(std::move(record));
    }

    void ZipWriter::add_file(const std::filesystem::path &source, std::string arcname)
    {
        arcname = normalize_arcname(std::move(arcname));
        if (arcname.empty())
        {
            throw ArchiveError("Empty archive name for " + source.string());
        }
        std::ifstream in(source, std::ios::binary);
        if (!in.is_open())
        {
            throw ArchiveError("Could not open file for archiving: " + source.string());
        }

        const auto offset = write_local_header(arcname, kMethodDeflated);

        DeflateStream deflater;
        auto *stream = deflater.get();
        std::vector<char> input(kChunkSize);
        std::vector<char> output(kChunkSize);
        uLong crc = crc32(0L, Z_NULL, 0);
        std::uint64_t total_in = 0;
        std::uint64_t total_out = 0;
        int flush = Z_NO_FLUSH;
        do
        {
            in.read(input.data(), static_cast<std::streamsize>(input.size()));
            if (in.bad())
            {
                throw ArchiveError("Read failed while archiving: " + source.string());
            }
            const auto read_count = static_cast<std::size_t>(in.gcount());
            crc = crc32(crc, reinterpret_cast<const Bytef *>(input.data()), static_cast<uInt>(read_count));
            total_in += read_count;
            flush = in.eof() ? Z_FINISH : Z_NO_FLUSH;
            stream->next_in = reinterpret_cast<Bytef *>(input.data());
            stream->avail_in = static_cast<uInt>(read_count);
            do
            {
                stream->next_out = reinterpret_cast<Bytef *>(output.data());
                stream->avail_out = static_cast<uInt>(output.size());
                if (deflate(stream, flush) == Z_STREAM_ERROR)
                {
                    throw ArchiveError("deflate failed for " + source.string());
                }
                const auto produced = output.size() - stream->avail_out;
                out_.write(output.data(), static_cast<std::streamsize>(produced));
                total_out += produced;
            } while (stream->avail_out == 0);
        } while (flush != Z_FINISH);

        if (!out_)
        {
            throw ArchiveError("Write failed for archive " + path_.string());
        }
        patch_local_header(offset, static_cast<std::uint32_t>(crc), total_out, total_in);

        Record record;
        record.entry = ArchiveEntry{
            .name = arcname,
            .uncompressed_size = total_in,
            .compressed_size = total_out,
            .crc32 = static_cast<std::uint32_t>(crc),
            .is_directory = false,
        };
        record.method = kMethodDeflated;
        record.local_offset = offset;
        records_.push_back(std::move(record));
    }

    void ZipWriter::finish()
    {
        if (finished_)
        {
            return;
        }
        if (records_.size() > std::numeric_limits<std::uint16_t>::max())
        {
            throw ArchiveError("Too many entries for a zip archive");
        }
        const auto directory_offset = checked_u32(static_cast<std::uint64_t>(out_.tellp()), "Archive size");
        for (const auto &record : records_)
        {
            const auto &entry = record.entry;
            put_u32(out_, kCentralHeaderSignature);
            put_u16(out_, kVersion);
            put_u16(out_, kVersion);
            put_u16(out_, 0);
            put_u16(out_, record.method);
            put_u16(out_, dos_time_);
            put_u16(out_, dos_date_);
            put_u32(out_, entry.crc32);
            put_u32(out_, static_cast<std::uint32_t>(entry.compressed_size));
            put_u32(out_, static_cast<std::uint32_t>(entry.uncompressed_size));
            put_u16(out_, static_cast<std::uint16_t>(entry.name.size()));
            put_u16(out_, 0);
            put_u16(out_, 0);
            put_u16(out_, 0);
            put_u16(out_, 0);
            put_u32(out_, entry.is_directory ? kDirectoryAttribute : 0);
            put_u32(out_, record.local_offset);
            out_.write(entry.name.data(), static_cast<std::streamsize>(entry.name.size()));
        }
        const auto directory_end = checked_u32(static_cast<std::uint64_t>(out_.tellp()), "Archive size");
        if (records_.size() > kMaxEntries)
        {
            throw ArchiveError("Too many entries for archive " + path_.string());
        }
        const auto count = static_cast<std::uint16_t>(records_.size());
        put_u32(out_, kEndOfCentralDirSignature);
        put_u16(out_, 0);
        put_u16(out_, 0);
        put_u16(out_, count);
        put_u16(out_, count);
        put_u32(out_, directory_end - directory_offset);
        put_u32(out_, directory_offset);
        put_u16(out_, 0);
        out_.close();
        if (!out_)
        {
            throw ArchiveError("Failed to finalize archive " + path_.string());
        }
        finished_ = true;
    }

    std::vector<ArchiveEntry> ZipWriter::entries() const
    {
        std::vector<ArchiveEntry> result;
        result.reserve(records_.size());
        for (const auto &record : records_)
        {
            result.push_back(record.entry);
        }
        return result;
    }

    std::vector<ArchiveEntry> list_entries(const std::filesystem::path &path)
    {
        std::ifstream in(path, std::ios::binary);
        if (!in.is_open())
        {
            throw ArchiveError("Could not open archive: " + path.string());
        }
        const std::vector<unsigned char> data((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
        if (data.size() < kEndRecordSize)
        {
            throw ArchiveError("Archive is truncated: " + path.string());
        }

        std::size_t end_record = data.size() - kEndRecordSize;
        while (get_u32(data, end_record) != kEndOfCentralDirSignature)
        {
            if (end_record == 0)
            {
                throw ArchiveError("End of central directory not found: " + path.string());
            }
            --end_record;
        }

        const auto count = get_u16(data, end_record + 10);
        std::size_t cursor = get_u32(data, end_record + 16);
        std::vector<ArchiveEntry> entries;
        entries.reserve(count);
        for (std::uint16_t i = 0; i < count; ++i)
        {
            if (cursor + kCentralHeaderSize > data.size() || get_u32(data, cursor) != kCentralHeaderSignature)
            {
                throw ArchiveError("Corrupt central directory: " + path.string());
            }
            const auto name_length = get_u16(data, cursor + 28);
            const auto extra_length = get_u16(data, cursor + 30);
            const auto comment_length = get_u16(data, cursor + 32);
            if (cursor + kCentralHeaderSize + name_length > data.size())
            {
                throw ArchiveError("Corrupt central directory: " + path.string());
            }
            ArchiveEntry entry;
            entry.crc32 = get_u32(data, cursor + 16);
            entry.compressed_size = get_u32(data, cursor + 20);
            entry.uncompressed_size = get_u32(data, cursor + 24);
            entry.name.assign(reinterpret_cast<const char *>(data.data() + cursor + kCentralHeaderSize), name_length);
            entry.is_directory = !entry.name.empty() && entry.name.back() == '/';
            entries.push_back(std::move(entry));
            cursor += kCentralHeaderSize + name_length + extra_length + comment_length;
        }
        return entries;
    }

} // namespace yadrive::archive
