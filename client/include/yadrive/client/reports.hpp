#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "yadrive/client/catalogue.hpp"
#include "yadrive/client/logger.hpp"
#include "yadrive/resource.hpp"
#include "yadrive/result.hpp"

namespace yadrive::client
{

    // "512 KB", "1.5 MB", "2.25 GB": sizes are rounded to whole kilobytes first,
    // above 1000 KB shown in megabytes and above 100000 KB in gigabytes.
    std::string format_size(std::uint64_t bytes);

    // Every file or every folder of the catalogue, in walk order.
    std::vector<resource::RemoteEntry> entries_of(const Catalogue &catalogue, resource::ResourceType type);

    // At most ten entries, largest first; equal sizes keep walk order.
    std::vector<resource::RemoteEntry> top10(const Catalogue &catalogue, resource::ResourceType type);

    struct ZipReport
    {
        std::filesystem::path archive;
        std::filesystem::path sidecar;
        std::size_t entries{};
    };

    class Reports
    {
    public:
        Reports(Logger logger, std::filesystem::path reports_dir, std::filesystem::path download_root);

        // Largest entry of the kind; also written as {name: size} to
        // biggest_file_info.json or biggest_folder_info.json.
        Result<resource::RemoteEntry> find_biggest(const Catalogue &catalogue, resource::ResourceType type) const;

        // Archives the downloaded copy of entry into <download_root>/<stem>.zip and
        // writes <stem>.zip_info.json beside it.
        Result<ZipReport> zip_entry(const resource::RemoteEntry &entry) const;

        std::filesystem::path biggest_report_path(resource::ResourceType type) const;

    private:
        std::optional<std::filesystem::path> find_downloaded(const resource::RemoteEntry &entry) const;

        Logger logger_;
        std::filesystem::path reports_dir_;
        std::filesystem::path download_root_;
    };

} // namespace yadrive::client
