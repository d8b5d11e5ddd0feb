#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

#include "yadrive/client/catalogue.hpp"
#include "yadrive/client/disk_api.hpp"
#include "yadrive/client/logger.hpp"
#include "yadrive/client/path_resolver.hpp"
#include "yadrive/client/progress.hpp"
#include "yadrive/resource.hpp"
#include "yadrive/result.hpp"

namespace yadrive::client
{

    // One external image: source URL, like count, Unix timestamp of publication.
    struct PhotoRef
    {
        std::string url;
        std::uint64_t likes{};
        std::int64_t timestamp{};
    };

    void from_json(const nlohmann::json &json, PhotoRef &photo);

    struct UrlImport
    {
        std::vector<PhotoRef> photos;
        std::string album;
    };

    // Either a batch of external URLs or a local file/folder given by path or by name.
    using UploadSource = std::variant<UrlImport, std::filesystem::path>;

    // "<likes>_<YYYY-MM-DD>.jpg", the date taken in UTC.
    std::string photo_file_name(const PhotoRef &photo);

    // False only for failures raised before any remote call was made.
    bool upload_may_have_changed_remote(const Error &error) noexcept;

    enum class UploadOutcome : std::uint8_t
    {
        Uploaded,
        AlreadyPresent
    };

    struct UploadItem
    {
        std::string remote_path;
        UploadOutcome outcome{UploadOutcome::Uploaded};
        std::uint64_t bytes{};
    };

    struct UploadReport
    {
        std::string remote_folder;
        std::vector<UploadItem> items;
        std::vector<std::pair<std::string, Error>> failures;

        std::size_t count(UploadOutcome outcome) const;
        std::string summary() const;
    };

    struct DownloadReport
    {
        std::filesystem::path local_path;
        std::size_t files{};
        std::size_t folders{};
        std::uint64_t bytes{};
        std::vector<std::filesystem::path> existing_directories;
        std::string message;
    };

    class TransferEngine
    {
    public:
        TransferEngine(DiskApi &api, PathResolver &resolver, Logger logger, std::filesystem::path download_root,
                       std::size_t page_size = 100);

        void set_progress_callback(ProgressCallback callback);

        // Remote -> local under the download root. Folders are mirrored recursively.
        Result<DownloadReport> download(const resource::RemoteEntry &entry);

        // Local or external -> remote. The catalogue is only read, for archive name matching.
        Result<UploadReport> upload(const UploadSource &source, const Catalogue &catalogue);

        Result<UploadReport> import_urls(const UrlImport &request);
        // Immediate child files only; subdirectories are not descended into.
        Result<UploadReport> upload_directory(const LocalObject &directory);
        Result<UploadReport> upload_file(const LocalObject &file, const Catalogue &catalogue);

        // Two-step upload: request an upload href for remote_path, then stream the file to it.
        Result<UploadOutcome> upload_one(const std::filesystem::path &local_path, const std::string &remote_path);

        std::filesystem::path local_path_for(const std::string &remote_path) const;

    private:
        Status download_folder(const std::string &remote_path, DownloadReport &report);
        Status download_file(const resource::File &file, const std::filesystem::path &directory,
                             DownloadReport &report);
        Result<std::uint64_t> stream_to_file(const std::string &link, const std::filesystem::path &target,
                                             std::uint64_t expected_size, const std::string &expected_sha256);

        DiskApi &api_;
        PathResolver &resolver_;
        Logger logger_;
        std::filesystem::path download_root_;
        std::size_t page_size_;
        ProgressCallback progress_;
    };

} // namespace yadrive::client
