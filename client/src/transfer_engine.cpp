#include "yadrive/client/transfer_engine.hpp"

#include <algorithm>
#include <ctime>
#include <sstream>
#include <utility>

namespace yadrive::client
{

    void from_json(const nlohmann::json &json, PhotoRef &photo)
    {
        json.at("url").get_to(photo.url);
        photo.likes = json.value("likes", std::uint64_t{0});
        photo.timestamp = json.value("date", std::int64_t{0});
    }

    std::string photo_file_name(const PhotoRef &photo)
    {
        const std::time_t seconds = static_cast<std::time_t>(photo.timestamp);
        std::tm utc{};
        gmtime_r(&seconds, &utc);
        char date[16]{};
        std::strftime(date, sizeof(date), "%Y-%m-%d", &utc);
        return std::to_string(photo.likes) + "_" + date + ".jpg";
    }

    bool upload_may_have_changed_remote(const Error &error) noexcept
    {
        return error.kind != ErrorCode::NotFoundLocally && error.kind != ErrorCode::InvalidArgument;
    }

    std::size_t UploadReport::count(UploadOutcome outcome) const
    {
        return static_cast<std::size_t>(std::count_if(items.begin(), items.end(),
                                                       [outcome](const UploadItem &item)
                                                       { return item.outcome == outcome; }));
    }

    std::string UploadReport::summary() const
    {
        std::ostringstream out;
        const auto folder = remote_folder.empty() ? std::string("disk root") : remote_folder;
        out << count(UploadOutcome::Uploaded) << " uploaded, " << count(UploadOutcome::AlreadyPresent)
            << " already present, " << failures.size() << " failed in " << folder;
        return out.str();
    }

    TransferEngine::TransferEngine(DiskApi &api, PathResolver &resolver, Logger logger,
                                   std::filesystem::path download_root, std::size_t page_size)
        : api_(api),
          resolver_(resolver),
          logger_(std::move(logger)),
          download_root_(std::move(download_root)),
          page_size_(page_size == 0 ? 1 : page_size)
    {
    }

    void TransferEngine::set_progress_callback(ProgressCallback callback)
    {
        progress_ = std::move(callback);
    }

    std::filesystem::path TransferEngine::local_path_for(const std::string &remote_path) const
    {
        const auto relative = resource::strip_disk_prefix(remote_path);
        if (relative.empty())
        {
            return download_root_;
        }
        return (download_root_ / std::filesystem::path(relative)).lexically_normal();
    }

} // namespace yadrive::client
