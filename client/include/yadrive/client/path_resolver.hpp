#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include "yadrive/client/catalogue.hpp"
#include "yadrive/client/disk_api.hpp"
#include "yadrive/client/logger.hpp"
#include "yadrive/result.hpp"

namespace yadrive::client
{

    enum class FolderCreation : std::uint8_t
    {
        Created,
        AlreadyExists
    };

    std::string_view to_string(FolderCreation creation) noexcept;

    struct LocalObject
    {
        std::filesystem::path local_path;
        // Path below the working root with '/' separators; also the remote path of a directory.
        std::string relative;
        bool is_directory{};
    };

    struct UploadTarget
    {
        std::string remote_folder;
        std::string remote_path;
        bool matched_by_name{};
    };

    class PathResolver
    {
    public:
        PathResolver(DiskApi &api, Logger logger, std::filesystem::path working_root);

        // Accepts a path (absolute or relative to the working root) or a bare name that is
        // searched for below the working root.
        Result<LocalObject> locate(const std::string &object) const;

        Result<UploadTarget> resolve_upload_target(const LocalObject &object, const Catalogue &catalogue) const;

        // Target folder for "<name>.zip": the parent of the first file, then the first folder,
        // whose name without extension equals <name>.
        std::optional<UploadTarget> match_archive_name(std::string_view file_name, const Catalogue &catalogue) const;

        // Creates one folder; an existing folder is reported, not an error.
        Result<FolderCreation> create_folder(const std::string &remote_path);

        // Creates remote_path and every missing ancestor, outermost first.
        Result<FolderCreation> ensure_folder(const std::string &remote_path);

        const std::filesystem::path &working_root() const noexcept { return working_root_; }

    private:
        std::string relative_to_root(const std::filesystem::path &path) const;

        DiskApi &api_;
        Logger logger_;
        std::filesystem::path working_root_;
    };

} // namespace yadrive::client
