#include "yadrive/client/path_resolver.hpp"

#include <system_error>
#include <utility>
#include <vector>

#include "yadrive/resource.hpp"

namespace yadrive::client
{

    namespace
    {

        std::vector<std::string> split_segments(const std::string &remote_path)
        {
            std::vector<std::string> segments;
            std::string current;
            for (const char ch : resource::strip_disk_prefix(remote_path))
            {
                if (ch == '/')
                {
                    if (!current.empty())
                    {
                        segments.push_back(std::move(current));
                        current.clear();
                    }
                    continue;
                }
                current.push_back(ch);
            }
            if (!current.empty())
            {
                segments.push_back(std::move(current));
            }
            return segments;
        }

    } // namespace

    std::string_view to_string(FolderCreation creation) noexcept
    {
        return creation == FolderCreation::Created ? "created" : "already_exists";
    }

    PathResolver::PathResolver(DiskApi &api, Logger logger, std::filesystem::path working_root)
        : api_(api), logger_(std::move(logger)), working_root_(std::move(working_root))
    {
        std::error_code ec;
        auto absolute = std::filesystem::absolute(working_root_, ec);
        if (!ec)
        {
            working_root_ = absolute.lexically_normal();
        }
    }

    Result<LocalObject> PathResolver::locate(const std::string &object) const
    {
        if (object.empty())
        {
            return make_error(ErrorCode::InvalidArgument, 0, "Empty local object name");
        }

        std::error_code ec;
        std::filesystem::path candidate(object);
        if (candidate.is_relative())
        {
            candidate = working_root_ / candidate;
        }
        candidate = candidate.lexically_normal();

        std::optional<std::filesystem::path> found;
        if (std::filesystem::exists(candidate, ec))
        {
            found = candidate;
        }
        else
        {
            std::filesystem::recursive_directory_iterator it(
                working_root_, std::filesystem::directory_options::skip_permission_denied, ec);
            const std::filesystem::recursive_directory_iterator end{};
            while (!ec && it != end)
            {
                if (it->path().filename() == object)
                {
                    found = it->path();
                    break;
                }
                it.increment(ec);
            }
        }

        if (!found)
        {
            logger_.log("resolve", "not found locally: ", object);
            return make_error(ErrorCode::NotFoundLocally, 0, "No local file or folder named " + object);
        }

        LocalObject result{
            .local_path = *found,
            .relative = relative_to_root(*found),
            .is_directory = std::filesystem::is_directory(*found, ec),
        };
        logger_.log("resolve", object, " -> ", result.local_path.string(), " (", result.relative, ")");
        return result;
    }

    std::string PathResolver::relative_to_root(const std::filesystem::path &path) const
    {
        const auto relative = path.lexically_normal().lexically_relative(working_root_);
        const auto text = relative.generic_string();
        if (text.empty() || text == "." || text.rfind("..", 0) == 0)
        {
            // outside the working root: mirror by name only
            return path.filename().generic_string();
        }
        return text;
    }

    Result<UploadTarget> PathResolver::resolve_upload_target(const LocalObject &object,
                                                             const Catalogue &catalogue) const
    {
        if (object.is_directory)
        {
            return make_error(ErrorCode::InvalidArgument, 0, object.relative + " is a directory");
        }
        const auto file_name = object.local_path.filename().generic_string();
        if (file_name.find(".zip") != std::string::npos)
        {
            if (auto matched = match_archive_name(file_name, catalogue))
            {
                return *matched;
            }
            logger_.log("resolve", "no catalogue entry matches archive ", file_name, ", using its local location");
        }
        const auto folder = resource::parent_path(object.relative);
        return UploadTarget{
            .remote_folder = folder,
            .remote_path = resource::join_path(folder, file_name),
            .matched_by_name = false,
        };
    }

    std::optional<UploadTarget> PathResolver::match_archive_name(std::string_view file_name,
                                                                 const Catalogue &catalogue) const
    {
        const auto stem = std::string(file_name.substr(0, file_name.find(".zip")));
        auto make_target = [&](const std::string &entry_path)
        {
            const auto folder = resource::parent_path(entry_path);
            return UploadTarget{
                .remote_folder = folder,
                .remote_path = resource::join_path(folder, file_name),
                .matched_by_name = true,
            };
        };
        for (const auto &file : catalogue.all_files)
        {
            if (resource::base_name(file.name) == stem)
            {
                return make_target(file.path);
            }
        }
        for (const auto &folder : catalogue.all_folders)
        {
            if (resource::base_name(folder.name) == stem)
            {
                return make_target(folder.path);
            }
        }
        return std::nullopt;
    }

    Result<FolderCreation> PathResolver::create_folder(const std::string &remote_path)
    {
        auto existence = api_.probe(remote_path);
        if (!existence)
        {
            return existence.error();
        }
        if (existence.value() == ExistenceState::Exists)
        {
            logger_.log("resolve", "folder already exists: ", remote_path);
            return FolderCreation::AlreadyExists;
        }

        const auto response = api_.create_directory(remote_path);
        if (response.transport_ok() && response.status == 201)
        {
            logger_.log("resolve", "folder created: ", remote_path);
            return FolderCreation::Created;
        }
        return error_from_response(response, ErrorCode::TransferFailure);
    }

    Result<FolderCreation> PathResolver::ensure_folder(const std::string &remote_path)
    {
        const auto segments = split_segments(remote_path);
        if (segments.empty())
        {
            return FolderCreation::AlreadyExists;
        }
        if (segments.size() == 1)
        {
            return create_folder(remote_path);
        }

        auto existence = api_.probe(remote_path);
        if (!existence)
        {
            return existence.error();
        }
        if (existence.value() == ExistenceState::Exists)
        {
            return FolderCreation::AlreadyExists;
        }

        std::string prefix;
        auto outcome = FolderCreation::AlreadyExists;
        for (const auto &segment : segments)
        {
            prefix = resource::join_path(prefix, segment);
            auto created = create_folder(prefix);
            if (!created)
            {
                return created.error();
            }
            outcome = created.value();
        }
        return outcome;
    }

} // namespace yadrive::client
