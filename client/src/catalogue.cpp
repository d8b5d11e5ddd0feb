#include "yadrive/client/catalogue.hpp"

#include <utility>

namespace yadrive::client
{

    std::optional<resource::RemoteEntry> Catalogue::find_by_path(std::string_view path) const
    {
        const auto wanted = resource::strip_disk_prefix(path);
        for (const auto &file : all_files)
        {
            if (resource::strip_disk_prefix(file.path) == wanted)
            {
                return resource::RemoteEntry{file};
            }
        }
        for (const auto &folder : all_folders)
        {
            if (resource::strip_disk_prefix(folder.path) == wanted)
            {
                return resource::RemoteEntry{folder};
            }
        }
        return std::nullopt;
    }

    std::optional<resource::RemoteEntry> Catalogue::find_by_name(std::string_view name) const
    {
        for (const auto &file : all_files)
        {
            if (file.name == name)
            {
                return resource::RemoteEntry{file};
            }
        }
        for (const auto &folder : all_folders)
        {
            if (folder.name == name)
            {
                return resource::RemoteEntry{folder};
            }
        }
        return std::nullopt;
    }

    CatalogueWalker::CatalogueWalker(DiskApi &api, Logger logger, BackoffPolicy retry, Sleeper sleeper,
                                     std::size_t page_size)
        : api_(api),
          logger_(std::move(logger)),
          retry_(retry),
          sleeper_(std::move(sleeper)),
          page_size_(page_size == 0 ? 1 : page_size) {}

    void CatalogueWalker::set_heartbeat(Heartbeat heartbeat)
    {
        heartbeat_ = std::move(heartbeat);
    }

    Result<CatalogueSnapshot> CatalogueWalker::build(const std::string &root_path)
    {
        auto catalogue = std::make_shared<Catalogue>();
        auto total = walk(root_path, *catalogue);
        if (!total)
        {
            return total.error();
        }
        catalogue->total_size = total.value();
        logger_.log("walk", "catalogue ready files=", catalogue->all_files.size(),
                    " folders=", catalogue->all_folders.size(), " bytes=", catalogue->total_size);
        return CatalogueSnapshot(std::move(catalogue));
    }

    Result<std::uint64_t> CatalogueWalker::walk(const std::string &root_path, Catalogue &into)
    {
        std::uint64_t subtree_size = 0;
        std::size_t offset = 0;
        while (true)
        {
            auto page = fetch_page(root_path, offset);
            if (!page)
            {
                return page.error();
            }
            auto &listing = page.value();
            try
            {
                for (auto &item : listing.items)
                {
                    const auto type = resource::resource_type_from_string(item.at("type").get<std::string>());
                    if (type == resource::ResourceType::Dir)
                    {
                        const auto child_path = item.at("path").get<std::string>();
                        auto child_size = walk(child_path, into);
                        if (!child_size)
                        {
                            return child_size.error();
                        }
                        item["size"] = child_size.value();
                        into.all_folders.push_back(item.get<resource::Folder>());
                        subtree_size += child_size.value();
                    }
                    else
                    {
                        auto file = item.get<resource::File>();
                        subtree_size += file.size;
                        into.all_files.push_back(std::move(file));
                    }
                }
            }
            catch (const nlohmann::json::exception &ex)
            {
                logger_.log("walk", "malformed item below ", root_path, ": ", ex.what());
                return make_error(ErrorCode::InvalidResponse, 0, std::string("Malformed listing for ") + root_path +
                                                                     ": " + ex.what());
            }
            catch (const resource::ResourceError &ex)
            {
                logger_.log("walk", "unsupported item below ", root_path, ": ", ex.what());
                return make_error(ErrorCode::InvalidResponse, 0, std::string("Malformed listing for ") + root_path +
                                                                     ": " + ex.what());
            }

            offset += listing.items.size();
            if (listing.items.empty() || offset >= listing.total)
            {
                break;
            }
        }
        return subtree_size;
    }

    Result<resource::DirectoryPage> CatalogueWalker::fetch_page(const std::string &path, std::size_t offset)
    {
        const auto attempts = retry_.max_attempts == 0 ? std::size_t{1} : retry_.max_attempts;
        for (std::size_t attempt = 0;; ++attempt)
        {
            if (heartbeat_)
            {
                heartbeat_();
            }
            const auto response = api_.metadata_page(path, page_size_, offset);
            if (response.ok())
            {
                const auto json = parse_body(response);
                if (!json || !resource::has_directory_listing(*json))
                {
                    return make_error(ErrorCode::InvalidResponse, response.status, "No listing returned for " + path);
                }
                try
                {
                    return json->get<resource::DirectoryPage>();
                }
                catch (const nlohmann::json::exception &ex)
                {
                    return make_error(ErrorCode::InvalidResponse, response.status, ex.what());
                }
            }
            if (response.transport_ok() && response.status == 404)
            {
                return error_from_response(response, ErrorCode::NotFound);
            }
            if (!is_transient_status(response.transport_ok() ? response.status : 0) || attempt + 1 >= attempts)
            {
                logger_.log("walk", "listing failed for ", path, " after ", attempt + 1, " attempt(s)");
                return error_from_response(response, ErrorCode::TransferFailure);
            }
            const auto delay = retry_.delay_for(attempt);
            logger_.log("walk", "transient failure for ", path, " status=", response.status, ", retrying in ",
                        delay.count(), "ms");
            if (sleeper_)
            {
                sleeper_(delay);
            }
        }
    }

} // namespace yadrive::client
