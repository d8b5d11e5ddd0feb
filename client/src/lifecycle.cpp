#include "yadrive/client/lifecycle.hpp"

#include <memory>
#include <utility>

namespace yadrive::client
{

    LifecycleManager::LifecycleManager(DiskApi &api, PathResolver &resolver, CatalogueWalker &walker, Logger logger,
                                       BackoffPolicy poll, Sleeper sleeper, Decisions decisions)
        : api_(api),
          resolver_(resolver),
          walker_(walker),
          logger_(std::move(logger)),
          poll_(poll),
          sleeper_(std::move(sleeper)),
          decisions_(std::move(decisions)),
          snapshot_(std::make_shared<const Catalogue>())
    {
    }

    Result<CatalogueSnapshot> LifecycleManager::reload()
    {
        auto fresh = walker_.build("/");
        if (!fresh)
        {
            logger_.log("lifecycle", "reload failed: ", describe(fresh.error()));
            return fresh.error();
        }
        snapshot_ = fresh.value();
        logger_.log("lifecycle", "reloaded: files=", snapshot_->all_files.size(),
                    " folders=", snapshot_->all_folders.size(), " total=", snapshot_->total_size);
        return snapshot_;
    }

    Result<FolderReport> LifecycleManager::create_folder(const std::string &name,
                                                         const std::optional<std::string> &path)
    {
        std::string target;
        if (path)
        {
            target = *path;
        }
        else
        {
            if (name.empty())
            {
                return make_error(ErrorCode::InvalidArgument, 0, "Folder name is empty");
            }
            std::optional<std::string> parent;
            if (decisions_.pick_parent_folder)
            {
                parent = decisions_.pick_parent_folder(*snapshot_);
            }
            target = parent ? resource::join_path(*parent, name) : name;
        }
        if (resource::strip_disk_prefix(target).empty())
        {
            return make_error(ErrorCode::InvalidArgument, 0, "Cannot create the disk root");
        }

        auto created = resolver_.create_folder(target);
        if (!created)
        {
            return created.error();
        }
        logger_.log("lifecycle", "create ", target, ": ", to_string(created.value()));

        if (auto reloaded = reload(); !reloaded)
        {
            return reloaded.error();
        }
        return FolderReport{.remote_path = target, .creation = created.value()};
    }

    Result<std::string> LifecycleManager::remove(const std::vector<resource::RemoteEntry> &entries,
                                                 std::optional<bool> permanently)
    {
        if (entries.empty())
        {
            return make_error(ErrorCode::InvalidArgument, 0, "Nothing to delete");
        }
        if (!permanently)
        {
            permanently = decisions_.delete_permanently ? decisions_.delete_permanently(entries) : false;
        }

        std::string names;
        for (const auto &entry : entries)
        {
            const auto &path = resource::entry_path(entry);
            const auto response = api_.remove(path, *permanently);
            if (!response.transport_ok() || response.status >= 300)
            {
                auto error = error_from_response(response, ErrorCode::TransferFailure);
                logger_.log("lifecycle", "delete aborted at ", path, ": ", describe(error));
                if (names.empty())
                {
                    return error;
                }
                return refresh_after(std::move(error));
            }
            if (auto gone = await_removal(path); !gone)
            {
                return refresh_after(gone.error());
            }
            logger_.log("lifecycle", "deleted ", path, *permanently ? " permanently" : " to trash");
            if (!names.empty())
            {
                names += ", ";
            }
            names += resource::entry_name(entry);
        }

        if (auto reloaded = reload(); !reloaded)
        {
            return reloaded.error();
        }
        return std::string(*permanently ? "Permanently deleted: " : "Moved to trash: ") + names;
    }

    Error LifecycleManager::refresh_after(Error error)
    {
        if (auto reloaded = reload(); !reloaded)
        {
            logger_.log("lifecycle", "snapshot may be stale after: ", describe(error));
        }
        return error;
    }

    Status LifecycleManager::await_removal(const std::string &path)
    {
        for (std::size_t attempt = 0; attempt < poll_.max_attempts; ++attempt)
        {
            auto state = api_.probe(path);
            if (state && state.value() == ExistenceState::NotFound)
            {
                return Status::success();
            }
            if (!state && !is_transient_status(state.error().status))
            {
                return state.error();
            }
            if (attempt + 1 < poll_.max_attempts && sleeper_)
            {
                sleeper_(poll_.delay_for(attempt));
            }
        }
        const auto waited = poll_.total_budget().count();
        logger_.log("lifecycle", "still present after ", poll_.max_attempts, " probes (", waited, " ms): ", path);
        return make_error(ErrorCode::Timeout, 0,
                          path + " still exists after " + std::to_string(poll_.max_attempts) + " checks over " +
                              std::to_string(waited) + " ms");
    }

} // namespace yadrive::client
