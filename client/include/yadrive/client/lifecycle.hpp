#pragma once

#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "yadrive/client/backoff.hpp"
#include "yadrive/client/catalogue.hpp"
#include "yadrive/client/disk_api.hpp"
#include "yadrive/client/logger.hpp"
#include "yadrive/client/path_resolver.hpp"
#include "yadrive/resource.hpp"
#include "yadrive/result.hpp"

namespace yadrive::client
{

    // Choices the core never makes on its own. Unset callbacks fall back to
    // "disk root" and "move to trash".
    struct Decisions
    {
        // Returns the parent folder for a new folder, or nullopt for the disk root.
        std::function<std::optional<std::string>(const Catalogue &)> pick_parent_folder;
        std::function<bool(const std::vector<resource::RemoteEntry> &)> delete_permanently;
    };

    struct FolderReport
    {
        std::string remote_path;
        FolderCreation creation{FolderCreation::Created};
    };

    class LifecycleManager
    {
    public:
        LifecycleManager(DiskApi &api, PathResolver &resolver, CatalogueWalker &walker, Logger logger,
                         BackoffPolicy poll, Sleeper sleeper, Decisions decisions = {});

        const CatalogueSnapshot &snapshot() const noexcept { return snapshot_; }

        // Re-walks the whole disk; the previous snapshot stays valid for whoever holds it.
        Result<CatalogueSnapshot> reload();

        // With a path the folder is created exactly there; without one the parent comes
        // from Decisions::pick_parent_folder.
        Result<FolderReport> create_folder(const std::string &name, const std::optional<std::string> &path = std::nullopt);

        // Sequential; the first failure aborts the batch and earlier deletions stay deleted.
        // The snapshot is rebuilt whenever something was deleted, failure or not.
        // permanently unset asks Decisions::delete_permanently.
        Result<std::string> remove(const std::vector<resource::RemoteEntry> &entries,
                                   std::optional<bool> permanently = std::nullopt);

        // Polls until the path reports NotFound; Timeout once the backoff budget is spent.
        Status await_removal(const std::string &path);

    private:
        // Reloads after a failed mutation and hands the original error back.
        Error refresh_after(Error error);

        DiskApi &api_;
        PathResolver &resolver_;
        CatalogueWalker &walker_;
        Logger logger_;
        BackoffPolicy poll_;
        Sleeper sleeper_;
        Decisions decisions_;
        CatalogueSnapshot snapshot_;
    };

} // namespace yadrive::client
