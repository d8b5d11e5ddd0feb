#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "yadrive/client/backoff.hpp"
#include "yadrive/client/disk_api.hpp"
#include "yadrive/client/logger.hpp"
#include "yadrive/resource.hpp"
#include "yadrive/result.hpp"

namespace yadrive::client
{

    // In-memory view of the whole remote tree as of one walk. Never patched in place:
    // any remote mutation is followed by a fresh walk.
    struct Catalogue
    {
        std::vector<resource::File> all_files;
        std::vector<resource::Folder> all_folders;
        std::uint64_t total_size{};

        // Accepts "disk:/a/b", "/a/b" and "a/b" alike.
        std::optional<resource::RemoteEntry> find_by_path(std::string_view path) const;

        // First match among files, then among folders.
        std::optional<resource::RemoteEntry> find_by_name(std::string_view name) const;
    };

    using CatalogueSnapshot = std::shared_ptr<const Catalogue>;

    // Called once per remote query; carries no information beyond "still working".
    using Heartbeat = std::function<void()>;

    class CatalogueWalker
    {
    public:
        CatalogueWalker(DiskApi &api, Logger logger, BackoffPolicy retry, Sleeper sleeper, std::size_t page_size);

        void set_heartbeat(Heartbeat heartbeat);

        // Depth-first walk below root_path, appending every entry to into.
        // Returns the total size of the subtree.
        Result<std::uint64_t> walk(const std::string &root_path, Catalogue &into);

        // Walks from root_path into a fresh catalogue.
        Result<CatalogueSnapshot> build(const std::string &root_path = "/");

    private:
        Result<resource::DirectoryPage> fetch_page(const std::string &path, std::size_t offset);

        DiskApi &api_;
        Logger logger_;
        BackoffPolicy retry_;
        Sleeper sleeper_;
        std::size_t page_size_;
        Heartbeat heartbeat_;
    };

} // namespace yadrive::client
