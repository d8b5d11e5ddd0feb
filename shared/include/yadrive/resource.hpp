/**
 * yadrive - Remote resource model (files and folders) and its JSON codec.
 */
#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

namespace yadrive::resource
{

    // Thrown by the codec when an item's type is neither "file" nor "dir".
    class ResourceError : public std::runtime_error
    {
    public:
        explicit ResourceError(const std::string &message);
    };

    enum class ResourceType : std::uint8_t
    {
        File,
        Dir
    };

    std::string_view to_string(ResourceType type) noexcept;
    std::optional<ResourceType> resource_type_from_string(std::string_view value) noexcept;

    struct File
    {
        std::string path;
        std::string name;
        std::string resource_id;
        std::string revision;
        std::uint64_t size{};
        std::string created;
        std::string modified;
        std::string link;
        std::string mime_type;
        std::string media_type;
        std::string sha256;
        std::string md5;
        std::string antivirus_status;
        nlohmann::json exif{nlohmann::json::object()};
    };

    void to_json(nlohmann::json &json, const File &file);
    void from_json(const nlohmann::json &json, File &file);

    // size is derived: the sum of every file below the folder at the last catalogue walk.
    struct Folder
    {
        std::string path;
        std::string name;
        std::string resource_id;
        std::string revision;
        std::uint64_t size{};
        std::string created;
        std::string modified;
        nlohmann::json exif{nlohmann::json::object()};
    };

    void to_json(nlohmann::json &json, const Folder &folder);
    void from_json(const nlohmann::json &json, Folder &folder);

    using RemoteEntry = std::variant<File, Folder>;

    RemoteEntry entry_from_json(const nlohmann::json &json);

    ResourceType entry_type(const RemoteEntry &entry) noexcept;
    const std::string &entry_path(const RemoteEntry &entry) noexcept;
    const std::string &entry_name(const RemoteEntry &entry) noexcept;
    std::uint64_t entry_size(const RemoteEntry &entry) noexcept;

    // One page of a directory listing (the "_embedded" block of a metadata response).
    struct DirectoryPage
    {
        std::string path;
        std::vector<nlohmann::json> items;
        std::uint64_t total{};
        std::uint64_t offset{};
        std::uint64_t limit{};
    };

    void from_json(const nlohmann::json &json, DirectoryPage &page);

    bool has_directory_listing(const nlohmann::json &metadata) noexcept;

    // "disk:/a/b" -> "a/b"; "/" or "disk:/" -> "".
    std::string strip_disk_prefix(std::string_view remote_path);

    // "disk:/a/b" -> "disk:/a"; top level entries map to the disk root.
    std::string parent_path(std::string_view remote_path);

    // Joins without doubling separators; an empty parent yields the bare name.
    std::string join_path(std::string_view parent, std::string_view name);

    // Name without its extension, cut at the first dot.
    std::string base_name(std::string_view name);

} // namespace yadrive::resource
