#include "yadrive/resource.hpp"

#include <array>
#include <stdexcept>

namespace yadrive::resource
{

    namespace
    {

        struct ResourceTypeMapping
        {
            ResourceType type;
            std::string_view label;
        };

        constexpr std::array<ResourceTypeMapping, 2> kTypeMappings{{
            {ResourceType::File, "file"},
            {ResourceType::Dir, "dir"},
        }};

        constexpr std::string_view kDiskScheme = "disk:";

        std::string string_or_empty(const nlohmann::json &json, const char *key)
        {
            const auto it = json.find(key);
            if (it == json.end() || it->is_null())
            {
                return {};
            }
            if (it->is_string())
            {
                return it->get<std::string>();
            }
            // revision comes back as a number
            return it->dump();
        }

        void require_type(const nlohmann::json &json, ResourceType expected)
        {
            const auto label = json.at("type").get<std::string>();
            const auto type = resource_type_from_string(label);
            if (!type || *type != expected)
            {
                throw ResourceError("Unexpected resource type: " + label);
            }
        }

    } // namespace

    ResourceError::ResourceError(const std::string &message) : std::runtime_error(message) {}

    std::string_view to_string(ResourceType type) noexcept
    {
        for (const auto &mapping : kTypeMappings)
        {
            if (mapping.type == type)
            {
                return mapping.label;
            }
        }
        return "unknown";
    }

    std::optional<ResourceType> resource_type_from_string(std::string_view value) noexcept
    {
        for (const auto &mapping : kTypeMappings)
        {
            if (mapping.label == value)
            {
                return mapping.type;
            }
        }
        return std::nullopt;
    }

    void to_json(nlohmann::json &json, const File &file)
    {
        json = {
            {"type", to_string(ResourceType::File)},
            {"path", file.path},
            {"name", file.name},
            {"resource_id", file.resource_id},
            {"revision", file.revision},
            {"size", file.size},
            {"created", file.created},
            {"modified", file.modified},
            {"file", file.link},
            {"mime_type", file.mime_type},
            {"media_type", file.media_type},
            {"sha256", file.sha256},
            {"md5", file.md5},
            {"antivirus_status", file.antivirus_status},
            {"exif", file.exif},
        };
    }

    void from_json(const nlohmann::json &json, File &file)
    {
        require_type(json, ResourceType::File);
        file.path = json.at("path").get<std::string>();
        file.name = json.at("name").get<std::string>();
        file.size = json.value("size", std::uint64_t{0});
        file.resource_id = string_or_empty(json, "resource_id");
        file.revision = string_or_empty(json, "revision");
        file.created = string_or_empty(json, "created");
        file.modified = string_or_empty(json, "modified");
        file.link = string_or_empty(json, "file");
        file.mime_type = string_or_empty(json, "mime_type");
        file.media_type = string_or_empty(json, "media_type");
        file.sha256 = string_or_empty(json, "sha256");
        file.md5 = string_or_empty(json, "md5");
        file.antivirus_status = string_or_empty(json, "antivirus_status");
        file.exif = json.value("exif", nlohmann::json::object());
    }

    void to_json(nlohmann::json &json, const Folder &folder)
    {
        json = {
            {"type", to_string(ResourceType::Dir)},
            {"path", folder.path},
            {"name", folder.name},
            {"resource_id", folder.resource_id},
            {"revision", folder.revision},
            {"size", folder.size},
            {"created", folder.created},
            {"modified", folder.modified},
            {"exif", folder.exif},
        };
    }

    void from_json(const nlohmann::json &json, Folder &folder)
    {
        require_type(json, ResourceType::Dir);
        folder.path = json.at("path").get<std::string>();
        folder.name = json.at("name").get<std::string>();
        folder.size = json.value("size", std::uint64_t{0});
        folder.resource_id = string_or_empty(json, "resource_id");
        folder.revision = string_or_empty(json, "revision");
        folder.created = string_or_empty(json, "created");
        folder.modified = string_or_empty(json, "modified");
        folder.exif = json.value("exif", nlohmann::json::object());
    }

    RemoteEntry entry_from_json(const nlohmann::json &json)
    {
        const auto label = json.at("type").get<std::string>();
        const auto type = resource_type_from_string(label);
        if (!type)
        {
            throw ResourceError("Unknown resource type: " + label);
        }
        if (*type == ResourceType::Dir)
        {
            return json.get<Folder>();
        }
        return json.get<File>();
    }

    ResourceType entry_type(const RemoteEntry &entry) noexcept
    {
        return std::holds_alternative<Folder>(entry) ? ResourceType::Dir : ResourceType::File;
    }

    const std::string &entry_path(const RemoteEntry &entry) noexcept
    {
        return std::visit([](const auto &item) -> const std::string & { return item.path; }, entry);
    }

    const std::string &entry_name(const RemoteEntry &entry) noexcept
    {
        return std::visit([](const auto &item) -> const std::string & { return item.name; }, entry);
    }

    std::uint64_t entry_size(const RemoteEntry &entry) noexcept
    {
        return std::visit([](const auto &item) { return item.size; }, entry);
    }

    void from_json(const nlohmann::json &json, DirectoryPage &page)
    {
        const auto &embedded = json.at("_embedded");
        page.path = embedded.value("path", json.value("path", std::string{}));
        page.items = embedded.at("items").get<std::vector<nlohmann::json>>();
        page.total = embedded.value("total", static_cast<std::uint64_t>(page.items.size()));
        page.offset = embedded.value("offset", std::uint64_t{0});
        page.limit = embedded.value("limit", static_cast<std::uint64_t>(page.items.size()));
    }

    bool has_directory_listing(const nlohmann::json &metadata) noexcept
    {
        const auto it = metadata.find("_embedded");
        return it != metadata.end() && it->is_object() && it->contains("items");
    }

    std::string strip_disk_prefix(std::string_view remote_path)
    {
        if (remote_path.substr(0, kDiskScheme.size()) == kDiskScheme)
        {
            remote_path.remove_prefix(kDiskScheme.size());
        }
        while (!remote_path.empty() && remote_path.front() == '/')
        {
            remote_path.remove_prefix(1);
        }
        while (!remote_path.empty() && remote_path.back() == '/')
        {
            remote_path.remove_suffix(1);
        }
        return std::string(remote_path);
    }

    std::string parent_path(std::string_view remote_path)
    {
        while (remote_path.size() > 1 && remote_path.back() == '/')
        {
            remote_path.remove_suffix(1);
        }
        const auto slash = remote_path.rfind('/');
        if (slash == std::string_view::npos)
        {
            return {};
        }
        auto parent = remote_path.substr(0, slash);
        if (parent.empty() || parent == kDiskScheme)
        {
            return std::string(parent) + "/";
        }
        return std::string(parent);
    }

    std::string join_path(std::string_view parent, std::string_view name)
    {
        std::string base(parent);
        while (!base.empty() && base.back() == '/')
        {
            base.pop_back();
        }
        while (!name.empty() && name.front() == '/')
        {
            name.remove_prefix(1);
        }
        if (base.empty())
        {
            return std::string(name);
        }
        return base + "/" + std::string(name);
    }

    std::string base_name(std::string_view name)
    {
        const auto dot = name.find('.');
        return std::string(name.substr(0, dot));
    }

} // namespace yadrive::resource
