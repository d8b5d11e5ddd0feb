#include "yadrive/client/reports.hpp"

#include <algorithm>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <system_error>
#include <utility>

#include <nlohmann/json.hpp>

#include "yadrive/archive.hpp"

namespace yadrive::client
{

    namespace
    {

        std::string two_decimals(double value)
        {
            std::ostringstream out;
            out << std::fixed << std::setprecision(2) << value;
            return out.str();
        }

        Status write_json(const std::filesystem::path &path, const nlohmann::json &json)
        {
            std::ofstream out(path, std::ios::trunc);
            if (!out.is_open())
            {
                return make_error(ErrorCode::LocalIo, 0, "Could not open " + path.string() + " for writing");
            }
            out << json.dump();
            if (!out)
            {
                return make_error(ErrorCode::LocalIo, 0, "Write to " + path.string() + " failed");
            }
            return Status::success();
        }

        void add_tree(archive::ZipWriter &zip, const std::filesystem::path &root, const std::filesystem::path &base)
        {
            std::vector<std::filesystem::path> children;
            for (const auto &child : std::filesystem::directory_iterator(root))
            {
                children.push_back(child.path());
            }
            std::sort(children.begin(), children.end());

            zip.add_directory(root.lexically_relative(base).generic_string());
            for (const auto &child : children)
            {
                if (std::filesystem::is_directory(child))
                {
                    add_tree(zip, child, base);
                }
                else if (std::filesystem::is_regular_file(child))
                {
                    zip.add_file(child, child.lexically_relative(base).generic_string());
                }
            }
        }

    } // namespace

    std::string format_size(std::uint64_t bytes)
    {
        const auto kilobytes = static_cast<std::uint64_t>(static_cast<double>(bytes) / 1024.0 + 0.5);
        if (kilobytes > 100000)
        {
            return two_decimals(static_cast<double>(kilobytes) / (1024.0 * 1024.0)) + " GB";
        }
        // exactly 100000 KB stays in KB
        if (kilobytes > 1000 && kilobytes < 100000)
        {
            return two_decimals(static_cast<double>(kilobytes) / 1024.0) + " MB";
        }
        return std::to_string(kilobytes) + " KB";
    }

    std::vector<resource::RemoteEntry> entries_of(const Catalogue &catalogue, resource::ResourceType type)
    {
        std::vector<resource::RemoteEntry> entries;
        if (type == resource::ResourceType::File)
        {
            entries.assign(catalogue.all_files.begin(), catalogue.all_files.end());
        }
        else
        {
            entries.assign(catalogue.all_folders.begin(), catalogue.all_folders.end());
        }
        return entries;
    }

    std::vector<resource::RemoteEntry> top10(const Catalogue &catalogue, resource::ResourceType type)
    {
        auto entries = entries_of(catalogue, type);
        std::stable_sort(entries.begin(), entries.end(),
                         [](const resource::RemoteEntry &lhs, const resource::RemoteEntry &rhs)
                         { return resource::entry_size(lhs) > resource::entry_size(rhs); });
        if (entries.size() > 10)
        {
            entries.resize(10);
        }
        return entries;
    }

    Reports::Reports(Logger logger, std::filesystem::path reports_dir, std::filesystem::path download_root)
        : logger_(std::move(logger)), reports_dir_(std::move(reports_dir)), download_root_(std::move(download_root))
    {
    }

    std::filesystem::path Reports::biggest_report_path(resource::ResourceType type) const
    {
        return reports_dir_ /
               (type == resource::ResourceType::File ? "biggest_file_info.json" : "biggest_folder_info.json");
    }

    Result<resource::RemoteEntry> Reports::find_biggest(const Catalogue &catalogue, resource::ResourceType type) const
    {
        const auto entries = entries_of(catalogue, type);
        if (entries.empty())
        {
            return make_error(ErrorCode::NotFound, 0, std::string("No ") + (type == resource::ResourceType::File ? "files" : "folders") +
                                                          " in the catalogue");
        }
        // first of the largest wins, as max_element keeps the earliest on ties
        const auto biggest = std::max_element(entries.begin(), entries.end(),
                                              [](const resource::RemoteEntry &lhs, const resource::RemoteEntry &rhs)
                                              { return resource::entry_size(lhs) < resource::entry_size(rhs); });

        std::error_code ec;
        std::filesystem::create_directories(reports_dir_, ec);
        nlohmann::json report = nlohmann::json::object();
        report[resource::entry_name(*biggest)] = resource::entry_size(*biggest);
        if (auto written = write_json(biggest_report_path(type), report); !written)
        {
            return written.error();
        }
        logger_.log("report", "biggest ", resource::to_string(type), ": ", resource::entry_path(*biggest), " ",
                    resource::entry_size(*biggest));
        return *biggest;
    }

    std::optional<std::filesystem::path> Reports::find_downloaded(const resource::RemoteEntry &entry) const
    {
        std::error_code ec;
        const auto relative = resource::strip_disk_prefix(resource::entry_path(entry));
        if (!relative.empty())
        {
            const auto mirrored = download_root_ / std::filesystem::path(relative);
            if (std::filesystem::exists(mirrored, ec))
            {
                return mirrored;
            }
        }

        const auto &name = resource::entry_name(entry);
        std::filesystem::recursive_directory_iterator it(download_root_,
                                                         std::filesystem::directory_options::skip_permission_denied, ec);
        const std::filesystem::recursive_directory_iterator end{};
        std::optional<std::filesystem::path> found;
        while (!ec && it != end)
        {
            // the last match wins, like a full directory walk that keeps overwriting
            if (it->path().filename() == name)
            {
                found = it->path();
            }
            it.increment(ec);
        }
        return found;
    }

    Result<ZipReport> Reports::zip_entry(const resource::RemoteEntry &entry) const
    {
        const auto source = find_downloaded(entry);
        if (!source)
        {
            return make_error(ErrorCode::NotFoundLocally, 0,
                              resource::entry_name(entry) + " has not been downloaded to " + download_root_.string());
        }

        const auto stem = std::filesystem::path(resource::entry_name(entry)).stem().string();
        ZipReport report;
        report.archive = download_root_ / (stem + ".zip");
        report.sidecar = download_root_ / (stem + ".zip_info.json");

        try
        {
            archive::ZipWriter zip(report.archive);
            if (std::holds_alternative<resource::File>(entry))
            {
                zip.add_file(*source, resource::entry_name(entry));
            }
            else
            {
                add_tree(zip, *source, download_root_);
            }
            zip.finish();
            report.entries = zip.entries().size();
        }
        catch (const archive::ArchiveError &ex)
        {
            return make_error(ErrorCode::LocalIo, 0, ex.what());
        }
        catch (const std::filesystem::filesystem_error &ex)
        {
            return make_error(ErrorCode::LocalIo, 0, ex.what());
        }

        const nlohmann::json info{
            {"file_name", resource::entry_name(entry)},
            {"size", resource::entry_size(entry)},
            {"path", resource::entry_path(entry)},
        };
        if (auto written = write_json(report.sidecar, info); !written)
        {
            return written.error();
        }
        logger_.log("report", "archived ", source->string(), " -> ", report.archive.string(), " entries=",
                    report.entries);
        return report;
    }

} // namespace yadrive::client
