#include "yadrive/client/session.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

namespace yadrive::client
{

    namespace
    {

        void print_entry(const resource::RemoteEntry &entry)
        {
            std::cout << (resource::entry_type(entry) == resource::ResourceType::Dir ? "[DIR ] " : "[FILE] ")
                      << resource::entry_path(entry) << "  (" << format_size(resource::entry_size(entry)) << ")"
                      << std::endl;
        }

    } // namespace

    std::optional<resource::ResourceType> ClientSession::parse_kind(const std::vector<std::string> &args,
                                                                   const std::string &usage) const
    {
        if (args.size() == 1)
        {
            if (args[0] == "files" || args[0] == "file")
            {
                return resource::ResourceType::File;
            }
            if (args[0] == "folders" || args[0] == "folder")
            {
                return resource::ResourceType::Dir;
            }
        }
        std::cout << "ERROR: invalid_usage" << std::endl;
        std::cout << "Usage: " << usage << std::endl;
        return std::nullopt;
    }

    std::optional<resource::RemoteEntry> ClientSession::find_entry(const std::string &input) const
    {
        const auto &catalogue = *lifecycle_.snapshot();
        if (auto entry = catalogue.find_by_path(input))
        {
            return entry;
        }
        return catalogue.find_by_name(input);
    }

    bool ClientSession::handle_list(const std::vector<std::string> &args)
    {
        const auto kind = parse_kind(args, "LIST files|folders");
        if (!kind)
        {
            return true;
        }
        const auto entries = entries_of(*lifecycle_.snapshot(), *kind);
        std::cout << "OK" << std::endl;
        for (std::size_t index = 0; index < entries.size(); ++index)
        {
            std::cout << index << ". ";
            print_entry(entries[index]);
        }
        return true;
    }

    bool ClientSession::handle_top10(const std::vector<std::string> &args)
    {
        const auto kind = parse_kind(args, "TOP10 files|folders");
        if (!kind)
        {
            return true;
        }
        const auto entries = top10(*lifecycle_.snapshot(), *kind);
        std::cout << "OK" << std::endl;
        for (std::size_t index = 0; index < entries.size(); ++index)
        {
            std::cout << index + 1 << ". ";
            print_entry(entries[index]);
        }
        return true;
    }

    bool ClientSession::handle_biggest(const std::vector<std::string> &args)
    {
        const auto kind = parse_kind(args, "BIGGEST files|folders");
        if (!kind)
        {
            return true;
        }
        auto biggest = reports_.find_biggest(*lifecycle_.snapshot(), *kind);
        if (!biggest)
        {
            print_error(biggest.error());
            return true;
        }
        std::cout << "OK" << std::endl;
        print_entry(biggest.value());
        std::cout << "Saved to " << reports_.biggest_report_path(*kind).string() << std::endl;
        return true;
    }

    bool ClientSession::handle_mkdir(const std::vector<std::string> &args)
    {
        if (args.empty() || args.size() > 2)
        {
            std::cout << "ERROR: invalid_usage" << std::endl;
            std::cout << "Usage: MKDIR <name> [remote_path]" << std::endl;
            return true;
        }
        std::optional<std::string> path;
        if (args.size() == 2)
        {
            path = args[1];
        }
        auto created = lifecycle_.create_folder(args[0], path);
        if (!created)
        {
            print_error(created.error());
            return true;
        }
        std::cout << "OK" << std::endl;
        std::cout << created.value().remote_path
                  << (created.value().creation == FolderCreation::Created ? " created" : " already exists") << std::endl;
        return true;
    }

    bool ClientSession::handle_delete(const std::vector<std::string> &args)
    {
        std::optional<bool> permanently;
        std::vector<resource::RemoteEntry> entries;
        for (const auto &arg : args)
        {
            if (arg == "--permanent")
            {
                permanently = true;
                continue;
            }
            auto entry = find_entry(arg);
            if (!entry)
            {
                std::cout << "ERROR: " << yadrive::to_string(ErrorCode::NotFound) << std::endl;
                std::cout << arg << " is not in the catalogue" << std::endl;
                return true;
            }
            entries.push_back(std::move(*entry));
        }
        if (entries.empty())
        {
            std::cout << "ERROR: invalid_usage" << std::endl;
            std::cout << "Usage: DELETE <remote_path>... [--permanent]" << std::endl;
            return true;
        }

        auto removed = lifecycle_.remove(entries, permanently);
        if (!removed)
        {
            print_error(removed.error());
            return true;
        }
        std::cout << "OK" << std::endl;
        std::cout << removed.value() << std::endl;
        return true;
    }

    bool ClientSession::handle_upload(const std::vector<std::string> &args)
    {
        if (args.size() != 1)
        {
            std::cout << "ERROR: invalid_usage" << std::endl;
            std::cout << "Usage: UPLOAD <local_name_or_path>" << std::endl;
            return true;
        }
        const auto snapshot = lifecycle_.snapshot();
        auto report = transfers_.upload(std::filesystem::path(args[0]), *snapshot);
        if (!report)
        {
            print_error(report.error());
            if (upload_may_have_changed_remote(report.error()))
            {
                reload();
            }
            return true;
        }
        print_upload_report(report.value());
        reload();
        return true;
    }

    bool ClientSession::handle_import(const std::vector<std::string> &args)
    {
        if (args.size() != 2)
        {
            std::cout << "ERROR: invalid_usage" << std::endl;
            std::cout << "Usage: IMPORT <album> <photos.json>" << std::endl;
            return true;
        }
        std::ifstream in(args[1]);
        if (!in.is_open())
        {
            std::cout << "ERROR: " << yadrive::to_string(ErrorCode::NotFoundLocally) << std::endl;
            std::cout << "Cannot read " << args[1] << std::endl;
            return true;
        }
        UrlImport request{.album = args[0]};
        try
        {
            request.photos = nlohmann::json::parse(in).get<std::vector<PhotoRef>>();
        }
        catch (const nlohmann::json::exception &ex)
        {
            std::cout << "ERROR: " << yadrive::to_string(ErrorCode::InvalidArgument) << std::endl;
            std::cout << args[1] << ": " << ex.what() << std::endl;
            return true;
        }

        auto report = transfers_.upload(request, *lifecycle_.snapshot());
        if (!report)
        {
            print_error(report.error());
            if (upload_may_have_changed_remote(report.error()))
            {
                reload();
            }
            return true;
        }
        print_upload_report(report.value());
        reload();
        return true;
    }

    bool ClientSession::handle_download(const std::vector<std::string> &args)
    {
        if (args.size() != 1)
        {
            std::cout << "ERROR: invalid_usage" << std::endl;
            std::cout << "Usage: DOWNLOAD <remote_path>" << std::endl;
            return true;
        }
        const auto entry = find_entry(args[0]);
        if (!entry)
        {
            std::cout << "ERROR: " << yadrive::to_string(ErrorCode::NotFound) << std::endl;
            std::cout << args[0] << " is not in the catalogue" << std::endl;
            return true;
        }
        auto report = transfers_.download(*entry);
        if (!report)
        {
            print_error(report.error());
            return true;
        }
        std::cout << "OK" << std::endl;
        for (const auto &existing : report.value().existing_directories)
        {
            std::cout << "Local folder already existed: " << existing.string() << std::endl;
        }
        std::cout << report.value().message << std::endl;
        return true;
    }

    bool ClientSession::handle_zip(const std::vector<std::string> &args)
    {
        if (args.size() != 1)
        {
            std::cout << "ERROR: invalid_usage" << std::endl;
            std::cout << "Usage: ZIP <remote_path>" << std::endl;
            return true;
        }
        const auto entry = find_entry(args[0]);
        if (!entry)
        {
            std::cout << "ERROR: " << yadrive::to_string(ErrorCode::NotFound) << std::endl;
            std::cout << args[0] << " is not in the catalogue" << std::endl;
            return true;
        }
        auto zipped = reports_.zip_entry(*entry);
        if (!zipped)
        {
            print_error(zipped.error());
            return true;
        }
        std::cout << "OK" << std::endl;
        std::cout << zipped.value().archive.string() << " (" << zipped.value().entries << " entries)" << std::endl;
        return true;
    }

    void ClientSession::print_upload_report(const UploadReport &report) const
    {
        std::cout << (report.failures.empty() ? "OK" : "PARTIAL") << std::endl;
        for (const auto &item : report.items)
        {
            std::cout << (item.outcome == UploadOutcome::Uploaded ? "  uploaded  " : "  present   ") << item.remote_path
                      << std::endl;
        }
        for (const auto &[path, error] : report.failures)
        {
            std::cout << "  failed    " << path << ": " << describe(error) << std::endl;
        }
        std::cout << report.summary() << std::endl;
    }

} // namespace yadrive::client
