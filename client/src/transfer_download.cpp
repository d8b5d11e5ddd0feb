#include "yadrive/client/transfer_engine.hpp"

#include <fstream>
#include <system_error>

#include "yadrive/crypto.hpp"

namespace yadrive::client
{

    namespace
    {

        std::filesystem::path part_path(const std::filesystem::path &target)
        {
            auto part = target;
            part += ".part";
            return part;
        }

    } // namespace

    Result<DownloadReport> TransferEngine::download(const resource::RemoteEntry &entry)
    {
        DownloadReport report;
        report.local_path = local_path_for(resource::entry_path(entry));

        if (const auto *folder = std::get_if<resource::Folder>(&entry))
        {
            if (auto status = download_folder(folder->path, report); !status)
            {
                return status.error();
            }
            report.message = "Folder " + folder->name + " downloaded to " + report.local_path.string() + " (" +
                             std::to_string(report.files) + " files, " + std::to_string(report.bytes) + " bytes)";
        }
        else
        {
            const auto &file = std::get<resource::File>(entry);
            const auto directory = report.local_path.parent_path();
            std::error_code ec;
            std::filesystem::create_directories(directory, ec);
            if (ec)
            {
                return make_error(ErrorCode::LocalIo, 0, "Cannot create " + directory.string() + ": " + ec.message());
            }
            if (auto status = download_file(file, directory, report); !status)
            {
                return status.error();
            }
            report.message = "File " + file.name + " downloaded to " + report.local_path.string();
        }
        logger_.log("download", report.message);
        return report;
    }

    Status TransferEngine::download_folder(const std::string &remote_path, DownloadReport &report)
    {
        const auto directory = local_path_for(remote_path);
        std::error_code ec;
        if (std::filesystem::is_directory(directory, ec))
        {
            logger_.log("download", "local directory already exists: ", directory.string());
            report.existing_directories.push_back(directory);
        }
        else
        {
            std::filesystem::create_directories(directory, ec);
            if (ec)
            {
                return make_error(ErrorCode::LocalIo, 0, "Cannot create " + directory.string() + ": " + ec.message());
            }
        }
        ++report.folders;

        std::size_t offset = 0;
        while (true)
        {
            const auto response = api_.metadata_page(remote_path, page_size_, offset);
            if (!response.ok())
            {
                return error_from_response(response,
                                           response.status == 404 ? ErrorCode::NotFound : ErrorCode::TransferFailure);
            }
            const auto body = parse_body(response);
            if (!body || !resource::has_directory_listing(*body))
            {
                return make_error(ErrorCode::InvalidResponse, response.status, "No listing for " + remote_path);
            }

            resource::DirectoryPage page;
            try
            {
                page = body->get<resource::DirectoryPage>();
                for (const auto &item : page.items)
                {
                    const auto child = resource::entry_from_json(item);
                    Status status;
                    if (const auto *folder = std::get_if<resource::Folder>(&child))
                    {
                        status = download_folder(folder->path, report);
                    }
                    else
                    {
                        status = download_file(std::get<resource::File>(child), directory, report);
                    }
                    if (!status)
                    {
                        return status;
                    }
                }
            }
            catch (const nlohmann::json::exception &ex)
            {
                return make_error(ErrorCode::InvalidResponse, response.status, ex.what());
            }
            catch (const resource::ResourceError &ex)
            {
                logger_.log("download", "unsupported item below ", remote_path, ": ", ex.what());
                return make_error(ErrorCode::InvalidResponse, response.status, ex.what());
            }

            offset += page.items.size();
            if (page.items.empty() || offset >= page.total)
            {
                break;
            }
        }
        return Status::success();
    }

    Status TransferEngine::download_file(const resource::File &file, const std::filesystem::path &directory,
                                         DownloadReport &report)
    {
        auto link = file.link;
        auto sha256 = file.sha256;
        if (link.empty())
        {
            // listings from older snapshots may omit the link; ask for fresh metadata
            const auto response = api_.metadata(file.path);
            if (!response.ok())
            {
                return error_from_response(response, ErrorCode::TransferFailure);
            }
            const auto body = parse_body(response);
            if (body && body->is_object())
            {
                link = body->value("file", std::string{});
                sha256 = body->value("sha256", sha256);
            }
            if (link.empty())
            {
                return make_error(ErrorCode::InvalidResponse, response.status, "No download link for " + file.path);
            }
        }

        auto bytes = stream_to_file(link, directory / file.name, file.size, sha256);
        if (!bytes)
        {
            return bytes.error();
        }
        ++report.files;
        report.bytes += bytes.value();
        return Status::success();
    }

    Result<std::uint64_t> TransferEngine::stream_to_file(const std::string &link, const std::filesystem::path &target,
                                                         std::uint64_t expected_size,
                                                         const std::string &expected_sha256)
    {
        const auto part = part_path(target);
        std::ofstream out(part, std::ios::binary | std::ios::trunc);
        if (!out.is_open())
        {
            return make_error(ErrorCode::LocalIo, 0, "Could not open " + part.string() + " for writing");
        }

        ProgressTracker tracker(target.filename().string(), expected_size, progress_);
        auto response = api_.download(link, tracker.wrap(
                                                [&out](const char *data, std::size_t size)
                                                {
                                                    out.write(data, static_cast<std::streamsize>(size));
                                                    return static_cast<bool>(out);
                                                }));
        out.close();

        std::error_code ec;
        if (!response.ok())
        {
            std::filesystem::remove(part, ec);
            return error_from_response(response, ErrorCode::TransferFailure);
        }
        if (out.fail())
        {
            std::filesystem::remove(part, ec);
            return make_error(ErrorCode::LocalIo, 0, "Write to " + part.string() + " failed");
        }
        if (!expected_sha256.empty())
        {
            const auto actual = crypto::hash_file(part);
            if (actual != expected_sha256)
            {
                std::filesystem::remove(part, ec);
                logger_.log("download", "hash mismatch for ", target.string(), " expected=", expected_sha256,
                            " actual=", actual);
                return make_error(ErrorCode::InvalidResponse, response.status,
                                  "Checksum mismatch for " + target.filename().string());
            }
        }

        std::filesystem::rename(part, target, ec);
        if (ec)
        {
            return make_error(ErrorCode::LocalIo, 0, "Cannot move " + part.string() + ": " + ec.message());
        }
        tracker.finish();
        logger_.log("download", target.string(), " bytes=", tracker.transferred());
        return tracker.transferred();
    }

} // namespace yadrive::client
