#include "yadrive/client/transfer_engine.hpp"

#include <algorithm>
#include <fstream>
#include <system_error>

namespace yadrive::client
{

    namespace
    {

        // An upload href is missing when the remote refuses the slot; an occupied path is the
        // common cause. Auth, throttling and server errors are not read that way.
        bool signals_collision(const http::Response &response)
        {
            if (!response.transport_ok())
            {
                return false;
            }
            const auto status = response.status;
            return status != 401 && status != 403 && !is_transient_status(status);
        }

    } // namespace

    Result<UploadReport> TransferEngine::upload(const UploadSource &source, const Catalogue &catalogue)
    {
        if (const auto *request = std::get_if<UrlImport>(&source))
        {
            return import_urls(*request);
        }
        auto object = resolver_.locate(std::get<std::filesystem::path>(source).string());
        if (!object)
        {
            return object.error();
        }
        if (object.value().is_directory)
        {
            return upload_directory(object.value());
        }
        return upload_file(object.value(), catalogue);
    }

    Result<UploadReport> TransferEngine::import_urls(const UrlImport &request)
    {
        if (request.album.empty())
        {
            return make_error(ErrorCode::InvalidArgument, 0, "Album name is empty");
        }
        UploadReport report;
        report.remote_folder = resource::join_path("photos", request.album);
        if (auto created = resolver_.ensure_folder(report.remote_folder); !created)
        {
            return created.error();
        }

        for (const auto &photo : request.photos)
        {
            const auto remote_path = resource::join_path(report.remote_folder, photo_file_name(photo));
            const auto response = api_.upload_from_url(remote_path, photo.url);
            if (response.ok())
            {
                report.items.push_back(UploadItem{.remote_path = remote_path, .outcome = UploadOutcome::Uploaded});
                logger_.log("upload", "import accepted: ", photo.url, " -> ", remote_path);
            }
            else
            {
                auto error = error_from_response(response, ErrorCode::TransferFailure);
                logger_.log("upload", "import failed: ", photo.url, " ", describe(error));
                report.failures.emplace_back(remote_path, std::move(error));
            }
        }
        return report;
    }

    Result<UploadReport> TransferEngine::upload_directory(const LocalObject &directory)
    {
        UploadReport report;
        report.remote_folder = directory.relative;
        if (auto created = resolver_.ensure_folder(report.remote_folder); !created)
        {
            return created.error();
        }

        std::vector<std::filesystem::path> files;
        std::error_code ec;
        for (std::filesystem::directory_iterator it(directory.local_path, ec), end; !ec && it != end; it.increment(ec))
        {
            if (it->is_regular_file(ec))
            {
                files.push_back(it->path());
            }
        }
        if (ec)
        {
            return make_error(ErrorCode::LocalIo, 0, "Cannot list " + directory.local_path.string() + ": " + ec.message());
        }
        std::sort(files.begin(), files.end());

        for (const auto &file : files)
        {
            const auto remote_path = resource::join_path(report.remote_folder, file.filename().generic_string());
            auto outcome = upload_one(file, remote_path);
            if (!outcome)
            {
                report.failures.emplace_back(remote_path, outcome.error());
                continue;
            }
            std::error_code size_ec;
            const auto size = std::filesystem::file_size(file, size_ec);
            report.items.push_back(UploadItem{
                .remote_path = remote_path,
                .outcome = outcome.value(),
                .bytes = size_ec ? 0 : static_cast<std::uint64_t>(size),
            });
        }
        return report;
    }

    Result<UploadReport> TransferEngine::upload_file(const LocalObject &file, const Catalogue &catalogue)
    {
        auto target = resolver_.resolve_upload_target(file, catalogue);
        if (!target)
        {
            return target.error();
        }
        const auto &resolved = target.value();
        if (!resolved.matched_by_name)
        {
            if (auto created = resolver_.ensure_folder(resolved.remote_folder); !created)
            {
                return created.error();
            }
        }

        UploadReport report;
        report.remote_folder = resolved.remote_folder;
        auto outcome = upload_one(file.local_path, resolved.remote_path);
        if (!outcome)
        {
            report.failures.emplace_back(resolved.remote_path, outcome.error());
            return report;
        }
        std::error_code ec;
        const auto size = std::filesystem::file_size(file.local_path, ec);
        report.items.push_back(UploadItem{
            .remote_path = resolved.remote_path,
            .outcome = outcome.value(),
            .bytes = ec ? 0 : static_cast<std::uint64_t>(size),
        });
        return report;
    }

    Result<UploadOutcome> TransferEngine::upload_one(const std::filesystem::path &local_path,
                                                     const std::string &remote_path)
    {
        const auto slot = api_.request_upload_url(remote_path);
        std::string href;
        if (const auto body = parse_body(slot); body && body->is_object())
        {
            href = body->value("href", std::string{});
        }
        if (href.empty())
        {
            if (signals_collision(slot))
            {
                logger_.log("upload", "already present, skipped: ", remote_path, " status=", slot.status);
                return UploadOutcome::AlreadyPresent;
            }
            return error_from_response(slot, slot.transport_ok() ? ErrorCode::TransferFailure : ErrorCode::TransportError);
        }

        std::ifstream in(local_path, std::ios::binary);
        if (!in.is_open())
        {
            return make_error(ErrorCode::LocalIo, 0, "Could not open " + local_path.string() + " for reading");
        }
        std::error_code ec;
        const auto size = std::filesystem::file_size(local_path, ec);
        if (ec)
        {
            return make_error(ErrorCode::LocalIo, 0, "Cannot stat " + local_path.string() + ": " + ec.message());
        }

        ProgressTracker tracker(local_path.filename().string(), size, progress_);
        const auto response = api_.upload_content(href, in, size, tracker.upload_callback());
        if (!response.ok())
        {
            auto error = error_from_response(response, ErrorCode::TransferFailure);
            logger_.log("upload", "failed: ", remote_path, " ", describe(error));
            return error;
        }
        tracker.finish();
        logger_.log("upload", local_path.string(), " -> ", remote_path, " bytes=", size);
        return UploadOutcome::Uploaded;
    }

} // namespace yadrive::client
