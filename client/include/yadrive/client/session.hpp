#pragma once

#include <optional>
#include <string>
#include <vector>

#include "yadrive/client/catalogue.hpp"
#include "yadrive/client/config.hpp"
#include "yadrive/client/disk_api.hpp"
#include "yadrive/client/lifecycle.hpp"
#include "yadrive/client/logger.hpp"
#include "yadrive/client/path_resolver.hpp"
#include "yadrive/client/reports.hpp"
#include "yadrive/client/transfer_engine.hpp"
#include "yadrive/http.hpp"
#include "yadrive/resource.hpp"
#include "yadrive/result.hpp"

namespace yadrive::client
{

    class ClientSession
    {
    public:
        ClientSession(ClientConfig config, Logger logger, http::Client &transport);

        int run();

    private:
        bool ask_yes_no(const std::string &question) const;
        std::optional<std::string> prompt_parent_folder(const Catalogue &catalogue) const;
        void interactive_shell();
        bool dispatch(const std::string &command, const std::vector<std::string> &args);
        bool reload();

        bool handle_list(const std::vector<std::string> &args);
        bool handle_top10(const std::vector<std::string> &args);
        bool handle_biggest(const std::vector<std::string> &args);
        bool handle_mkdir(const std::vector<std::string> &args);
        bool handle_delete(const std::vector<std::string> &args);
        bool handle_upload(const std::vector<std::string> &args);
        bool handle_import(const std::vector<std::string> &args);
        bool handle_download(const std::vector<std::string> &args);
        bool handle_zip(const std::vector<std::string> &args);

        std::optional<resource::ResourceType> parse_kind(const std::vector<std::string> &args,
                                                         const std::string &usage) const;
        // Catalogue lookup by remote path first, then by bare name.
        std::optional<resource::RemoteEntry> find_entry(const std::string &input) const;
        void print_upload_report(const UploadReport &report) const;
        void print_help() const;
        void print_error(const Error &error) const;

        ClientConfig config_;
        Logger logger_;
        DiskApi api_;
        PathResolver resolver_;
        CatalogueWalker walker_;
        LifecycleManager lifecycle_;
        TransferEngine transfers_;
        Reports reports_;
    };

} // namespace yadrive::client
