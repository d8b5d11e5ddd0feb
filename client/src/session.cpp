#include "yadrive/client/session.hpp"

#include <cctype>
#include <iostream>
#include <sstream>
#include <utility>

#include "yadrive/error_codes.hpp"

namespace yadrive::client
{

    namespace
    {

        std::string trim(const std::string &input)
        {
            const auto begin = input.find_first_not_of(" \t\r\n");
            if (begin == std::string::npos)
            {
                return "";
            }
            const auto end = input.find_last_not_of(" \t\r\n");
            return input.substr(begin, end - begin + 1);
        }

        std::vector<std::string> split_tokens(const std::string &input)
        {
            std::vector<std::string> tokens;
            std::istringstream iss(input);
            std::string token;
            while (iss >> token)
            {
                tokens.push_back(token);
            }
            return tokens;
        }

        std::string to_upper(std::string value)
        {
            for (auto &ch : value)
            {
                ch = static_cast<char>(std::toupper(static_cast<unsigned char>(ch)));
            }
            return value;
        }

        void render_progress(const ProgressUpdate &update)
        {
            std::cout << "\r" << update.label << ": " << update.transferred;
            if (update.total > 0)
            {
                std::cout << " / " << update.total;
            }
            std::cout << " bytes" << std::flush;
            if (update.finished)
            {
                std::cout << " (" << format_size(static_cast<std::uint64_t>(update.bytes_per_second)) << "/s)"
                          << std::endl;
            }
        }

        BackoffPolicy walk_retry_policy(const ClientConfig &config)
        {
            return BackoffPolicy{
                .max_attempts = config.retry_attempts,
                .initial_delay = config.poll_initial_delay,
                .max_delay = config.poll_max_delay,
            };
        }

        BackoffPolicy delete_poll_policy(const ClientConfig &config)
        {
            return BackoffPolicy{
                .max_attempts = config.poll_attempts,
                .initial_delay = config.poll_initial_delay,
                .max_delay = config.poll_max_delay,
            };
        }

    } // namespace

    ClientSession::ClientSession(ClientConfig config, Logger logger, http::Client &transport)
        : config_(std::move(config)),
          logger_(std::move(logger)),
          api_(transport, config_.endpoint, config_.auth_scheme + " " + config_.token, logger_, config_.chunk_size),
          resolver_(api_, logger_, config_.working_root),
          walker_(api_, logger_, walk_retry_policy(config_), thread_sleeper(), config_.page_size),
          lifecycle_(api_, resolver_, walker_, logger_, delete_poll_policy(config_), thread_sleeper(),
                     Decisions{
                         .pick_parent_folder = [this](const Catalogue &catalogue)
                         { return prompt_parent_folder(catalogue); },
                         .delete_permanently = [this](const std::vector<resource::RemoteEntry> &)
                         { return ask_yes_no("Delete permanently, without the trash?"); },
                     }),
          transfers_(api_, resolver_, logger_, config_.download_root, config_.page_size),
          reports_(logger_, config_.reports_dir, config_.download_root)
    {
        walker_.set_heartbeat([]
                              { std::cout << '.' << std::flush; });
        transfers_.set_progress_callback(render_progress);
    }

    int ClientSession::run()
    {
        try
        {
            std::cout << "Loading disk catalogue" << std::flush;
            const bool loaded = reload();
            if (!loaded)
            {
                return 1;
            }
            interactive_shell();
        }
        catch (const std::exception &ex)
        {
            std::cerr << "ERROR: " << ex.what() << std::endl;
            logger_.log("error", "fatal: ", ex.what());
            return 1;
        }
        return 0;
    }

    bool ClientSession::reload()
    {
        auto snapshot = lifecycle_.reload();
        std::cout << std::endl;
        if (!snapshot)
        {
            print_error(snapshot.error());
            return false;
        }
        const auto &catalogue = *snapshot.value();
        std::cout << catalogue.all_files.size() << " files, " << catalogue.all_folders.size() << " folders, "
                  << format_size(catalogue.total_size) << " total" << std::endl;
        return true;
    }

    bool ClientSession::ask_yes_no(const std::string &question) const
    {
        while (true)
        {
            std::cout << question << " (y/n): " << std::flush;
            std::string answer;
            if (!std::getline(std::cin, answer))
            {
                return false;
            }
            answer = trim(to_upper(answer));
            if (answer == "Y" || answer == "YES")
            {
                return true;
            }
            if (answer == "N" || answer == "NO")
            {
                return false;
            }
            std::cout << "Please answer y or n." << std::endl;
        }
    }

    std::optional<std::string> ClientSession::prompt_parent_folder(const Catalogue &catalogue) const
    {
        std::cout << "Current folders:" << std::endl;
        for (std::size_t index = 0; index < catalogue.all_folders.size(); ++index)
        {
            std::cout << "  [" << index << "] " << catalogue.all_folders[index].path << std::endl;
        }
        while (true)
        {
            std::cout << "Parent folder index (Enter for the disk root): " << std::flush;
            std::string answer;
            if (!std::getline(std::cin, answer))
            {
                return std::nullopt;
            }
            answer = trim(answer);
            if (answer.empty())
            {
                return std::nullopt;
            }
            try
            {
                std::size_t consumed = 0;
                const auto index = std::stoul(answer, &consumed);
                if (consumed == answer.size() && index < catalogue.all_folders.size())
                {
                    return catalogue.all_folders[index].path;
                }
            }
            catch (const std::exception &)
            {
                // not a number, ask again
            }
            std::cout << "Enter an index from the list or leave empty." << std::endl;
        }
    }

    void ClientSession::interactive_shell()
    {
        while (true)
        {
            std::cout << "yadrive> " << std::flush;
            std::string line;
            if (!std::getline(std::cin, line))
            {
                std::cout << std::endl;
                break;
            }
            line = trim(line);
            if (line.empty())
            {
                continue;
            }
            logger_.log("cmd", line);

            const auto tokens = split_tokens(line);
            if (tokens.empty())
            {
                continue;
            }
            const auto command = to_upper(tokens[0]);
            const std::vector<std::string> args(tokens.begin() + 1, tokens.end());

            if (command == "EXIT" || command == "QUIT")
            {
                std::cout << "OK" << std::endl;
                break;
            }
            if (command == "HELP")
            {
                print_help();
                continue;
            }

            try
            {
                if (!dispatch(command, args))
                {
                    std::cout << "ERROR: unsupported_command" << std::endl;
                }
            }
            catch (const std::exception &ex)
            {
                std::cout << "ERROR: internal_error" << std::endl;
                std::cout << ex.what() << std::endl;
                logger_.log("error", "command failed: ", ex.what());
            }
        }
    }

    bool ClientSession::dispatch(const std::string &command, const std::vector<std::string> &args)
    {
        if (command == "LIST")
        {
            return handle_list(args);
        }
        if (command == "TOP10")
        {
            return handle_top10(args);
        }
        if (command == "BIGGEST")
        {
            return handle_biggest(args);
        }
        if (command == "MKDIR")
        {
            return handle_mkdir(args);
        }
        if (command == "DELETE")
        {
            return handle_delete(args);
        }
        if (command == "UPLOAD")
        {
            return handle_upload(args);
        }
        if (command == "IMPORT")
        {
            return handle_import(args);
        }
        if (command == "DOWNLOAD")
        {
            return handle_download(args);
        }
        if (command == "ZIP")
        {
            return handle_zip(args);
        }
        if (command == "RELOAD")
        {
            std::cout << "Reloading" << std::flush;
            reload();
            return true;
        }
        return false;
    }

    void ClientSession::print_help() const
    {
        std::cout << "Available commands:" << std::endl;
        std::cout << "  HELP                               Show this help" << std::endl;
        std::cout << "  EXIT                               Leave the shell" << std::endl;
        std::cout << "  LIST files|folders                 List every file or folder with its size" << std::endl;
        std::cout << "  TOP10 files|folders                Ten largest files or folders" << std::endl;
        std::cout << "  BIGGEST files|folders              Largest entry, also written as JSON" << std::endl;
        std::cout << "  MKDIR <name> [remote_path]         Create a folder" << std::endl;
        std::cout << "  DELETE <remote>... [--permanent]   Delete entries (to trash by default)" << std::endl;
        std::cout << "  UPLOAD <local_name_or_path>        Upload a file or the files of a folder" << std::endl;
        std::cout << "  IMPORT <album> <photos.json>       Import photos by URL into photos/<album>" << std::endl;
        std::cout << "  DOWNLOAD <remote>                  Download a file or folder" << std::endl;
        std::cout << "  ZIP <remote>                       Archive a downloaded entry" << std::endl;
        std::cout << "  RELOAD                             Walk the disk again" << std::endl;
        std::cout << "\nFlags:\n";
        std::cout << "  --token <t>                        OAuth token (or YADRIVE_TOKEN)\n";
        std::cout << "  --log <file>                       Append logs to file\n";
    }

    void ClientSession::print_error(const Error &error) const
    {
        std::cout << "ERROR: " << yadrive::to_string(error.kind) << std::endl;
        if (error.status != 0)
        {
            std::cout << "HTTP " << error.status << std::endl;
        }
        if (!error.message.empty())
        {
            std::cout << error.message << std::endl;
        }
    }

} // namespace yadrive::client
