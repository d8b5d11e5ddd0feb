#include "yadrive/client/config.hpp"

#include <cstdlib>
#include <stdexcept>
#include <string>

namespace yadrive::client
{

    namespace
    {

        constexpr auto kTokenVariable = "YADRIVE_TOKEN";

        std::string require_value(int argc, char *argv[], int &index, const std::string &flag)
        {
            if (index >= argc)
            {
                throw std::runtime_error(flag + " requires a value");
            }
            return argv[index++];
        }

        std::size_t require_count(int argc, char *argv[], int &index, const std::string &flag)
        {
            const auto text = require_value(argc, argv, index, flag);
            std::size_t consumed = 0;
            const auto value = std::stoull(text, &consumed);
            if (consumed != text.size() || value == 0)
            {
                throw std::runtime_error(flag + " expects a positive integer, got " + text);
            }
            return static_cast<std::size_t>(value);
        }

    } // namespace

    ClientConfig parse_arguments(int argc, char *argv[])
    {
        ClientConfig config;
        if (const char *token = std::getenv(kTokenVariable))
        {
            config.token = token;
        }

        int index = 1;
        while (index < argc)
        {
            const std::string arg = argv[index++];
            if (arg == "--token")
            {
                config.token = require_value(argc, argv, index, arg);
            }
            else if (arg == "--endpoint")
            {
                config.endpoint = require_value(argc, argv, index, arg);
            }
            else if (arg == "--auth-scheme")
            {
                config.auth_scheme = require_value(argc, argv, index, arg);
            }
            else if (arg == "--download-root")
            {
                config.download_root = std::filesystem::path(require_value(argc, argv, index, arg));
            }
            else if (arg == "--working-root")
            {
                config.working_root = std::filesystem::path(require_value(argc, argv, index, arg));
            }
            else if (arg == "--reports-dir")
            {
                config.reports_dir = std::filesystem::path(require_value(argc, argv, index, arg));
            }
            else if (arg == "--page-size")
            {
                config.page_size = require_count(argc, argv, index, arg);
            }
            else if (arg == "--chunk-size")
            {
                config.chunk_size = require_count(argc, argv, index, arg);
            }
            else if (arg == "--poll-attempts")
            {
                config.poll_attempts = require_count(argc, argv, index, arg);
            }
            else if (arg == "--poll-initial-ms")
            {
                config.poll_initial_delay = std::chrono::milliseconds(require_count(argc, argv, index, arg));
            }
            else if (arg == "--poll-max-ms")
            {
                config.poll_max_delay = std::chrono::milliseconds(require_count(argc, argv, index, arg));
            }
            else if (arg == "--retry-attempts")
            {
                config.retry_attempts = require_count(argc, argv, index, arg);
            }
            else if (arg == "--timeout")
            {
                config.timeout_seconds = static_cast<long>(require_count(argc, argv, index, arg));
            }
            else if (arg == "--log")
            {
                config.log_path = std::filesystem::path(require_value(argc, argv, index, arg));
            }
            else
            {
                throw std::runtime_error("Unknown argument: " + arg);
            }
        }

        if (config.token.empty())
        {
            throw std::runtime_error(std::string("Usage: yadrive_client --token <token> [options] (or set ") +
                                     kTokenVariable + ")");
        }
        if (config.poll_max_delay < config.poll_initial_delay)
        {
            throw std::runtime_error("--poll-max-ms must not be smaller than --poll-initial-ms");
        }
        return config;
    }

} // namespace yadrive::client
