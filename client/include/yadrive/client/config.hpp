#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>

namespace yadrive::client
{

    struct ClientConfig
    {
        std::string token;
        std::string endpoint{"https://cloud-api.yandex.net/v1/disk/resources"};
        std::string auth_scheme{"OAuth"};
        std::filesystem::path download_root{"downloads"};
        std::filesystem::path working_root{"."};
        std::filesystem::path reports_dir{"."};
        std::size_t page_size{100};
        std::size_t chunk_size{64 * 1024};
        std::size_t poll_attempts{20};
        std::chrono::milliseconds poll_initial_delay{100};
        std::chrono::milliseconds poll_max_delay{5000};
        std::size_t retry_attempts{3};
        long timeout_seconds{300};
        std::optional<std::filesystem::path> log_path;
    };

    ClientConfig parse_arguments(int argc, char *argv[]);

} // namespace yadrive::client
