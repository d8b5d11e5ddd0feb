#include <exception>
#include <iostream>
#include <utility>

#include "yadrive/client/config.hpp"
#include "yadrive/client/logger.hpp"
#include "yadrive/client/session.hpp"
#include "yadrive/http.hpp"

int main(int argc, char *argv[])
{
    try
    {
        const auto config = yadrive::client::parse_arguments(argc, argv);
        yadrive::client::Logger logger(config.log_path);
        yadrive::http::CurlClient transport(config.timeout_seconds);
        yadrive::client::ClientSession session(config, std::move(logger), transport);
        return session.run();
    }
    catch (const std::exception &ex)
    {
        std::cerr << "ERROR: " << ex.what() << std::endl;
        return 1;
    }
}
