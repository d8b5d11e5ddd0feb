/**
 * yadrive - Blocking HTTP transport used for every remote call.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <istream>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace yadrive::http
{

    enum class Method : std::uint8_t
    {
        Get,
        Put,
        Post,
        Delete
    };

    std::string_view to_string(Method method) noexcept;

    // Receives the response body chunk by chunk; returning false aborts the transfer.
    using DataSink = std::function<bool(const char *data, std::size_t size)>;
    // Called with the byte count of every request body chunk handed to the transport.
    using UploadProgress = std::function<void(std::size_t bytes)>;

    using QueryParams = std::vector<std::pair<std::string, std::string>>;

    struct Request
    {
        Method method{Method::Get};
        std::string url;
        QueryParams query{};
        std::vector<std::string> headers{};
        std::istream *body{};
        std::uint64_t body_size{};
        std::size_t chunk_size{64 * 1024};
        DataSink on_data{};
        UploadProgress on_upload{};
    };

    std::optional<std::string> query_value(const Request &request, std::string_view key);

    // Content transfers: a request body or a streamed response body.
    bool is_streaming(const Request &request) noexcept;

    struct Response
    {
        long status{};
        std::string body;
        std::string transport_error;

        bool transport_ok() const noexcept { return transport_error.empty(); }
        bool ok() const noexcept { return transport_ok() && status / 100 == 2; }
    };

    class Client
    {
    public:
        virtual ~Client() = default;

        virtual Response perform(const Request &request) = 0;
    };

    // timeout_seconds bounds a whole API call. Streaming requests are only bounded on
    // connect and on a stall of that many seconds, so a long transfer that keeps moving
    // is never cut off.
    class CurlClient : public Client
    {
    public:
        explicit CurlClient(long timeout_seconds = 300);

        Response perform(const Request &request) override;

    private:
        long timeout_seconds_;
    };

    void ensure_curl_global_init();

} // namespace yadrive::http
