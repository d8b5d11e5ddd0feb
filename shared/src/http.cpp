#include "yadrive/http.hpp"

#include <array>
#include <mutex>
#include <stdexcept>

#include <curl/curl.h>

namespace yadrive::http
{

    namespace
    {

        struct MethodMapping
        {
            Method method;
            std::string_view label;
        };

        constexpr std::array<MethodMapping, 4> kMethodMappings{{
            {Method::Get, "GET"},
            {Method::Put, "PUT"},
            {Method::Post, "POST"},
            {Method::Delete, "DELETE"},
        }};

        class CurlEasy
        {
        public:
            CurlEasy() : handle_(curl_easy_init())
            {
                if (!handle_)
                {
                    throw std::runtime_error("curl_easy_init failed");
                }
                curl_easy_setopt(handle_, CURLOPT_NOPROGRESS, 1L);
                curl_easy_setopt(handle_, CURLOPT_FOLLOWLOCATION, 1L);
                curl_easy_setopt(handle_, CURLOPT_NOSIGNAL, 1L);
            }
            ~CurlEasy() { curl_easy_cleanup(handle_); }

            CurlEasy(const CurlEasy &) = delete;
            CurlEasy &operator=(const CurlEasy &) = delete;

            operator CURL *() { return handle_; }

        private:
            CURL *handle_;
        };

        class SList
        {
        public:
            SList() = default;
            ~SList() { curl_slist_free_all(head_); }

            SList(const SList &) = delete;
            SList &operator=(const SList &) = delete;

            void add(const std::string &line)
            {
                head_ = curl_slist_append(head_, line.c_str());
                if (!head_)
                {
                    throw std::runtime_error("curl_slist_append failed");
                }
            }

            curl_slist *get() const { return head_; }

        private:
            curl_slist *head_ = nullptr;
        };

        struct TransferContext
        {
            const Request *request{};
            std::string *body{};
        };

        std::size_t write_callback(char *ptr, std::size_t size, std::size_t nmemb, void *userdata)
        {
            auto *context = static_cast<TransferContext *>(userdata);
            const auto total = size * nmemb;
            if (context->request->on_data)
            {
                // a short count makes libcurl fail the transfer with CURLE_WRITE_ERROR
                return context->request->on_data(ptr, total) ? total : 0;
            }
            context->body->append(ptr, total);
            return total;
        }

        std::size_t read_callback(char *buffer, std::size_t size, std::size_t nitems, void *userdata)
        {
            auto *context = static_cast<TransferContext *>(userdata);
            auto *input = context->request->body;
            if (!input || !*input)
            {
                return 0;
            }
            input->read(buffer, static_cast<std::streamsize>(size * nitems));
            const auto read_count = static_cast<std::size_t>(input->gcount());
            if (input->bad())
            {
                return CURL_READFUNC_ABORT;
            }
            if (read_count > 0 && context->request->on_upload)
            {
                context->request->on_upload(read_count);
            }
            return read_count;
        }

        std::string build_url(CURL *curl, const Request &request)
        {
            std::string url = request.url;
            char separator = url.find('?') == std::string::npos ? '?' : '&';
            for (const auto &[key, value] : request.query)
            {
                char *escaped = curl_easy_escape(curl, value.c_str(), static_cast<int>(value.size()));
                if (!escaped)
                {
                    throw std::runtime_error("curl_easy_escape failed for query parameter " + key);
                }
                url += separator;
                url += key;
                url += '=';
                url += escaped;
                curl_free(escaped);
                separator = '&';
            }
            return url;
        }

    } // namespace

    std::string_view to_string(Method method) noexcept
    {
        for (const auto &mapping : kMethodMappings)
        {
            if (mapping.method == method)
            {
                return mapping.label;
            }
        }
        return "UNKNOWN";
    }

    std::optional<std::string> query_value(const Request &request, std::string_view key)
    {
        for (const auto &[name, value] : request.query)
        {
            if (name == key)
            {
                return value;
            }
        }
        return std::nullopt;
    }

    bool is_streaming(const Request &request) noexcept
    {
        return request.body != nullptr || static_cast<bool>(request.on_data);
    }

    void ensure_curl_global_init()
    {
        static std::once_flag flag;
        std::call_once(flag, []()
                       {
                           if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK)
                           {
                               throw std::runtime_error("curl_global_init failed");
                           } });
    }

    CurlClient::CurlClient(long timeout_seconds) : timeout_seconds_(timeout_seconds)
    {
        ensure_curl_global_init();
    }

    Response CurlClient::perform(const Request &request)
    {
        CurlEasy curl;
        std::string body;
        TransferContext context{.request = &request, .body = &body};

        const auto url = build_url(curl, request);
        SList headers;
        for (const auto &header : request.headers)
        {
            headers.add(header);
        }

        curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers.get());
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, &context);
        curl_easy_setopt(curl, CURLOPT_BUFFERSIZE, static_cast<long>(request.chunk_size));
        if (timeout_seconds_ > 0)
        {
            if (is_streaming(request))
            {
                curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, timeout_seconds_);
                curl_easy_setopt(curl, CURLOPT_LOW_SPEED_LIMIT, 1L);
                curl_easy_setopt(curl, CURLOPT_LOW_SPEED_TIME, timeout_seconds_);
            }
            else
            {
                curl_easy_setopt(curl, CURLOPT_TIMEOUT, timeout_seconds_);
            }
        }

        switch (request.method)
        {
        case Method::Get:
            curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
            break;
        case Method::Put:
            curl_easy_setopt(curl, CURLOPT_UPLOAD, 1L);
            curl_easy_setopt(curl, CURLOPT_READFUNCTION, read_callback);
            curl_easy_setopt(curl, CURLOPT_READDATA, &context);
            curl_easy_setopt(curl, CURLOPT_INFILESIZE_LARGE,
                             static_cast<curl_off_t>(request.body ? request.body_size : 0));
            curl_easy_setopt(curl, CURLOPT_UPLOAD_BUFFERSIZE, static_cast<long>(request.chunk_size));
            break;
        case Method::Post:
            curl_easy_setopt(curl, CURLOPT_POST, 1L);
            curl_easy_setopt(curl, CURLOPT_POSTFIELDS, "");
            curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, 0L);
            break;
        case Method::Delete:
            curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, "DELETE");
            break;
        }

        Response response;
        const CURLcode code = curl_easy_perform(curl);
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status);
        if (code != CURLE_OK)
        {
            response.transport_error = curl_easy_strerror(code);
        }
        response.body.swap(body);
        return response;
    }

} // namespace yadrive::http
