#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>

#include "yadrive/http.hpp"

namespace yadrive::client
{

    struct ProgressUpdate
    {
        std::string label;
        std::uint64_t transferred{};
        std::uint64_t total{};
        double bytes_per_second{};
        bool finished{};
    };

    using ProgressCallback = std::function<void(const ProgressUpdate &)>;

    // Counts bytes moved by one streaming transfer and reports throughput to a callback.
    class ProgressTracker
    {
    public:
        ProgressTracker(std::string label, std::uint64_t total, ProgressCallback callback);

        ProgressTracker(const ProgressTracker &) = delete;
        ProgressTracker &operator=(const ProgressTracker &) = delete;

        void advance(std::uint64_t bytes);
        void finish();

        std::uint64_t transferred() const noexcept { return transferred_; }
        std::uint64_t total() const noexcept { return total_; }
        double throughput() const;

        // Forwards every chunk to sink and counts the bytes it accepted.
        http::DataSink wrap(http::DataSink sink);
        http::UploadProgress upload_callback();

    private:
        void notify(bool finished) const;

        std::string label_;
        std::uint64_t total_;
        std::uint64_t transferred_{};
        ProgressCallback callback_;
        std::chrono::steady_clock::time_point started_;
    };

} // namespace yadrive::client
