#include "yadrive/client/progress.hpp"

#include <utility>

namespace yadrive::client
{

    ProgressTracker::ProgressTracker(std::string label, std::uint64_t total, ProgressCallback callback)
        : label_(std::move(label)),
          total_(total),
          callback_(std::move(callback)),
          started_(std::chrono::steady_clock::now()) {}

    void ProgressTracker::advance(std::uint64_t bytes)
    {
        transferred_ += bytes;
        notify(false);
    }

    void ProgressTracker::finish()
    {
        notify(true);
    }

    double ProgressTracker::throughput() const
    {
        const auto elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - started_).count();
        if (elapsed <= 0.0)
        {
            return 0.0;
        }
        return static_cast<double>(transferred_) / elapsed;
    }

    http::DataSink ProgressTracker::wrap(http::DataSink sink)
    {
        return [this, sink = std::move(sink)](const char *data, std::size_t size)
        {
            if (!sink(data, size))
            {
                return false;
            }
            advance(size);
            return true;
        };
    }

    http::UploadProgress ProgressTracker::upload_callback()
    {
        return [this](std::size_t bytes)
        {
            advance(bytes);
        };
    }

    void ProgressTracker::notify(bool finished) const
    {
        if (!callback_)
        {
            return;
        }
        callback_(ProgressUpdate{
            .label = label_,
            .transferred = transferred_,
            .total = total_,
            .bytes_per_second = throughput(),
            .finished = finished,
        });
    }

} // namespace yadrive::client
