#include "yadrive/client/backoff.hpp"

#include <algorithm>
#include <cmath>
#include <thread>

namespace yadrive::client
{

    Sleeper thread_sleeper()
    {
        return [](std::chrono::milliseconds delay)
        {
            std::this_thread::sleep_for(delay);
        };
    }

    std::chrono::milliseconds BackoffPolicy::delay_for(std::size_t attempt) const
    {
        const auto scaled = static_cast<double>(initial_delay.count()) * std::pow(multiplier, static_cast<double>(attempt));
        const auto capped = std::min(scaled, static_cast<double>(max_delay.count()));
        return std::chrono::milliseconds(static_cast<std::chrono::milliseconds::rep>(capped));
    }

    std::chrono::milliseconds BackoffPolicy::total_budget() const
    {
        std::chrono::milliseconds total{0};
        for (std::size_t attempt = 0; attempt + 1 < max_attempts; ++attempt)
        {
            total += delay_for(attempt);
        }
        return total;
    }

} // namespace yadrive::client
