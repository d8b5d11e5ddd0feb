#pragma once

#include <chrono>
#include <cstddef>
#include <functional>

namespace yadrive::client
{

    using Sleeper = std::function<void(std::chrono::milliseconds)>;

    // Sleeps on the calling thread.
    Sleeper thread_sleeper();

    // Exponential backoff: initial_delay * multiplier^attempt, capped at max_delay.
    struct BackoffPolicy
    {
        std::size_t max_attempts{20};
        std::chrono::milliseconds initial_delay{100};
        std::chrono::milliseconds max_delay{5000};
        double multiplier{2.0};

        std::chrono::milliseconds delay_for(std::size_t attempt) const;
        // Time slept across a full run; there is no wait after the last attempt.
        std::chrono::milliseconds total_budget() const;
    };

} // namespace yadrive::client
