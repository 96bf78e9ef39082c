#pragma once
#include <algorithm>
#include <atomic>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <functional>
#include <string>
#include <system_error>
#include <thread>
#include "logging/logger.hpp"

class ErrorRecovery
{
public:
    // Exponential backoff: base, 2*base, 4*base... capped at max_ms
    static int backoffDelayMs(int attempt, int base_ms, int max_ms)
    {
        if (base_ms <= 0)
            return 0;
        int shift = std::min(std::max(attempt, 0), 20);
        long long delay = static_cast<long long>(base_ms) << shift;
        if (max_ms > 0 && delay > max_ms)
            delay = max_ms;
        return static_cast<int>(delay);
    }

    // I/O errors worth retrying; ENOSPC, EACCES, EROFS and ENOENT are permanent
    static bool isTransientErrno(int err)
    {
        return err == EIO || err == EAGAIN || err == EINTR || err == ETIMEDOUT || err == EBUSY;
    }

    static std::string describeErrno(int err)
    {
        return std::string(std::strerror(err)) + " (errno " + std::to_string(err) + ")";
    }

    /**
     * @brief Sleep for delay_ms, waking early when cancelled
     * @return false if the wait was cut short by cancellation
     */
    static bool sleepUnlessCancelled(int delay_ms, const std::atomic<bool> &cancelled)
    {
        auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(delay_ms);
        while (std::chrono::steady_clock::now() < deadline)
        {
            if (cancelled.load())
                return false;
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now());
            std::this_thread::sleep_for(std::min(remaining, std::chrono::milliseconds(10)));
        }
        return !cancelled.load();
    }

    // Retry mechanism with exponential backoff for calls that throw std::system_error
    template <typename Func>
    static auto retryWithBackoff(Func func, int max_retries, const std::string &operation_name,
                                 int base_ms = 100, int max_ms = 2000) -> decltype(func())
    {
        for (int attempt = 0;; ++attempt)
        {
            try
            {
                return func();
            }
            catch (const std::system_error &e)
            {
                if (attempt >= max_retries || !isTransientErrno(e.code().value()))
                {
                    Logger::error("Operation '" + operation_name + "' failed after " +
                                  std::to_string(attempt + 1) + " attempt(s): " + e.what());
                    throw;
                }

                int delay_ms = backoffDelayMs(attempt, base_ms, max_ms);
                Logger::warn("Operation '" + operation_name + "' failed, retrying in " +
                             std::to_string(delay_ms) + "ms (attempt " + std::to_string(attempt + 1) +
                             "/" + std::to_string(max_retries + 1) + "): " + e.what());
                std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms));
            }
        }
    }
};
