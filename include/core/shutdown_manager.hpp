#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <csignal>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

/**
 * Process-wide shutdown coordination for the CLI.
 * - SIGINT/SIGTERM/SIGQUIT only raise sig_atomic_t flags
 * - A watcher thread turns the flags into a shutdown request
 * - Registered callbacks (e.g. cancelling the running transfer) run once, off the signal path
 */
class ShutdownManager
{
public:
    using ShutdownCallback = std::function<void(const std::string &reason)>;

    static ShutdownManager &getInstance();

    void installSignalHandlers();

    // Safe from any thread, not from a signal handler
    void requestShutdown(const std::string &reason, int signal_number = 0) noexcept;

    bool isShutdownRequested() const noexcept { return shutdown_requested_.load(); }

    // Runs immediately if shutdown was already requested
    void onShutdown(ShutdownCallback callback);
    void clearCallbacks();

    void waitForShutdown();
    // Returns true if shutdown was requested within the timeout
    bool waitForShutdownFor(std::chrono::milliseconds timeout);

    int getSignalNumber() const noexcept { return last_signal_.load(); }
    std::string getReason() const;

    // Test support
    void reset() noexcept;

private:
    ShutdownManager() = default;
    ~ShutdownManager();
    ShutdownManager(const ShutdownManager &) = delete;
    ShutdownManager &operator=(const ShutdownManager &) = delete;

    static void handleSignal(int sig) noexcept;

    void startWatcher();
    void stopWatcher();
    void runCallbacks(const std::string &reason) noexcept;

    std::atomic<bool> shutdown_requested_{false};
    std::atomic<bool> shutdown_in_progress_{false};
    std::atomic<int> last_signal_{0};
    std::string reason_;
    std::vector<ShutdownCallback> callbacks_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;

    std::thread watcher_;
    std::atomic<bool> watcher_running_{false};

    static volatile sig_atomic_t signal_flag_;
    static volatile sig_atomic_t signal_num_;
};
