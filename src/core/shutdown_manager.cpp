#include "core/shutdown_manager.hpp"
#include "logging/logger.hpp"
#include <chrono>

volatile sig_atomic_t ShutdownManager::signal_flag_ = 0;
volatile sig_atomic_t ShutdownManager::signal_num_ = 0;

ShutdownManager &ShutdownManager::getInstance()
{
    static ShutdownManager instance;
    return instance;
}

ShutdownManager::~ShutdownManager()
{
    stopWatcher();
}

void ShutdownManager::installSignalHandlers()
{
    std::signal(SIGINT, &ShutdownManager::handleSignal);
    std::signal(SIGTERM, &ShutdownManager::handleSignal);
    std::signal(SIGQUIT, &ShutdownManager::handleSignal);

    startWatcher();
    Logger::debug("ShutdownManager: signal handlers installed");
}

void ShutdownManager::handleSignal(int sig) noexcept
{
    signal_num_ = sig;
    signal_flag_ = 1;
}

void ShutdownManager::startWatcher()
{
    if (watcher_running_.exchange(true))
        return;

    watcher_ = std::thread([this]()
                           {
        while (watcher_running_.load() && !shutdown_requested_.load())
        {
            if (signal_flag_)
            {
                int sig = signal_num_;
                signal_flag_ = 0;
                requestShutdown("signal " + std::to_string(sig), sig);
                break;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        } });
}

void ShutdownManager::stopWatcher()
{
    watcher_running_.store(false);
    if (watcher_.joinable() && watcher_.get_id() != std::this_thread::get_id())
        watcher_.join();
}

void ShutdownManager::requestShutdown(const std::string &reason, int signal_number) noexcept
{
    if (shutdown_in_progress_.exchange(true))
        return;

    last_signal_.store(signal_number);
    {
        std::lock_guard<std::mutex> lk(mutex_);
        reason_ = reason;
        shutdown_requested_.store(true);
    }
    cv_.notify_all();

    if (signal_number != 0)
        Logger::warn("ShutdownManager: received signal " + std::to_string(signal_number) + ", stopping");
    else
        Logger::info("ShutdownManager: shutdown requested - " + reason);

    runCallbacks(reason);
}

void ShutdownManager::runCallbacks(const std::string &reason) noexcept
{
    std::vector<ShutdownCallback> callbacks;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        callbacks = callbacks_;
    }
    for (const auto &callback : callbacks)
    {
        try
        {
            callback(reason);
        }
        catch (const std::exception &e)
        {
            Logger::error("ShutdownManager: shutdown callback failed: " + std::string(e.what()));
        }
    }
}

void ShutdownManager::onShutdown(ShutdownCallback callback)
{
    std::string reason;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        callbacks_.push_back(callback);
        if (!shutdown_requested_.load())
            return;
        reason = reason_;
    }
    callback(reason);
}

void ShutdownManager::clearCallbacks()
{
    std::lock_guard<std::mutex> lk(mutex_);
    callbacks_.clear();
}

void ShutdownManager::waitForShutdown()
{
    std::unique_lock<std::mutex> lk(mutex_);
    cv_.wait(lk, [this]
             { return shutdown_requested_.load(); });
}

bool ShutdownManager::waitForShutdownFor(std::chrono::milliseconds timeout)
{
    std::unique_lock<std::mutex> lk(mutex_);
    return cv_.wait_for(lk, timeout, [this]
                        { return shutdown_requested_.load(); });
}

std::string ShutdownManager::getReason() const
{
    std::lock_guard<std::mutex> lk(mutex_);
    return reason_;
}

void ShutdownManager::reset() noexcept
{
    stopWatcher();

    shutdown_requested_.store(false);
    shutdown_in_progress_.store(false);
    last_signal_.store(0);
    signal_flag_ = 0;
    signal_num_ = 0;

    std::lock_guard<std::mutex> lk(mutex_);
    reason_.clear();
    callbacks_.clear();
}
