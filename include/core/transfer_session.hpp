#pragma once

#include <atomic>
#include <mutex>
#include <string>
#include <thread>
#include "core/event_channel.hpp"
#include "core/transfer_executor.hpp"

/**
 * @brief Runs one TransferExecutor on a dedicated worker thread
 *
 * Only one session may be active per process. The caller drains events()
 * until the channel is closed, then calls wait() for the final report.
 */
class TransferSession
{
public:
    explicit TransferSession(TransferOptions options = TransferOptions{}, TransferHooks hooks = TransferHooks{});
    ~TransferSession();

    TransferSession(const TransferSession &) = delete;
    TransferSession &operator=(const TransferSession &) = delete;

    /**
     * @brief Claim the volume and start the worker
     * @throws std::logic_error if a session is already active, this session was
     *         already started, or the volume is claimed elsewhere
     */
    void start(const TransferPlan &plan, VolumeHandlePtr volume);

    EventChannel<TransferEvent> &events() { return events_; }

    void cancel();

    // Blocks until the worker has finished
    TransferReport wait();

    bool isRunning() const { return running_.load(); }
    bool isFinished() const { return finished_.load(); }

    // Message of the error the stream ended with, empty on normal completion
    std::string errorMessage() const;

    static bool isAnySessionActive() { return session_active_.load(); }

private:
    void worker(SimpleObservable<TransferEvent> stream);

    TransferExecutor executor_;
    EventChannel<TransferEvent> events_;
    VolumeHandlePtr volume_;
    std::thread worker_;
    std::mutex join_mutex_;

    std::atomic<bool> started_{false};
    std::atomic<bool> running_{false};
    std::atomic<bool> finished_{false};

    mutable std::mutex error_mutex_;
    std::string error_message_;

    static std::atomic<bool> session_active_;
};
