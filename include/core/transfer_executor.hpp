#pragma once

#include <atomic>
#include <cstddef>
#include <functional>
#include <mutex>
#include <string>
#include "core/file_utils.hpp"
#include "core/transfer_plan.hpp"
#include "core/transfer_record.hpp"
#include "core/volume.hpp"

class PocoConfigManager;

struct TransferOptions
{
    size_t chunk_size_bytes = 1048576;
    int max_retries = 3;
    int backoff_base_ms = 100;
    int max_backoff_ms = 2000;
    int stall_timeout_ms = 30000;
    bool fsync_files = true;

    static TransferOptions fromConfig(const PocoConfigManager &config);
};

/**
 * @brief Test seams around the copy pipeline
 */
struct TransferHooks
{
    // After the temporary file is written and synced, before it is re-read
    std::function<void(const PlanEntry &entry, const std::string &temp_path, int attempt)> after_copy;
    // Before each source chunk is read
    std::function<void(const PlanEntry &entry, size_t chunk_index)> before_chunk;
    // After a chunk is read, inside the stall-timed window
    std::function<void(const PlanEntry &entry, size_t chunk_index)> during_chunk;
};

/**
 * @brief Copy -> verify -> publish pipeline for a TransferPlan
 *
 * Error Handling Policy:
 * - Per-item failures are recorded on the item's TransferRecord and streamed via onNext.
 * - Volume loss is session level: remaining items fail, SESSION_FINISHED is emitted,
 *   then onError receives a VolumeUnavailableError.
 * - Cancellation is not an error: remaining items become skipped and onComplete is called.
 */
class TransferExecutor
{
public:
    explicit TransferExecutor(TransferOptions options = TransferOptions{}, TransferHooks hooks = TransferHooks{});

    /**
     * @brief Prepare a session; subscribing to the result runs it on the calling thread
     * @param plan Plan to execute in entry order
     * @param volume Handle of the source volume, checked at every chunk boundary
     * @return Observable emitting a TransferEvent per chunk and per status change
     */
    SimpleObservable<TransferEvent> execute(const TransferPlan &plan, VolumeHandlePtr volume);

    // Observed at the next chunk boundary or backoff wait
    void cancel();
    bool isCancelled() const { return cancelled_.load(); }
    bool isRunning() const { return running_.load(); }

    // Snapshot of the current or last session's records
    TransferReport report() const;

    const TransferOptions &options() const { return options_; }

private:
    enum class Outcome
    {
        SUCCEEDED,
        RETRY,
        FAILED,
        CANCELLED,
        VOLUME_LOST
    };

    struct AttemptResult
    {
        Outcome outcome;
        TransferErrorKind kind;
        std::string detail;
    };

    using EventSink = std::function<void(const TransferEvent &)>;

    void run(const TransferPlan &plan, const VolumeHandlePtr &volume, const EventSink &emit);
    Outcome transferEntry(const PlanEntry &entry, size_t index, const VolumeHandlePtr &volume, const EventSink &emit);
    AttemptResult copyAttempt(const PlanEntry &entry, size_t index, int attempt,
                              const VolumeHandlePtr &volume, const EventSink &emit);
    AttemptResult publish(const std::string &temp_path, const std::string &destination_path);

    void skipRemaining(size_t from, const std::string &reason, const EventSink &emit);
    void failRemaining(size_t from, const std::string &detail, const EventSink &emit);

    // Mutates one record under the lock and emits the resulting event
    void updateRecord(size_t index, TransferEventType type, const std::function<void(TransferRecord &)> &mutate,
                      const EventSink &emit, uint64_t bytes_delta = 0, const std::string &message = "");
    TransferEvent makeEvent(TransferEventType type, size_t index, uint64_t bytes_delta,
                            const std::string &message) const;

    TransferOptions options_;
    TransferHooks hooks_;
    std::atomic<bool> cancelled_{false};
    std::atomic<bool> running_{false};

    mutable std::mutex report_mutex_;
    TransferReport report_;
    uint64_t total_bytes_planned_ = 0;
};
