#include "core/transfer_executor.hpp"
#include "core/error_recovery.hpp"
#include "core/poco_config_manager.hpp"
#include "core/transfer_errors.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <filesystem>
#include <vector>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace
{
    constexpr size_t kNoRecord = static_cast<size_t>(-1);

    // Removes the temporary file on scope exit unless it was published
    class TempFileGuard
    {
    public:
        explicit TempFileGuard(std::string path) : path_(std::move(path)), committed_(false) {}
        ~TempFileGuard()
        {
            if (!committed_ && ::unlink(path_.c_str()) != 0 && errno != ENOENT)
            {
                Logger::warn("Could not remove temporary file " + path_ + ": " + std::strerror(errno));
            }
        }
        TempFileGuard(const TempFileGuard &) = delete;
        TempFileGuard &operator=(const TempFileGuard &) = delete;

        void commit() { committed_ = true; }

    private:
        std::string path_;
        bool committed_;
    };

    bool writeAll(int fd, const char *data, size_t length, int &error)
    {
        while (length > 0)
        {
            ssize_t written = ::write(fd, data, length);
            if (written < 0)
            {
                if (errno == EINTR)
                    continue;
                error = errno;
                return false;
            }
            data += written;
            length -= static_cast<size_t>(written);
        }
        return true;
    }

    ssize_t readSome(int fd, char *buffer, size_t length)
    {
        ssize_t n;
        do
        {
            n = ::read(fd, buffer, length);
        } while (n < 0 && errno == EINTR);
        return n;
    }

    void syncDirectory(const std::string &directory)
    {
        ScopedFd dir(::open(directory.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC));
        if (dir.valid() && ::fsync(dir.get()) != 0)
        {
            Logger::debug("fsync of directory " + directory + " failed: " + std::strerror(errno));
        }
    }
}

TransferOptions TransferOptions::fromConfig(const PocoConfigManager &config)
{
    TransferOptions options;
    options.chunk_size_bytes = static_cast<size_t>(config.getUInt64("transfer.chunk_size_bytes", options.chunk_size_bytes));
    options.max_retries = config.getInt("transfer.max_retries", options.max_retries);
    options.backoff_base_ms = config.getInt("transfer.backoff_base_ms", options.backoff_base_ms);
    options.max_backoff_ms = config.getInt("transfer.max_backoff_ms", options.max_backoff_ms);
    options.stall_timeout_ms = config.getInt("transfer.stall_timeout_ms", options.stall_timeout_ms);
    options.fsync_files = config.getBool("transfer.fsync", options.fsync_files);
    if (options.chunk_size_bytes == 0)
        options.chunk_size_bytes = 1048576;
    return options;
}

TransferExecutor::TransferExecutor(TransferOptions options, TransferHooks hooks)
    : options_(std::move(options)), hooks_(std::move(hooks))
{
}

void TransferExecutor::cancel()
{
    if (!cancelled_.exchange(true))
        Logger::info("Transfer cancellation requested");
}

TransferReport TransferExecutor::report() const
{
    std::lock_guard<std::mutex> lock(report_mutex_);
    return report_;
}

SimpleObservable<TransferEvent> TransferExecutor::execute(const TransferPlan &plan, VolumeHandlePtr volume)
{
    cancelled_.store(false);
    using Observer = SimpleObservable<TransferEvent>::Observer;
    using ErrorHandler = SimpleObservable<TransferEvent>::ErrorHandler;
    using CompleteHandler = SimpleObservable<TransferEvent>::CompleteHandler;

    return SimpleObservable<TransferEvent>(
        [this, plan, volume](Observer onNext, ErrorHandler onError, CompleteHandler onComplete)
        {
            if (running_.exchange(true))
            {
                Logger::error("Transfer executor is already running a session");
                if (onError)
                    onError(std::logic_error("Transfer executor is already running a session"));
                return;
            }

            EventSink emit = [&onNext](const TransferEvent &event)
            {
                if (onNext)
                    onNext(event);
            };

            run(plan, volume, emit);
            running_.store(false);

            TransferReport final_report = report();
            if (final_report.session_error == TransferErrorKind::VOLUME_UNAVAILABLE)
            {
                if (onError)
                    onError(VolumeUnavailableError(final_report.session_error_detail));
                return;
            }
            if (onComplete)
                onComplete();
        });
}

void TransferExecutor::run(const TransferPlan &plan, const VolumeHandlePtr &volume, const EventSink &emit)
{
    {
        std::lock_guard<std::mutex> lock(report_mutex_);
        report_ = TransferReport{};
        for (const auto &entry : plan.entries)
        {
            TransferRecord record;
            record.item_id = entry.item_id;
            record.source_path = entry.source_path;
            record.destination_path = entry.destination_path;
            record.bytes_total = entry.size;
            report_.records.push_back(record);
        }
        total_bytes_planned_ = plan.totalBytes();
    }

    Logger::info("Starting transfer of " + std::to_string(plan.entries.size()) + " items (" +
                 FileUtils::formatBytes(total_bytes_planned_) + ") to " + plan.destination_root);

    for (size_t i = 0; i < plan.entries.size(); ++i)
    {
        const PlanEntry &entry = plan.entries[i];

        if (cancelled_.load())
        {
            skipRemaining(i, "cancelled", emit);
            break;
        }
        if (!volume || !volume->isAccessible())
        {
            failRemaining(i, "Source volume is no longer available", emit);
            break;
        }

        if (entry.action == PlanAction::SKIP_IDENTICAL)
        {
            updateRecord(i, TransferEventType::STATUS_CHANGED, [&entry](TransferRecord &r)
                         {
                r.status = TransferStatus::SKIPPED;
                r.skip_reason = "identical";
                r.verification = VerificationResult::MATCH;
                r.source_checksum = entry.existing_checksum;
                r.destination_checksum = entry.existing_checksum; }, emit);
            Logger::info("Skipping identical file: " + entry.destination_path);
            continue;
        }

        Outcome outcome = transferEntry(entry, i, volume, emit);
        if (outcome == Outcome::CANCELLED)
        {
            skipRemaining(i, "cancelled", emit);
            break;
        }
        if (outcome == Outcome::VOLUME_LOST)
        {
            failRemaining(i, "Source volume is no longer available", emit);
            break;
        }
    }

    {
        std::lock_guard<std::mutex> lock(report_mutex_);
        report_.completed = true;
        report_.cancelled = cancelled_.load() && report_.session_error == TransferErrorKind::NONE;
    }

    TransferEvent finished;
    {
        std::lock_guard<std::mutex> lock(report_mutex_);
        finished = makeEvent(TransferEventType::SESSION_FINISHED, kNoRecord, 0, "");
        finished.message = std::to_string(report_.count(TransferStatus::SUCCEEDED)) + " succeeded, " +
                           std::to_string(report_.count(TransferStatus::FAILED)) + " failed, " +
                           std::to_string(report_.count(TransferStatus::SKIPPED)) + " skipped";
    }
    Logger::info("Transfer session finished: " + finished.message);
    emit(finished);
}

TransferExecutor::Outcome TransferExecutor::transferEntry(const PlanEntry &entry, size_t index,
                                                          const VolumeHandlePtr &volume, const EventSink &emit)
{
    const int max_attempts = std::max(0, options_.max_retries) + 1;
    for (int attempt = 1; attempt <= max_attempts; ++attempt)
    {
        updateRecord(index, TransferEventType::STATUS_CHANGED, [attempt](TransferRecord &r)
                     {
            r.status = TransferStatus::COPYING;
            r.attempts = attempt;
            r.bytes_copied = 0;
            r.verification = VerificationResult::NOT_VERIFIED; }, emit);
        Logger::debug("Copying " + entry.source_path + " -> " + entry.destination_path +
                      " (attempt " + std::to_string(attempt) + ")");

        AttemptResult result = copyAttempt(entry, index, attempt, volume, emit);

        switch (result.outcome)
        {
        case Outcome::SUCCEEDED:
            updateRecord(index, TransferEventType::STATUS_CHANGED, [](TransferRecord &r)
                         {
                r.status = TransferStatus::SUCCEEDED;
                r.error_kind = TransferErrorKind::NONE;
                r.error_detail.clear(); }, emit);
            Logger::info("Transferred " + entry.relative_source + " -> " + entry.destination_path);
            return Outcome::SUCCEEDED;

        case Outcome::CANCELLED:
        case Outcome::VOLUME_LOST:
            return result.outcome;

        case Outcome::RETRY:
            if (attempt < max_attempts)
            {
                int delay_ms = ErrorRecovery::backoffDelayMs(attempt - 1, options_.backoff_base_ms, options_.max_backoff_ms);
                std::string message = result.detail + ", retrying in " + std::to_string(delay_ms) + "ms";
                updateRecord(index, TransferEventType::RETRY_SCHEDULED, [&result](TransferRecord &r)
                             {
                    r.retries += 1;
                    r.error_kind = result.kind;
                    r.error_detail = result.detail; }, emit, 0, message);
                Logger::warn("Transient failure on " + entry.relative_source + ": " + message +
                             " (attempt " + std::to_string(attempt) + "/" + std::to_string(max_attempts) + ")");
                if (!ErrorRecovery::sleepUnlessCancelled(delay_ms, cancelled_))
                    return Outcome::CANCELLED;
                continue;
            }
            // Retries exhausted
            // fall through
        case Outcome::FAILED:
            updateRecord(index, TransferEventType::STATUS_CHANGED, [&result](TransferRecord &r)
                         {
                r.status = TransferStatus::FAILED;
                r.error_kind = result.kind;
                r.error_detail = result.detail; }, emit);
            Logger::error("Failed to transfer " + entry.relative_source + ": " +
                          MediaTypes::getErrorKindName(result.kind) + " - " + result.detail);
            return Outcome::FAILED;
        }
    }
    return Outcome::FAILED;
}

TransferExecutor::AttemptResult TransferExecutor::copyAttempt(const PlanEntry &entry, size_t index, int attempt,
                                                              const VolumeHandlePtr &volume, const EventSink &emit)
{
    auto classify = [](int err, TransferErrorKind kind, const std::string &what) -> AttemptResult
    {
        Outcome outcome = ErrorRecovery::isTransientErrno(err) ? Outcome::RETRY : Outcome::FAILED;
        return AttemptResult{outcome, kind, what + ": " + ErrorRecovery::describeErrno(err)};
    };
    auto volumeLost = []()
    {
        return AttemptResult{Outcome::VOLUME_LOST, TransferErrorKind::VOLUME_UNAVAILABLE, "Source volume is no longer available"};
    };

    const fs::path destination(entry.destination_path);
    const std::string directory = destination.parent_path().string();
    std::string mkdir_error;
    if (!FileUtils::ensureDirectory(directory, mkdir_error))
    {
        return AttemptResult{Outcome::FAILED, TransferErrorKind::WRITE_FAILURE,
                             "Cannot create directory " + directory + ": " + mkdir_error};
    }

    ScopedFd source(::open(entry.source_path.c_str(), O_RDONLY | O_CLOEXEC));
    if (!source.valid())
    {
        int err = errno;
        if (!volume->isAccessible())
            return volumeLost();
        return classify(err, TransferErrorKind::UNREADABLE_SOURCE, "Cannot open source");
    }

    const std::string temp_path = FileUtils::makeTempPath(entry.destination_path);
    // A stale temp of the same name can only be ours from an interrupted run
    if (::unlink(temp_path.c_str()) == 0)
        Logger::debug("Removed stale temporary file " + temp_path);

    ScopedFd temp(::open(temp_path.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0644));
    if (!temp.valid())
        return classify(errno, TransferErrorKind::WRITE_FAILURE, "Cannot create temporary file");
    TempFileGuard guard(temp_path);

    Sha256Hasher source_hasher;
    std::vector<char> buffer(options_.chunk_size_bytes);
    size_t chunk_index = 0;

    while (true)
    {
        if (hooks_.before_chunk)
            hooks_.before_chunk(entry, chunk_index);
        if (cancelled_.load())
            return AttemptResult{Outcome::CANCELLED, TransferErrorKind::NONE, "cancelled"};
        if (!volume->isAccessible())
            return volumeLost();

        auto chunk_start = std::chrono::steady_clock::now();
        ssize_t n = readSome(source.get(), buffer.data(), buffer.size());
        if (n < 0)
        {
            int err = errno;
            if (!volume->isAccessible())
                return volumeLost();
            return classify(err, TransferErrorKind::UNREADABLE_SOURCE, "Read failed");
        }
        if (n == 0)
            break;
        if (hooks_.during_chunk)
            hooks_.during_chunk(entry, chunk_index);

        source_hasher.update(buffer.data(), static_cast<size_t>(n));
        int write_error = 0;
        if (!writeAll(temp.get(), buffer.data(), static_cast<size_t>(n), write_error))
            return classify(write_error, TransferErrorKind::WRITE_FAILURE, "Write failed");

        // Only the read and write count towards the stall window, not the subscriber
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - chunk_start);
        ++chunk_index;
        updateRecord(index, TransferEventType::CHUNK_COPIED, [n](TransferRecord &r)
                     { r.bytes_copied += static_cast<uint64_t>(n); }, emit, static_cast<uint64_t>(n));

        if (options_.stall_timeout_ms > 0 && elapsed.count() > options_.stall_timeout_ms)
        {
            return AttemptResult{Outcome::RETRY, TransferErrorKind::UNREADABLE_SOURCE,
                                 "Chunk stalled for " + std::to_string(elapsed.count()) + "ms"};
        }
    }

    if (options_.fsync_files && ::fsync(temp.get()) != 0)
        return classify(errno, TransferErrorKind::WRITE_FAILURE, "fsync failed");
    int close_error = temp.close();
    if (close_error != 0)
        return classify(close_error, TransferErrorKind::WRITE_FAILURE, "close failed");

    const std::string source_checksum = source_hasher.finalHex();
    if (source_checksum.empty())
        return AttemptResult{Outcome::FAILED, TransferErrorKind::UNREADABLE_SOURCE, "SHA-256 context failure"};

    if (hooks_.after_copy)
        hooks_.after_copy(entry, temp_path, attempt);

    updateRecord(index, TransferEventType::STATUS_CHANGED, [&source_checksum](TransferRecord &r)
                 {
        r.status = TransferStatus::VERIFYING;
        r.source_checksum = source_checksum; }, emit);

    auto destination_checksum = FileUtils::computeFileHash(temp_path, options_.chunk_size_bytes,
                                                           [this](size_t)
                                                           { return !cancelled_.load(); });
    if (!destination_checksum)
    {
        if (cancelled_.load())
            return AttemptResult{Outcome::CANCELLED, TransferErrorKind::NONE, "cancelled"};
        return AttemptResult{Outcome::RETRY, TransferErrorKind::WRITE_FAILURE, "Cannot re-read temporary file"};
    }

    bool match = (*destination_checksum == source_checksum);
    updateRecord(index, TransferEventType::STATUS_CHANGED, [&destination_checksum, match](TransferRecord &r)
                 {
        r.destination_checksum = *destination_checksum;
        r.verification = match ? VerificationResult::MATCH : VerificationResult::MISMATCH; }, emit);

    if (!match)
    {
        return AttemptResult{Outcome::RETRY, TransferErrorKind::VERIFICATION_MISMATCH,
                             "Checksum mismatch after copy"};
    }

    AttemptResult published = publish(temp_path, entry.destination_path);
    if (published.outcome == Outcome::SUCCEEDED)
    {
        guard.commit();
        syncDirectory(directory);
    }
    return published;
}

TransferExecutor::AttemptResult TransferExecutor::publish(const std::string &temp_path,
                                                          const std::string &destination_path)
{
    // link() fails with EEXIST instead of replacing, so an existing file is never clobbered
    if (::link(temp_path.c_str(), destination_path.c_str()) == 0)
    {
        if (::unlink(temp_path.c_str()) != 0)
            Logger::warn("Published " + destination_path + " but could not remove " + temp_path);
        return AttemptResult{Outcome::SUCCEEDED, TransferErrorKind::NONE, ""};
    }

    int err = errno;
    if (err == EEXIST)
    {
        return AttemptResult{Outcome::FAILED, TransferErrorKind::WRITE_FAILURE,
                             "Destination appeared during transfer: " + destination_path};
    }
    if (err != EPERM && err != ENOTSUP && err != EOPNOTSUPP && err != EXDEV && err != EMLINK && err != ENOSYS)
    {
        return AttemptResult{ErrorRecovery::isTransientErrno(err) ? Outcome::RETRY : Outcome::FAILED,
                             TransferErrorKind::WRITE_FAILURE,
                             "Cannot publish " + destination_path + ": " + ErrorRecovery::describeErrno(err)};
    }

    // Filesystems without hard links (FAT, exFAT): check then rename
    struct stat st;
    if (::lstat(destination_path.c_str(), &st) == 0)
    {
        return AttemptResult{Outcome::FAILED, TransferErrorKind::WRITE_FAILURE,
                             "Destination appeared during transfer: " + destination_path};
    }
    if (::rename(temp_path.c_str(), destination_path.c_str()) != 0)
    {
        err = errno;
        return AttemptResult{ErrorRecovery::isTransientErrno(err) ? Outcome::RETRY : Outcome::FAILED,
                             TransferErrorKind::WRITE_FAILURE,
                             "Cannot publish " + destination_path + ": " + ErrorRecovery::describeErrno(err)};
    }
    return AttemptResult{Outcome::SUCCEEDED, TransferErrorKind::NONE, ""};
}

void TransferExecutor::skipRemaining(size_t from, const std::string &reason, const EventSink &emit)
{
    size_t total = 0;
    {
        std::lock_guard<std::mutex> lock(report_mutex_);
        total = report_.records.size();
    }
    for (size_t i = from; i < total; ++i)
    {
        updateRecord(i, TransferEventType::STATUS_CHANGED, [&reason](TransferRecord &r)
                     {
            if (r.isTerminal())
                return;
            r.status = TransferStatus::SKIPPED;
            r.skip_reason = reason;
            r.bytes_copied = 0; }, emit);
    }
    Logger::info("Skipped " + std::to_string(total - std::min(from, total)) + " remaining items: " + reason);
}

void TransferExecutor::failRemaining(size_t from, const std::string &detail, const EventSink &emit)
{
    size_t total = 0;
    {
        std::lock_guard<std::mutex> lock(report_mutex_);
        total = report_.records.size();
        report_.session_error = TransferErrorKind::VOLUME_UNAVAILABLE;
        report_.session_error_detail = detail;
    }
    Logger::error("Volume unavailable, failing " + std::to_string(total - std::min(from, total)) + " remaining items");
    for (size_t i = from; i < total; ++i)
    {
        updateRecord(i, TransferEventType::STATUS_CHANGED, [&detail](TransferRecord &r)
                     {
            if (r.isTerminal())
                return;
            r.status = TransferStatus::FAILED;
            r.error_kind = TransferErrorKind::VOLUME_UNAVAILABLE;
            r.error_detail = detail; }, emit);
    }
}

void TransferExecutor::updateRecord(size_t index, TransferEventType type,
                                    const std::function<void(TransferRecord &)> &mutate,
                                    const EventSink &emit, uint64_t bytes_delta, const std::string &message)
{
    TransferEvent event;
    {
        std::lock_guard<std::mutex> lock(report_mutex_);
        mutate(report_.records[index]);
        event = makeEvent(type, index, bytes_delta, message);
    }
    emit(event);
}

TransferEvent TransferExecutor::makeEvent(TransferEventType type, size_t index, uint64_t bytes_delta,
                                          const std::string &message) const
{
    TransferEvent event;
    event.type = type;
    if (index != kNoRecord)
        event.record = report_.records[index];
    event.bytes_delta = bytes_delta;
    event.total_bytes_planned = total_bytes_planned_;
    event.files_total = report_.records.size();
    for (const auto &record : report_.records)
    {
        event.total_bytes_done += record.bytes_copied;
        if (record.isTerminal())
            ++event.files_done;
    }
    event.message = message;
    return event;
}
