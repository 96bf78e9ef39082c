#include "core/cleanup_coordinator.hpp"
#include "core/error_recovery.hpp"
#include "core/file_utils.hpp"
#include "logging/logger.hpp"
#include <cerrno>
#include <stdexcept>
#include <system_error>
#include <unistd.h>

std::string CleanupItemResult::getOutcomeName(CleanupOutcome outcome)
{
    switch (outcome)
    {
    case CleanupOutcome::DELETED:
        return "deleted";
    case CleanupOutcome::DELETE_FAILED:
        return "delete-failed";
    case CleanupOutcome::NOT_ELIGIBLE:
        return "not-eligible";
    default:
        return "unknown";
    }
}

nlohmann::json CleanupResult::toJson() const
{
    nlohmann::json j;
    j["confirmed"] = confirmed;
    j["deleted"] = deleted;
    j["failed"] = failed;
    j["not_eligible"] = not_eligible;
    j["items"] = nlohmann::json::array();
    for (const auto &item : items)
    {
        nlohmann::json entry;
        entry["item_id"] = item.item_id;
        entry["source_path"] = item.source_path;
        entry["outcome"] = CleanupItemResult::getOutcomeName(item.outcome);
        if (item.error_kind != TransferErrorKind::NONE)
            entry["error_kind"] = MediaTypes::getErrorKindName(item.error_kind);
        if (!item.detail.empty())
            entry["detail"] = item.detail;
        j["items"].push_back(entry);
    }
    return j;
}

CleanupCoordinator::CleanupCoordinator(CleanupOptions options) : options_(options)
{
}

void CleanupCoordinator::deleteSource(const std::string &path) const
{
    if (::unlink(path.c_str()) != 0)
        throw std::system_error(errno, std::generic_category(), "unlink " + path);
}

CleanupResult CleanupCoordinator::cleanup(const TransferReport &report, const CleanupConfirmation &confirm,
                                          const VolumeHandlePtr &volume) const
{
    if (!report.completed)
    {
        Logger::error("Cleanup refused: transfer session has not completed");
        throw std::logic_error("Cleanup requires a completed transfer session");
    }

    CleanupResult result;
    result.confirmed = confirm.confirmed;

    if (!confirm.confirmed)
        Logger::info("Cleanup not confirmed, no source files will be deleted");

    for (const auto &record : report.records)
    {
        CleanupItemResult item;
        item.item_id = record.item_id;
        item.source_path = record.source_path;

        if (record.status != TransferStatus::SUCCEEDED || !confirm.confirmed)
        {
            item.outcome = CleanupOutcome::NOT_ELIGIBLE;
            item.detail = confirm.confirmed ? "status " + MediaTypes::getStatusName(record.status)
                                            : "not confirmed";
            ++result.not_eligible;
            result.items.push_back(item);
            continue;
        }

        if (volume && !volume->isAccessible())
        {
            item.outcome = CleanupOutcome::DELETE_FAILED;
            item.error_kind = TransferErrorKind::VOLUME_UNAVAILABLE;
            item.detail = "Source volume is no longer available";
            ++result.failed;
            result.items.push_back(item);
            continue;
        }

        auto destination = FileUtils::getFileMetadata(record.destination_path);
        if (!destination || destination->file_size != record.bytes_total)
        {
            item.outcome = CleanupOutcome::DELETE_FAILED;
            item.error_kind = TransferErrorKind::DELETION_FAILURE;
            item.detail = "Destination missing or changed: " + record.destination_path;
            Logger::error("Keeping " + record.source_path + ": " + item.detail);
            ++result.failed;
            result.items.push_back(item);
            continue;
        }

        try
        {
            ErrorRecovery::retryWithBackoff([this, &record]()
                                            { deleteSource(record.source_path); },
                                            options_.max_retries, "delete " + record.source_path,
                                            options_.backoff_base_ms, options_.max_backoff_ms);
            item.outcome = CleanupOutcome::DELETED;
            ++result.deleted;
            Logger::debug("Deleted source " + record.source_path);
        }
        catch (const std::system_error &e)
        {
            item.outcome = CleanupOutcome::DELETE_FAILED;
            item.error_kind = TransferErrorKind::DELETION_FAILURE;
            item.detail = e.what();
            ++result.failed;
        }
        result.items.push_back(item);
    }

    Logger::info("Cleanup finished: " + std::to_string(result.deleted) + " deleted, " +
                 std::to_string(result.failed) + " failed, " + std::to_string(result.not_eligible) +
                 " not eligible");
    return result;
}
