#include "core/transfer_record.hpp"
#include <algorithm>

nlohmann::json TransferRecord::toJson() const
{
    nlohmann::json j;
    j["item_id"] = item_id;
    j["source_path"] = source_path;
    j["destination_path"] = destination_path;
    j["status"] = MediaTypes::getStatusName(status);
    j["bytes_total"] = bytes_total;
    j["bytes_copied"] = bytes_copied;
    j["verification"] = MediaTypes::getVerificationName(verification);
    j["attempts"] = attempts;
    j["retries"] = retries;
    if (error_kind != TransferErrorKind::NONE)
    {
        j["error_kind"] = MediaTypes::getErrorKindName(error_kind);
        j["error_detail"] = error_detail;
    }
    if (!source_checksum.empty())
        j["source_checksum"] = source_checksum;
    if (!destination_checksum.empty())
        j["destination_checksum"] = destination_checksum;
    if (!skip_reason.empty())
        j["skip_reason"] = skip_reason;
    return j;
}

size_t TransferReport::count(TransferStatus status) const
{
    return static_cast<size_t>(std::count_if(records.begin(), records.end(),
                                             [status](const TransferRecord &r)
                                             { return r.status == status; }));
}

uint64_t TransferReport::bytesCopied() const
{
    uint64_t total = 0;
    for (const auto &record : records)
    {
        if (record.status == TransferStatus::SUCCEEDED)
            total += record.bytes_copied;
    }
    return total;
}

int TransferReport::totalRetries() const
{
    int total = 0;
    for (const auto &record : records)
        total += record.retries;
    return total;
}

const TransferRecord *TransferReport::find(const std::string &item_id) const
{
    for (const auto &record : records)
    {
        if (record.item_id == item_id)
            return &record;
    }
    return nullptr;
}

std::map<TransferStatus, std::vector<const TransferRecord *>> TransferReport::groupByStatus() const
{
    std::map<TransferStatus, std::vector<const TransferRecord *>> groups;
    for (const auto &record : records)
        groups[record.status].push_back(&record);
    return groups;
}

nlohmann::json TransferReport::toJson() const
{
    nlohmann::json j;
    j["completed"] = completed;
    j["cancelled"] = cancelled;
    if (session_error != TransferErrorKind::NONE)
    {
        j["session_error"] = MediaTypes::getErrorKindName(session_error);
        j["session_error_detail"] = session_error_detail;
    }
    j["succeeded"] = count(TransferStatus::SUCCEEDED);
    j["failed"] = count(TransferStatus::FAILED);
    j["skipped"] = count(TransferStatus::SKIPPED);
    j["bytes_copied"] = bytesCopied();
    j["retries"] = totalRetries();
    j["records"] = nlohmann::json::array();
    for (const auto &record : records)
        j["records"].push_back(record.toJson());
    return j;
}

std::string TransferEvent::getTypeName(TransferEventType type)
{
    switch (type)
    {
    case TransferEventType::STATUS_CHANGED:
        return "status-changed";
    case TransferEventType::CHUNK_COPIED:
        return "chunk-copied";
    case TransferEventType::RETRY_SCHEDULED:
        return "retry-scheduled";
    case TransferEventType::SESSION_FINISHED:
        return "session-finished";
    default:
        return "unknown";
    }
}
