#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/media_types.hpp"

/**
 * @brief Per-item outcome of a transfer session
 */
struct TransferRecord
{
    std::string item_id;
    std::string source_path;
    std::string destination_path;
    TransferStatus status = TransferStatus::PENDING;
    TransferErrorKind error_kind = TransferErrorKind::NONE;
    std::string error_detail;
    uint64_t bytes_total = 0;
    uint64_t bytes_copied = 0;
    VerificationResult verification = VerificationResult::NOT_VERIFIED;
    std::string source_checksum;
    std::string destination_checksum;
    int attempts = 0;
    int retries = 0;
    std::string skip_reason; // "identical" or "cancelled"

    bool isTerminal() const { return MediaTypes::isTerminal(status); }
    nlohmann::json toJson() const;
};

/**
 * @brief All records of a session in plan order. Sole input to cleanup.
 */
struct TransferReport
{
    std::vector<TransferRecord> records;
    bool completed = false; // the session ran to its end, including cancel or volume loss
    bool cancelled = false;
    TransferErrorKind session_error = TransferErrorKind::NONE;
    std::string session_error_detail;

    size_t count(TransferStatus status) const;
    uint64_t bytesCopied() const;
    int totalRetries() const;
    const TransferRecord *find(const std::string &item_id) const;
    std::map<TransferStatus, std::vector<const TransferRecord *>> groupByStatus() const;

    nlohmann::json toJson() const;
};

enum class TransferEventType
{
    STATUS_CHANGED,
    CHUNK_COPIED,
    RETRY_SCHEDULED,
    SESSION_FINISHED
};

struct TransferEvent
{
    TransferEventType type;
    TransferRecord record; // snapshot after the change
    uint64_t bytes_delta = 0;
    uint64_t total_bytes_done = 0;
    uint64_t total_bytes_planned = 0;
    size_t files_done = 0; // records in a terminal state
    size_t files_total = 0;
    std::string message;

    static std::string getTypeName(TransferEventType type);
};
