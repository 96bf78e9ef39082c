#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/transfer_record.hpp"
#include "core/volume.hpp"

/**
 * @brief Explicit user decision to remove transferred originals
 */
struct CleanupConfirmation
{
    bool confirmed = false;

    static CleanupConfirmation granted() { return CleanupConfirmation{true}; }
    static CleanupConfirmation denied() { return CleanupConfirmation{false}; }
};

enum class CleanupOutcome
{
    DELETED,
    DELETE_FAILED,
    NOT_ELIGIBLE
};

struct CleanupItemResult
{
    std::string item_id;
    std::string source_path;
    CleanupOutcome outcome = CleanupOutcome::NOT_ELIGIBLE;
    TransferErrorKind error_kind = TransferErrorKind::NONE;
    std::string detail;

    static std::string getOutcomeName(CleanupOutcome outcome);
};

struct CleanupResult
{
    bool confirmed = false;
    size_t deleted = 0;
    size_t failed = 0;
    size_t not_eligible = 0;
    std::vector<CleanupItemResult> items;

    nlohmann::json toJson() const;
};

struct CleanupOptions
{
    int max_retries = 2;
    int backoff_base_ms = 50;
    int max_backoff_ms = 500;
};

/**
 * @brief Removes source files whose transfer succeeded and was verified
 *
 * Failed and skipped records are never touched. A source is only deleted
 * while its published destination still exists.
 */
class CleanupCoordinator
{
public:
    explicit CleanupCoordinator(CleanupOptions options = CleanupOptions{});

    /**
     * @brief Delete eligible sources of a finished session
     * @param report Report of a session with completed == true
     * @param confirm Nothing is deleted unless confirm.confirmed is set
     * @param volume Optional source volume; when given it must still be accessible
     * @throws std::logic_error if the session has not completed
     */
    CleanupResult cleanup(const TransferReport &report, const CleanupConfirmation &confirm,
                          const VolumeHandlePtr &volume = nullptr) const;

private:
    void deleteSource(const std::string &path) const;

    CleanupOptions options_;
};
