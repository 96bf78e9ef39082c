#pragma once

#include <string>

enum class MediaType
{
    PHOTO,
    VIDEO,
    OTHER
};

/**
 * @brief Where a MediaItem's capture timestamp came from
 */
enum class CaptureTimeSource
{
    EXIF,      // JPEG/TIFF EXIF DateTimeOriginal or DateTime
    RAW,       // LibRaw decoded camera timestamp
    CONTAINER, // FFmpeg container creation_time tag
    MTIME      // Filesystem modification time fallback
};

enum class TransferStatus
{
    PENDING,
    COPYING,
    VERIFYING,
    SUCCEEDED,
    FAILED,
    SKIPPED
};

enum class TransferErrorKind
{
    NONE,
    VOLUME_UNAVAILABLE,
    UNREADABLE_SOURCE,
    WRITE_FAILURE,
    VERIFICATION_MISMATCH,
    PLAN_COLLISION_UNRESOLVED,
    DELETION_FAILURE
};

enum class VerificationResult
{
    NOT_VERIFIED,
    MATCH,
    MISMATCH
};

class MediaTypes
{
public:
    static std::string getMediaTypeName(MediaType type)
    {
        switch (type)
        {
        case MediaType::PHOTO:
            return "photo";
        case MediaType::VIDEO:
            return "video";
        default:
            return "other";
        }
    }

    static MediaType mediaTypeFromString(const std::string &type_str)
    {
        if (type_str == "photo" || type_str == "image" || type_str == "PHOTO")
            return MediaType::PHOTO;
        else if (type_str == "video" || type_str == "VIDEO")
            return MediaType::VIDEO;
        else
            return MediaType::OTHER;
    }

    static std::string getCaptureSourceName(CaptureTimeSource source)
    {
        switch (source)
        {
        case CaptureTimeSource::EXIF:
            return "exif";
        case CaptureTimeSource::RAW:
            return "raw";
        case CaptureTimeSource::CONTAINER:
            return "container";
        default:
            return "mtime";
        }
    }

    static std::string getStatusName(TransferStatus status)
    {
        switch (status)
        {
        case TransferStatus::PENDING:
            return "pending";
        case TransferStatus::COPYING:
            return "copying";
        case TransferStatus::VERIFYING:
            return "verifying";
        case TransferStatus::SUCCEEDED:
            return "succeeded";
        case TransferStatus::FAILED:
            return "failed";
        case TransferStatus::SKIPPED:
            return "skipped";
        default:
            return "unknown";
        }
    }

    // Terminal statuses never change again within a session
    static bool isTerminal(TransferStatus status)
    {
        return status == TransferStatus::SUCCEEDED ||
               status == TransferStatus::FAILED ||
               status == TransferStatus::SKIPPED;
    }

    static std::string getErrorKindName(TransferErrorKind kind)
    {
        switch (kind)
        {
        case TransferErrorKind::NONE:
            return "none";
        case TransferErrorKind::VOLUME_UNAVAILABLE:
            return "VolumeUnavailable";
        case TransferErrorKind::UNREADABLE_SOURCE:
            return "UnreadableSource";
        case TransferErrorKind::WRITE_FAILURE:
            return "WriteFailure";
        case TransferErrorKind::VERIFICATION_MISMATCH:
            return "VerificationMismatch";
        case TransferErrorKind::PLAN_COLLISION_UNRESOLVED:
            return "PlanCollisionUnresolved";
        case TransferErrorKind::DELETION_FAILURE:
            return "DeletionFailure";
        default:
            return "unknown";
        }
    }

    static std::string getVerificationName(VerificationResult result)
    {
        switch (result)
        {
        case VerificationResult::MATCH:
            return "match";
        case VerificationResult::MISMATCH:
            return "mismatch";
        default:
            return "not-verified";
        }
    }
};
