#pragma once

#include <stdexcept>
#include <string>
#include "core/media_types.hpp"

/**
 * @brief Session-level transfer failure carrying its error kind
 */
class TransferError : public std::runtime_error
{
public:
    TransferError(TransferErrorKind kind, const std::string &message)
        : std::runtime_error(message), kind_(kind) {}

    TransferErrorKind kind() const noexcept { return kind_; }

private:
    TransferErrorKind kind_;
};

// Removable volume detached or became unreadable while a session held it
class VolumeUnavailableError : public TransferError
{
public:
    explicit VolumeUnavailableError(const std::string &message)
        : TransferError(TransferErrorKind::VOLUME_UNAVAILABLE, message) {}
};

// Two plan entries resolved to the same destination. Programming error.
class PlanCollisionError : public std::logic_error
{
public:
    explicit PlanCollisionError(const std::string &message)
        : std::logic_error(message) {}
};
