#include "core/transfer_session.hpp"
#include "logging/logger.hpp"
#include <stdexcept>

std::atomic<bool> TransferSession::session_active_{false};

TransferSession::TransferSession(TransferOptions options, TransferHooks hooks)
    : executor_(std::move(options), std::move(hooks))
{
}

TransferSession::~TransferSession()
{
    if (running_.load())
    {
        Logger::warn("TransferSession destroyed while running, cancelling");
        executor_.cancel();
    }
    std::lock_guard<std::mutex> lock(join_mutex_);
    if (worker_.joinable())
        worker_.join();
}

void TransferSession::start(const TransferPlan &plan, VolumeHandlePtr volume)
{
    if (!volume)
        throw std::invalid_argument("TransferSession requires a volume handle");
    if (started_.exchange(true))
        throw std::logic_error("TransferSession already started");

    bool expected = false;
    if (!session_active_.compare_exchange_strong(expected, true))
    {
        started_.store(false);
        throw std::logic_error("Another transfer session is already active");
    }
    if (!volume->claim())
    {
        session_active_.store(false);
        started_.store(false);
        throw std::logic_error("Volume " + volume->volume().id + " is claimed by another session");
    }

    volume_ = std::move(volume);
    running_.store(true);
    Logger::info("Transfer session started for volume " + volume_->volume().toString());
    // execute() clears the cancel flag and must run before start() returns
    SimpleObservable<TransferEvent> stream = executor_.execute(plan, volume_);
    worker_ = std::thread(&TransferSession::worker, this, std::move(stream));
}

void TransferSession::worker(SimpleObservable<TransferEvent> stream)
{
    stream.subscribe(
        [this](const TransferEvent &event)
        { events_.send(event); },
        [this](const std::exception &e)
        {
            Logger::error("Transfer session ended with error: " + std::string(e.what()));
            std::lock_guard<std::mutex> lock(error_mutex_);
            error_message_ = e.what();
        },
        []()
        { Logger::debug("Transfer session stream completed"); });

    volume_->release();
    finished_.store(true);
    running_.store(false);
    session_active_.store(false);
    events_.close();
    Logger::info("Transfer session finished");
}

void TransferSession::cancel()
{
    executor_.cancel();
}

TransferReport TransferSession::wait()
{
    {
        std::lock_guard<std::mutex> lock(join_mutex_);
        if (worker_.joinable())
            worker_.join();
    }
    return executor_.report();
}

std::string TransferSession::errorMessage() const
{
    std::lock_guard<std::mutex> lock(error_mutex_);
    return error_message_;
}
