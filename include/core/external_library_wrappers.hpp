#pragma once
#include <memory>
#include <string>
extern "C"
{
#include <libavformat/avformat.h>
}
#include <libraw/libraw.h>

// RAII wrapper for an opened FFmpeg input (avformat_open_input / avformat_close_input)
class AVFormatInputRAII
{
private:
    AVFormatContext *ctx_;

public:
    AVFormatInputRAII() : ctx_(nullptr) {}
    ~AVFormatInputRAII()
    {
        if (ctx_)
            avformat_close_input(&ctx_);
    }

    AVFormatContext *get() { return ctx_; }
    AVFormatContext **address() { return &ctx_; }

    // Disable copy
    AVFormatInputRAII(const AVFormatInputRAII &) = delete;
    AVFormatInputRAII &operator=(const AVFormatInputRAII &) = delete;

    // Allow move
    AVFormatInputRAII(AVFormatInputRAII &&other) noexcept : ctx_(other.ctx_)
    {
        other.ctx_ = nullptr;
    }
};

// RAII wrapper for a LibRaw processor opened on a file; only metadata is parsed
class LibRawMetadataRAII
{
private:
    std::unique_ptr<LibRaw> raw_;
    bool opened_;

public:
    LibRawMetadataRAII() : raw_(new LibRaw()), opened_(false) {}
    ~LibRawMetadataRAII()
    {
        if (raw_ && opened_)
            raw_->recycle();
    }

    // Returns the LibRaw error code, LIBRAW_SUCCESS on success
    int open(const std::string &path)
    {
        int rc = raw_->open_file(path.c_str());
        opened_ = (rc == LIBRAW_SUCCESS);
        return rc;
    }

    LibRaw *get() { return raw_.get(); }

    LibRawMetadataRAII(const LibRawMetadataRAII &) = delete;
    LibRawMetadataRAII &operator=(const LibRawMetadataRAII &) = delete;

    LibRawMetadataRAII(LibRawMetadataRAII &&other) noexcept
        : raw_(std::move(other.raw_)), opened_(other.opened_)
    {
        other.opened_ = false;
    }
};
