#pragma once

#include <memory>
#include <string>
#include <vector>

#include "display/Surface.h"

/**
 * @brief Sequential source of pre-rendered video frames.
 */
class FrameSource {
public:
    virtual ~FrameSource() = default;

    /**
     * @brief Decode the next frame into out.
     * @return false at end of stream or on a decode error
     */
    virtual bool readNext(Surface &out) = 0;

    virtual void rewind() = 0;

    /** Native frame rate of the source. */
    virtual double fps() const = 0;
};

/**
 * @brief Frames stored as numbered PPM files in one directory.
 *
 * Files are played in name order. An optional "fps" file in the same
 * directory holds the native rate, otherwise 30 fps is assumed.
 */
class FrameSequenceSource : public FrameSource {
public:
    static constexpr double DEFAULT_FPS{30.0};

    /**
     * @return nullptr when the directory holds no .ppm frames
     */
    static std::unique_ptr<FrameSequenceSource> open(const std::string &directory, int width, int height);

    bool readNext(Surface &out) override;
    void rewind() override { position_ = 0; }
    double fps() const override { return fps_; }

    size_t frameCount() const { return frames_.size(); }

private:
    FrameSequenceSource(std::vector<std::string> frames, double fps, int width, int height);

    std::vector<std::string> frames_;
    double fps_;
    int width_;
    int height_;
    size_t position_{0};
};

/**
 * @brief Lookup of recorded shows by "<park-slug>_<event-type>".
 */
class VideoCatalog {
public:
    virtual ~VideoCatalog() = default;

    /** Cheap check, called once per tick. */
    virtual bool available(const std::string &key) const = 0;

    virtual std::unique_ptr<FrameSource> open(const std::string &key) const = 0;
};

/**
 * @brief Videos as frame directories under <assets>/videos/<key>/.
 */
class DirectoryVideoCatalog : public VideoCatalog {
public:
    DirectoryVideoCatalog(std::string assetsDir, int width, int height);

    bool available(const std::string &key) const override;
    std::unique_ptr<FrameSource> open(const std::string &key) const override;

private:
    std::string videosDir_;
    int width_;
    int height_;

    std::string directoryFor(const std::string &key) const;
};
