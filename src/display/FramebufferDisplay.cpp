#include "display/FramebufferDisplay.h"
#include "display/DisplayException.h"
#include "logging/Logger.h"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <linux/fb.h>
#include <sys/ioctl.h>
#include <sys/mman.h>
#include <unistd.h>

FramebufferDisplay::FramebufferDisplay(const std::string &device) {
    fd_ = open(device.c_str(), O_RDWR | O_CLOEXEC);
    if (fd_ == -1) {
        throw display_exception("Cannot open " + device + ": " + std::strerror(errno));
    }

    fb_var_screeninfo var{};
    fb_fix_screeninfo fix{};
    if (ioctl(fd_, FBIOGET_VSCREENINFO, &var) == -1 || ioctl(fd_, FBIOGET_FSCREENINFO, &fix) == -1) {
        const int err = errno;
        close(fd_);
        throw display_exception("Cannot query " + device + ": " + std::strerror(err));
    }
    if (var.bits_per_pixel != 16 && var.bits_per_pixel != 32) {
        close(fd_);
        throw display_exception("Unsupported framebuffer depth: " + std::to_string(var.bits_per_pixel) + " bpp");
    }

    width_ = static_cast<int>(var.xres);
    height_ = static_cast<int>(var.yres);
    bpp_ = var.bits_per_pixel;
    lineLength_ = fix.line_length;
    redOffset_ = var.red.offset;
    greenOffset_ = var.green.offset;
    blueOffset_ = var.blue.offset;
    size_ = static_cast<size_t>(fix.line_length) * var.yres;

    void *mapped = mmap(nullptr, size_, PROT_READ | PROT_WRITE, MAP_SHARED, fd_, 0);
    if (mapped == MAP_FAILED) {
        const int err = errno;
        close(fd_);
        throw display_exception(std::string("mmap failed: ") + std::strerror(err));
    }
    mem_ = static_cast<uint8_t *>(mapped);

    Logger::info(Logger::Source::Display, tag_, "%s: %dx%d, %u bpp", device.c_str(), width_, height_, bpp_);
}

FramebufferDisplay::~FramebufferDisplay() {
    if (mem_ != nullptr) {
        munmap(mem_, size_);
    }
    if (fd_ != -1) {
        close(fd_);
    }
}

void FramebufferDisplay::present(const Surface &frame) {
    const int w = std::min(width_, frame.width());
    const int h = std::min(height_, frame.height());
    const auto &pixels = frame.pixels();

    for (int y = 0; y < h; ++y) {
        uint8_t *row = mem_ + static_cast<size_t>(y) * lineLength_;
        const Color *src = pixels.data() + static_cast<size_t>(y) * frame.width();
        if (bpp_ == 32) {
            auto *out = reinterpret_cast<uint32_t *>(row);
            for (int x = 0; x < w; ++x) {
                out[x] = (static_cast<uint32_t>(src[x].r) << redOffset_) |
                         (static_cast<uint32_t>(src[x].g) << greenOffset_) |
                         (static_cast<uint32_t>(src[x].b) << blueOffset_);
            }
        } else {
            auto *out = reinterpret_cast<uint16_t *>(row);
            for (int x = 0; x < w; ++x) {
                out[x] = static_cast<uint16_t>(((src[x].r >> 3) << 11) | ((src[x].g >> 2) << 5) | (src[x].b >> 3));
            }
        }
    }
}

void FramebufferDisplay::clear() {
    std::memset(mem_, 0, size_);
}
