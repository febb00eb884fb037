#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

#include "display/Surface.h"

/**
 * @brief RAII owner of a memory-mapped Linux framebuffer.
 *
 * Supports 16 bpp (RGB565) and 32 bpp (XRGB8888) devices. Surfaces are
 * copied to the top-left corner and clipped to the visible resolution.
 */
class FramebufferDisplay {
public:
    /**
     * @throws display_exception If the device cannot be opened, queried or mapped
     *         or uses an unsupported pixel depth
     */
    explicit FramebufferDisplay(const std::string &device);

    ~FramebufferDisplay();

    FramebufferDisplay(const FramebufferDisplay &) = delete;
    FramebufferDisplay &operator=(const FramebufferDisplay &) = delete;

    int width() const { return width_; }
    int height() const { return height_; }
    uint32_t bitsPerPixel() const { return bpp_; }

    void present(const Surface &frame);

    /** Fill the whole screen black (used on shutdown). */
    void clear();

private:
    static constexpr auto tag_{"Framebuffer"};

    int fd_{-1};
    uint8_t *mem_{nullptr};
    size_t size_{0};
    int width_{0};
    int height_{0};
    uint32_t bpp_{0};
    uint32_t lineLength_{0};
    uint32_t redOffset_{16};
    uint32_t greenOffset_{8};
    uint32_t blueOffset_{0};
};
