#pragma once

#include <map>
#include <string>
#include <vector>

#include "display/Surface.h"

/**
 * @brief Ride and park artwork loaded from the assets directory.
 *
 * Ride images live in <assets>/images/<folder>/*.ppm, park images in
 * <assets>/images/parks/<slug>.ppm. Each folder has its own cycle index
 * that only moves when advanceAllCycles() is called (once per full lap
 * of the rotation). Folders without images get a generated placeholder.
 */
class ImageLibrary {
public:
    ImageLibrary(std::string assetsDir, int width, int height);

    /**
     * @brief Current image for a ride (does not advance the cycle).
     * @param rideName Ride name, mapped to a folder by ThemeCatalog
     * @param theme Theme used for the placeholder when the folder is empty
     */
    const Surface &rideImage(const std::string &rideName, const std::string &theme);

    /**
     * @brief Park image scaled to the screen, or nullptr if none exists.
     */
    const Surface *parkImage(const std::string &parkSlug);

    /**
     * @brief Move every loaded folder with images to its next image.
     */
    void advanceAllCycles();

    /** Current index of a folder, 0 when never loaded. */
    size_t cycleIndex(const std::string &folder) const;

    /** Number of images in a folder (loads it on first use). */
    size_t imageCount(const std::string &folder);

    /** Diagonal gradient of the theme colours. */
    Surface gradient(const std::string &theme) const;

private:
    static constexpr auto tag_{"ImageLibrary"};

    std::string imagesDir_;
    int width_;
    int height_;

    std::map<std::string, std::vector<Surface>> folders_;
    std::map<std::string, size_t> cycleIndex_;
    std::map<std::string, Surface> placeholders_;
    std::map<std::string, Surface> parkImages_;
    std::map<std::string, bool> parkMissing_;

    const std::vector<Surface> &loadFolder(const std::string &folder);
};
