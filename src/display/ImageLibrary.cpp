#include "display/ImageLibrary.h"
#include "display/ThemeCatalog.h"
#include "logging/Logger.h"

#include <algorithm>
#include <dirent.h>
#include <utility>

namespace {
    bool hasPpmExtension(const std::string &name) {
        return name.size() > 4 && name.compare(name.size() - 4, 4, ".ppm") == 0;
    }

    std::vector<std::string> listImages(const std::string &dir) {
        std::vector<std::string> files;
        DIR *d = opendir(dir.c_str());
        if (d == nullptr) {
            return files;
        }
        while (struct dirent *entry = readdir(d)) {
            std::string name = entry->d_name;
            if (hasPpmExtension(name)) {
                files.push_back(dir + "/" + name);
            }
        }
        closedir(d);
        std::sort(files.begin(), files.end());
        return files;
    }
}

ImageLibrary::ImageLibrary(std::string assetsDir, int width, int height)
    : imagesDir_{std::move(assetsDir) + "/images"}, width_{width}, height_{height} {
}

const std::vector<Surface> &ImageLibrary::loadFolder(const std::string &folder) {
    auto it = folders_.find(folder);
    if (it != folders_.end()) {
        return it->second;
    }

    std::vector<Surface> images;
    for (const auto &path : listImages(imagesDir_ + "/" + folder)) {
        Surface raw;
        if (!loadPpm(path, raw)) {
            Logger::warn(Logger::Source::Display, tag_, "Failed to load image %s", path.c_str());
            continue;
        }
        Surface scaled(width_, height_);
        scaled.blitScaled(raw);
        images.push_back(std::move(scaled));
    }

    if (images.empty()) {
        Logger::debug(Logger::Source::Display, tag_, "No images in folder: %s", folder.c_str());
    } else {
        Logger::info(Logger::Source::Display, tag_, "Loaded %zu images from %s", images.size(), folder.c_str());
    }

    cycleIndex_[folder] = 0;
    return folders_.emplace(folder, std::move(images)).first->second;
}

const Surface &ImageLibrary::rideImage(const std::string &rideName, const std::string &theme) {
    const std::string folder = ThemeCatalog::imageFolderForRide(rideName);
    const auto &images = loadFolder(folder);
    if (!images.empty()) {
        return images[cycleIndex_[folder] % images.size()];
    }

    const std::string key = folder + "_" + theme;
    auto it = placeholders_.find(key);
    if (it == placeholders_.end()) {
        it = placeholders_.emplace(key, gradient(theme)).first;
    }
    return it->second;
}

const Surface *ImageLibrary::parkImage(const std::string &parkSlug) {
    auto it = parkImages_.find(parkSlug);
    if (it != parkImages_.end()) {
        return &it->second;
    }
    if (parkMissing_.count(parkSlug) != 0) {
        return nullptr;
    }

    Surface raw;
    if (!loadPpm(imagesDir_ + "/parks/" + parkSlug + ".ppm", raw)) {
        parkMissing_[parkSlug] = true;
        return nullptr;
    }
    Surface scaled(width_, height_);
    scaled.blitScaled(raw);
    Logger::debug(Logger::Source::Display, tag_, "Loaded park image: %s", parkSlug.c_str());
    return &parkImages_.emplace(parkSlug, std::move(scaled)).first->second;
}

void ImageLibrary::advanceAllCycles() {
    for (auto &[folder, index] : cycleIndex_) {
        const auto &images = folders_[folder];
        if (!images.empty()) {
            index = (index + 1) % images.size();
        }
    }
}

size_t ImageLibrary::cycleIndex(const std::string &folder) const {
    auto it = cycleIndex_.find(folder);
    return it == cycleIndex_.end() ? 0 : it->second;
}

size_t ImageLibrary::imageCount(const std::string &folder) {
    return loadFolder(folder).size();
}

Surface ImageLibrary::gradient(const std::string &theme) const {
    const ColorScheme &colors = ThemeCatalog::colorScheme(theme);
    Surface surface(width_, height_);
    const int span = std::max(1, width_ + height_);
    for (int y = 0; y < height_; ++y) {
        for (int x = 0; x < width_; ++x) {
            const double ratio = static_cast<double>(x + y) / span;
            auto mix = [ratio](uint8_t a, uint8_t b) {
                const double v = a * (1.0 - ratio) + b * ratio * 0.4;
                return static_cast<uint8_t>(std::clamp(v, 0.0, 255.0));
            };
            surface.setPixel(x, y, Color{mix(colors.background.r, colors.accent.r),
                                         mix(colors.background.g, colors.accent.g),
                                         mix(colors.background.b, colors.accent.b)});
        }
    }
    return surface;
}
