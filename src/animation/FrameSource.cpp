#include "animation/FrameSource.h"
#include "logging/Logger.h"

#include <algorithm>
#include <dirent.h>
#include <fstream>
#include <sys/stat.h>

namespace {
    constexpr auto TAG{"Video"};

    bool hasPpmSuffix(const std::string &name) {
        return name.size() > 4 && name.compare(name.size() - 4, 4, ".ppm") == 0;
    }

    std::vector<std::string> listFrames(const std::string &directory) {
        std::vector<std::string> frames;
        DIR *dir = opendir(directory.c_str());
        if (!dir) {
            return frames;
        }
        while (dirent *entry = readdir(dir)) {
            std::string name = entry->d_name;
            if (hasPpmSuffix(name)) {
                frames.push_back(directory + "/" + name);
            }
        }
        closedir(dir);
        std::sort(frames.begin(), frames.end());
        return frames;
    }

    double readFps(const std::string &directory) {
        std::ifstream in(directory + "/fps");
        double fps = 0.0;
        if (in >> fps && fps > 0.0) {
            return fps;
        }
        return FrameSequenceSource::DEFAULT_FPS;
    }
}

std::unique_ptr<FrameSequenceSource> FrameSequenceSource::open(const std::string &directory, int width,
                                                               int height) {
    auto frames = listFrames(directory);
    if (frames.empty()) {
        return nullptr;
    }
    const double fps = readFps(directory);
    Logger::info(Logger::Source::Display, TAG, "Loaded video: %s (%zu frames, %.1f fps)",
                 directory.c_str(), frames.size(), fps);
    return std::unique_ptr<FrameSequenceSource>(new FrameSequenceSource(std::move(frames), fps, width, height));
}

FrameSequenceSource::FrameSequenceSource(std::vector<std::string> frames, double fps, int width, int height)
    : frames_{std::move(frames)}, fps_{fps}, width_{width}, height_{height} {
}

bool FrameSequenceSource::readNext(Surface &out) {
    if (position_ >= frames_.size()) {
        return false;
    }
    Surface frame;
    const std::string &path = frames_[position_++];
    if (!loadPpm(path, frame)) {
        Logger::warn(Logger::Source::Display, TAG, "Cannot decode frame %s", path.c_str());
        return false;
    }
    if (frame.width() == width_ && frame.height() == height_) {
        out = std::move(frame);
    } else {
        Surface scaled(width_, height_);
        scaled.blitScaled(frame);
        out = std::move(scaled);
    }
    return true;
}

DirectoryVideoCatalog::DirectoryVideoCatalog(std::string assetsDir, int width, int height)
    : videosDir_{std::move(assetsDir) + "/videos"}, width_{width}, height_{height} {
}

std::string DirectoryVideoCatalog::directoryFor(const std::string &key) const {
    return videosDir_ + "/" + key;
}

bool DirectoryVideoCatalog::available(const std::string &key) const {
    struct stat st{};
    return stat(directoryFor(key).c_str(), &st) == 0 && S_ISDIR(st.st_mode);
}

std::unique_ptr<FrameSource> DirectoryVideoCatalog::open(const std::string &key) const {
    return FrameSequenceSource::open(directoryFor(key), width_, height_);
}
