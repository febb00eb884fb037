#include "logging/Logger.h"
#include "core/Constants.h"

#include <fcntl.h>
#include <sys/stat.h>
#include <cstdio>
#include <mutex>

namespace Logger {
    namespace {
        std::mutex fileMutex;
        int fileFd = -1;
        uint64_t fileBytes = 0;
        std::string filePath;

        int openForAppend(const std::string &path) {
            return ::open(path.c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, 0644);
        }

        // Caller holds fileMutex. path.N-1 -> path.N ... path -> path.1
        void rotateLocked() {
            ::close(fileFd);
            fileFd = -1;

            for (uint32_t i = Constants::Log::BACKUP_COUNT; i > 0; --i) {
                std::string from = (i == 1) ? filePath : filePath + "." + std::to_string(i - 1);
                std::string to = filePath + "." + std::to_string(i);
                ::rename(from.c_str(), to.c_str());
            }

            fileFd = openForAppend(filePath);
            fileBytes = 0;
        }
    }

    namespace detail {
        void writeToFile(const char *line, size_t length) {
            std::lock_guard<std::mutex> lock(fileMutex);
            if (fileFd == -1) {
                return;
            }
            if (fileBytes + length > Constants::Log::MAX_FILE_BYTES) {
                rotateLocked();
                if (fileFd == -1) return;
            }
            ssize_t written = ::write(fileFd, line, length);
            if (written > 0) {
                fileBytes += static_cast<uint64_t>(written);
            }
        }
    }

    bool openFile(const std::string &path) {
        std::lock_guard<std::mutex> lock(fileMutex);
        if (fileFd != -1) {
            ::close(fileFd);
        }
        filePath = path;
        fileFd = openForAppend(path);
        if (fileFd == -1) {
            return false;
        }
        struct stat st{};
        fileBytes = (fstat(fileFd, &st) == 0) ? static_cast<uint64_t>(st.st_size) : 0;
        return true;
    }

    void closeFile() {
        std::lock_guard<std::mutex> lock(fileMutex);
        if (fileFd != -1) {
            ::close(fileFd);
            fileFd = -1;
        }
    }
}
