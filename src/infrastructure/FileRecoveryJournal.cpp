#include "infrastructure/FileRecoveryJournal.hpp"
#include <cerrno>
#include <cstring>
#include <ctime>
#include <fcntl.h>
#include <iostream>
#include <unistd.h>

namespace writher::infrastructure {

FileRecoveryJournal::FileRecoveryJournal(std::filesystem::path path) : m_path(std::move(path)) {}

bool FileRecoveryJournal::append(const std::string& text) {
    std::lock_guard<std::mutex> lock(m_mutex);

    std::time_t now = std::time(nullptr);
    std::tm tm = {};
    localtime_r(&now, &tm);
    char stamp[32];
    std::strftime(stamp, sizeof(stamp), "%Y-%m-%d %H:%M:%S", &tm);
    const std::string line = std::string("[") + stamp + "] " + text + "\n";

    const int fd = ::open(m_path.c_str(), O_WRONLY | O_APPEND | O_CREAT | O_CLOEXEC, 0600);
    if (fd < 0) {
        std::cerr << "[FileRecoveryJournal] Cannot open " << m_path << ": " << std::strerror(errno) << std::endl;
        return false;
    }

    size_t offset = 0;
    while (offset < line.size()) {
        const ssize_t n = ::write(fd, line.data() + offset, line.size() - offset);
        if (n < 0) {
            if (errno == EINTR) continue;
            std::cerr << "[FileRecoveryJournal] Write failed: " << std::strerror(errno) << std::endl;
            ::close(fd);
            return false;
        }
        offset += static_cast<size_t>(n);
    }

    const bool synced = ::fsync(fd) == 0;
    if (!synced) {
        std::cerr << "[FileRecoveryJournal] fsync failed: " << std::strerror(errno) << std::endl;
    }
    ::close(fd);
    return synced;
}

} // namespace writher::infrastructure
