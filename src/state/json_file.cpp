#include "state/json_file.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>
#include <thread>
#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

namespace hookstack::state {

namespace {

std::string errno_message(const std::string& what, const std::filesystem::path& path) {
    return what + " " + path.string() + ": " + std::strerror(errno);
}

} // namespace

FileLock::FileLock(const std::filesystem::path& lock_path, Mode mode,
                   std::chrono::milliseconds timeout) {
    std::error_code ec;
    std::filesystem::create_directories(lock_path.parent_path(), ec);

    fd_ = ::open(lock_path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
    if (fd_ < 0) {
        throw std::runtime_error(errno_message("cannot open lock file", lock_path));
    }

    const int op = (mode == Mode::EXCLUSIVE ? LOCK_EX : LOCK_SH) | LOCK_NB;
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    auto backoff = std::chrono::milliseconds(1);

    while (::flock(fd_, op) != 0) {
        if (errno != EWOULDBLOCK && errno != EINTR) {
            std::string msg = errno_message("flock failed on", lock_path);
            ::close(fd_);
            fd_ = -1;
            throw std::runtime_error(msg);
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            ::close(fd_);
            fd_ = -1;
            throw LockTimeout("timed out waiting for lock " + lock_path.string());
        }
        std::this_thread::sleep_for(backoff);
        backoff = std::min(backoff * 2, std::chrono::milliseconds(20));
    }
}

FileLock::~FileLock() {
    if (fd_ >= 0) {
        ::flock(fd_, LOCK_UN);
        ::close(fd_);
    }
}

JsonFile::JsonFile(std::filesystem::path path, std::chrono::milliseconds lock_timeout)
    : path_(std::move(path))
    , lock_path_(path_.string() + ".lock")
    , lock_timeout_(lock_timeout) {}

std::optional<nlohmann::json> JsonFile::read() const {
    FileLock lock(lock_path_, FileLock::Mode::SHARED, lock_timeout_);
    return read_unlocked();
}

UpdateResult JsonFile::update(const Mutator& mutate) {
    FileLock lock(lock_path_, FileLock::Mode::EXCLUSIVE, lock_timeout_);

    UpdateResult result;
    nlohmann::json doc = nlohmann::json::object();
    try {
        auto current = read_unlocked();
        if (current) {
            doc = std::move(*current);
        }
    } catch (const PersistenceError& e) {
        spdlog::error("PersistenceError: {} (reinitializing)", e.what());
        result.recovered = true;
    }

    bool changed = false;
    try {
        changed = mutate(doc);
    } catch (const nlohmann::json::exception& e) {
        // Parses as JSON but a field has the wrong shape.
        spdlog::error("PersistenceError: {}: malformed content: {} (reinitializing)",
                      path_.string(), e.what());
        doc = nlohmann::json::object();
        result.recovered = true;
        changed = mutate(doc);
    }

    if (changed || result.recovered) {
        write_unlocked(doc);
        result.written = true;
    }
    return result;
}

std::optional<nlohmann::json> JsonFile::read_unlocked() const {
    std::ifstream file(path_, std::ios::binary);
    if (!file.is_open()) {
        std::error_code ec;
        if (!std::filesystem::exists(path_, ec)) {
            return std::nullopt;
        }
        throw std::runtime_error("cannot open " + path_.string());
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    nlohmann::json doc;
    try {
        doc = nlohmann::json::parse(buffer.str());
    } catch (const nlohmann::json::parse_error& e) {
        throw PersistenceError(path_.string() + ": " + e.what());
    }
    if (!doc.is_object()) {
        throw PersistenceError(path_.string() + ": top-level value is not an object");
    }
    return doc;
}

void JsonFile::write_unlocked(const nlohmann::json& doc) const {
    std::error_code ec;
    std::filesystem::create_directories(path_.parent_path(), ec);

    const std::string content = doc.dump(2);
    const std::filesystem::path tmp = path_.string() + ".tmp." + std::to_string(::getpid());

    int fd = ::open(tmp.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (fd < 0) {
        throw std::runtime_error(errno_message("cannot create", tmp));
    }

    size_t written = 0;
    while (written < content.size()) {
        ssize_t n = ::write(fd, content.data() + written, content.size() - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            std::string msg = errno_message("write failed for", tmp);
            ::close(fd);
            ::unlink(tmp.c_str());
            throw std::runtime_error(msg);
        }
        written += static_cast<size_t>(n);
    }

    if (::fsync(fd) != 0) {
        std::string msg = errno_message("fsync failed for", tmp);
        ::close(fd);
        ::unlink(tmp.c_str());
        throw std::runtime_error(msg);
    }
    ::close(fd);

    if (::rename(tmp.c_str(), path_.c_str()) != 0) {
        std::string msg = errno_message("rename failed for", tmp);
        ::unlink(tmp.c_str());
        throw std::runtime_error(msg);
    }
}

} // namespace hookstack::state
