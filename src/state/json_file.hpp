#pragma once
#include <chrono>
#include <filesystem>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <nlohmann/json.hpp>

namespace hookstack::state {

// Persisted content could not be parsed. Stores recover from it locally.
class PersistenceError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// The sidecar lock could not be acquired within the configured timeout.
class LockTimeout : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// RAII advisory lock (flock) on a sidecar lock file. Never blocks longer
// than `timeout`.
class FileLock {
public:
    enum class Mode { SHARED, EXCLUSIVE };

    FileLock(const std::filesystem::path& lock_path, Mode mode,
             std::chrono::milliseconds timeout);
    ~FileLock();

    FileLock(const FileLock&) = delete;
    FileLock& operator=(const FileLock&) = delete;

private:
    int fd_ = -1;
};

struct UpdateResult {
    bool written = false;
    bool recovered = false;  // previous content was corrupt and discarded
};

// A JSON document on disk. Every mutation runs under an exclusive lock on
// `<path>.lock` and is written to a temporary file, fsynced and renamed over
// the target, so readers never observe a partial document.
class JsonFile {
public:
    // Receives the current document (an empty object if the file is missing
    // or corrupt). Returns true if the document should be written back.
    // A nlohmann::json::exception thrown by the mutator marks the document
    // corrupt: the mutator runs again on an empty object and the result is
    // written. Mutators must therefore reset any captured output first.
    using Mutator = std::function<bool(nlohmann::json& doc)>;

    explicit JsonFile(std::filesystem::path path,
                      std::chrono::milliseconds lock_timeout = std::chrono::milliseconds(2000));

    // nullopt if the file does not exist. Throws PersistenceError if the
    // content is not a JSON object.
    std::optional<nlohmann::json> read() const;

    UpdateResult update(const Mutator& mutate);

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
    std::filesystem::path lock_path_;
    std::chrono::milliseconds lock_timeout_;

    std::optional<nlohmann::json> read_unlocked() const;
    void write_unlocked(const nlohmann::json& doc) const;
};

} // namespace hookstack::state
