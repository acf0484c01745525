#pragma once
/**
 * @file atomic_file.hpp
 * @brief Crash-safe whole-file replacement (temp + fsync + rename + dir fsync).
 *
 * atomic_write() is write_temp() followed by commit_temp(). The two halves are
 * public so a test can stop after the first one and check that the target
 * still holds its previous content, as it would after a crash.
 *
 * FileLock serializes writers across processes sharing a data directory.
 */

#include <filesystem>
#include <string>

namespace netroster {

/**
 * @brief Write @p content to a fresh ".tmp-XXXXXX" file next to @p target and fsync it.
 * @param tmp_out path of the temp file on success
 * @return false with @p err set; no temp file is left behind on failure.
 */
bool write_temp(const std::filesystem::path& target, const std::string& content,
                std::filesystem::path& tmp_out, std::string& err);

/** @brief rename(@p tmp, @p target) then fsync the directory. Removes @p tmp on failure. */
bool commit_temp(const std::filesystem::path& tmp, const std::filesystem::path& target, std::string& err);

/** @brief Create the parent directory if needed, then write_temp() + commit_temp(). */
bool atomic_write(const std::filesystem::path& target, const std::string& content, std::string& err);

/**
 * @brief Whole file into @p out.
 * @return false if the file is missing or unreadable (@p err says which).
 */
bool read_file(const std::filesystem::path& path, std::string& out, std::string& err);

/**
 * @class FileLock
 * @brief Exclusive flock(2) on a lock file, held until release() or destruction.
 *
 * Advisory only: it serializes processes that all take it (every netroster
 * mutation does) and nothing else. acquire() blocks until the lock is free.
 * flock locks belong to the open file description, so two FileLocks in one
 * process exclude each other as well.
 */
class FileLock {
public:
    FileLock() = default;
    ~FileLock() { release(); }
    FileLock(const FileLock&) = delete;
    FileLock& operator=(const FileLock&) = delete;
    FileLock(FileLock&& other) noexcept;
    FileLock& operator=(FileLock&& other) noexcept;

    /** Create @p path if needed and lock it. */
    bool acquire(const std::filesystem::path& path, std::string& err);
    void release();
    bool held() const { return fd_ >= 0; }

private:
    int fd_{-1};
};

} // namespace netroster
