// ============================================================================
// atomic_file.cpp — implementation for atomic_file.hpp
// ============================================================================

#include "netroster/atomic_file.hpp"

#include <cerrno>
#include <cstdlib>         // mkstemp
#include <cstring>         // strerror
#include <fstream>
#include <sstream>
#include <system_error>
#include <vector>

#include <fcntl.h>         // open
#include <sys/file.h>      // flock
#include <unistd.h>        // write, fsync, close

namespace fs = std::filesystem;

namespace netroster {

static std::string errno_text(const std::string& what) {
    return what + ": " + std::strerror(errno);
}

static bool write_all(int fd, const std::string& content) {
    const char* p = content.data();
    size_t left = content.size();
    while (left > 0) {
        ssize_t n = ::write(fd, p, left);
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        p += n;
        left -= static_cast<size_t>(n);
    }
    return true;
}

static void fsync_dir(const fs::path& dir) {
    int fd = ::open(dir.empty() ? "." : dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
    if (fd < 0) return;              // some filesystems refuse; the rename already happened
    ::fsync(fd);
    ::close(fd);
}

bool write_temp(const fs::path& target, const std::string& content, fs::path& tmp_out, std::string& err) {
    fs::path dir = target.parent_path();
    std::string templ = (dir / ".tmp-XXXXXX").string();
    std::vector<char> buf(templ.begin(), templ.end());
    buf.push_back('\0');

    int fd = ::mkstemp(buf.data());
    if (fd < 0) { err = errno_text("create temp file in " + dir.string()); return false; }
    fs::path tmp(buf.data());

    if (!write_all(fd, content)) {
        err = errno_text("write " + tmp.string());
        ::close(fd); ::unlink(tmp.c_str());
        return false;
    }
    if (::fsync(fd) != 0) {
        err = errno_text("fsync " + tmp.string());
        ::close(fd); ::unlink(tmp.c_str());
        return false;
    }
    if (::close(fd) != 0) {
        err = errno_text("close " + tmp.string());
        ::unlink(tmp.c_str());
        return false;
    }
    tmp_out = tmp;
    return true;
}

bool commit_temp(const fs::path& tmp, const fs::path& target, std::string& err) {
    if (::rename(tmp.c_str(), target.c_str()) != 0) {
        err = errno_text("rename " + tmp.string() + " -> " + target.string());
        ::unlink(tmp.c_str());
        return false;
    }
    fsync_dir(target.parent_path());
    return true;
}

bool atomic_write(const fs::path& target, const std::string& content, std::string& err) {
    std::error_code ec;
    if (!target.parent_path().empty()) {
        fs::create_directories(target.parent_path(), ec);
        if (ec) { err = "create " + target.parent_path().string() + ": " + ec.message(); return false; }
    }
    fs::path tmp;
    if (!write_temp(target, content, tmp, err)) return false;
    return commit_temp(tmp, target, err);
}

bool read_file(const fs::path& path, std::string& out, std::string& err) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        err = (errno == ENOENT ? "missing " : "cannot open ") + path.string();
        return false;
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    if (in.bad()) { err = "read " + path.string() + " failed"; return false; }
    out = ss.str();
    return true;
}

FileLock::FileLock(FileLock&& other) noexcept : fd_(other.fd_) { other.fd_ = -1; }

FileLock& FileLock::operator=(FileLock&& other) noexcept {
    if (this != &other) {
        release();
        fd_ = other.fd_;
        other.fd_ = -1;
    }
    return *this;
}

bool FileLock::acquire(const fs::path& path, std::string& err) {
    release();
    int fd = ::open(path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
    if (fd < 0) { err = errno_text("open lock file " + path.string()); return false; }
    while (::flock(fd, LOCK_EX) != 0) {
        if (errno == EINTR) continue;
        err = errno_text("lock " + path.string());
        ::close(fd);
        return false;
    }
    fd_ = fd;
    return true;
}

void FileLock::release() {
    if (fd_ < 0) return;
    ::flock(fd_, LOCK_UN);
    ::close(fd_);
    fd_ = -1;
}

} // namespace netroster
