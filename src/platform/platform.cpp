#include "cpull/platform.hpp"

#include <atomic>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iterator>

#include <fcntl.h>
#include <unistd.h>

namespace cpull {

namespace fs = std::filesystem;

namespace {

// Closes the descriptor it owns
class FileDescriptor {
public:
    explicit FileDescriptor(int fd) : fd_(fd) {}
    ~FileDescriptor() { reset(); }

    FileDescriptor(const FileDescriptor&) = delete;
    FileDescriptor& operator=(const FileDescriptor&) = delete;

    int get() const { return fd_; }
    bool valid() const { return fd_ >= 0; }

    bool reset() {
        if (fd_ < 0) return true;
        int rc = ::close(fd_);
        fd_ = -1;
        return rc == 0;
    }

private:
    int fd_;
};

std::string errno_message(const std::string& what) {
    return what + ": " + std::strerror(errno);
}

bool write_all(int fd, const std::string& content) {
    const char* data = content.data();
    size_t remaining = content.size();
    while (remaining > 0) {
        ssize_t n = ::write(fd, data, remaining);
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        data += n;
        remaining -= static_cast<size_t>(n);
    }
    return true;
}

std::string temp_sibling(const std::string& path) {
    static std::atomic<unsigned> counter{0};
    return path + ".tmp." + std::to_string(::getpid()) + "." + std::to_string(counter++);
}

} // namespace

AtomicWriteResult atomic_write_file(const std::string& path, const std::string& content) {
    AtomicWriteResult result;
    const std::string temp_path = temp_sibling(path);

    FileDescriptor file(::open(temp_path.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0644));
    if (!file.valid()) {
        result.error = errno_message("cannot create " + temp_path);
        return result;
    }

    if (!write_all(file.get(), content)) {
        result.error = errno_message("cannot write " + temp_path);
    } else if (::fsync(file.get()) != 0) {
        result.error = errno_message("cannot sync " + temp_path);
    } else if (!file.reset()) {
        result.error = errno_message("cannot close " + temp_path);
    } else if (std::rename(temp_path.c_str(), path.c_str()) != 0) {
        result.error = errno_message("cannot replace " + path);
    }

    if (!result.error.empty()) {
        ::unlink(temp_path.c_str());
        return result;
    }

    // Persist the rename itself; the new content is already in place either way
    std::string dir = get_parent_directory(path);
    FileDescriptor dir_fd(::open(dir.empty() ? "." : dir.c_str(), O_RDONLY | O_CLOEXEC));
    if (dir_fd.valid()) {
        ::fsync(dir_fd.get());
    }

    result.ok = true;
    return result;
}

std::string get_parent_directory(const std::string& path) {
    return fs::path(path).parent_path().string();
}

std::string get_filename(const std::string& path) {
    return fs::path(path).filename().string();
}

std::string join_path(const std::string& base, const std::string& rel) {
    return (fs::path(base) / rel).string();
}

std::string absolute_path(const std::string& path) {
    std::error_code ec;
    fs::path p = fs::absolute(path, ec);
    if (ec) p = path;

    std::string normalized = p.lexically_normal().string();
    if (normalized.size() > 1 && normalized.back() == '/') {
        normalized.pop_back();
    }
    return normalized;
}

bool is_directory(const std::string& path) {
    std::error_code ec;
    return fs::is_directory(path, ec);
}

bool is_regular_file(const std::string& path) {
    std::error_code ec;
    return fs::is_regular_file(path, ec);
}

std::optional<std::string> read_file(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return std::nullopt;
    }
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

bool create_directories(const std::string& path) {
    std::error_code ec;
    fs::create_directories(path, ec);
    return !ec;
}

bool remove_directory(const std::string& path) {
    std::error_code ec;
    fs::remove_all(path, ec);
    return !ec;
}

std::optional<std::string> get_env(const std::string& name) {
    const char* value = std::getenv(name.c_str());
    if (value == nullptr || *value == '\0') {
        return std::nullopt;
    }
    return std::string(value);
}

} // namespace cpull
