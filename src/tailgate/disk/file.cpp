// Copyright (c) 2026 changcheng967. All rights reserved.

#include <tailgate/disk/file.hpp>
#include <cerrno>
#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>
#include <utility>

namespace tailgate::disk {

std::error_code errno_to_error_code(int err) noexcept {
    switch (err) {
        case ENOENT:                   return make_error_code(DiskErrc::file_not_found);
        case EACCES:
        case EPERM:
        case EROFS:                    return make_error_code(DiskErrc::access_denied);
        case ENOSPC:
        case EDQUOT:
        case EFBIG:                    return make_error_code(DiskErrc::disk_full);
        case ENAMETOOLONG:
        case ENOTDIR:
        case EISDIR:
        case ELOOP:                    return make_error_code(DiskErrc::invalid_path);
        case EEXIST:                   return make_error_code(DiskErrc::file_exists);
        case EBADF:                    return make_error_code(DiskErrc::handle_invalid);
        case ESPIPE:
        case EOVERFLOW:                return make_error_code(DiskErrc::seek_error);
        default:                       return make_error_code(DiskErrc::write_error);
    }
}

//=============================================================================
// File
//=============================================================================

std::expected<File, std::error_code>
File::open(std::string_view path, OpenMode mode) noexcept {
    if (path.empty()) {
        return std::unexpected(make_error_code(DiskErrc::invalid_path));
    }

    File file;
    try {
        file.path_ = path;
    } catch (...) {
        return std::unexpected(make_error_code(DiskErrc::invalid_path));
    }

    int flags = O_CLOEXEC;
    if (mode == OpenMode::read_write_create) {
        flags |= O_RDWR | O_CREAT;
    } else {
        flags |= O_RDONLY;
    }

    int fd = -1;
    do {
        fd = ::open(file.path_.c_str(), flags, 0644);
    } while (fd < 0 && errno == EINTR);

    if (fd < 0) {
        return std::unexpected(errno_to_error_code(errno));
    }

    file.fd_ = fd;
    return file;
}

File::~File() {
    close();
}

File::File(File&& other) noexcept
    : fd_(other.fd_)
    , path_(std::move(other.path_)) {
    other.fd_ = -1;
}

File& File::operator=(File&& other) noexcept {
    if (this != &other) {
        close();
        fd_ = other.fd_;
        path_ = std::move(other.path_);
        other.fd_ = -1;
    }
    return *this;
}

std::expected<std::uint64_t, std::error_code> File::size() const noexcept {
    if (fd_ < 0) {
        return std::unexpected(make_error_code(DiskErrc::handle_invalid));
    }

    struct stat st {};
    if (::fstat(fd_, &st) != 0) {
        return std::unexpected(errno_to_error_code(errno));
    }
    return static_cast<std::uint64_t>(st.st_size);
}

std::error_code File::set_len(std::uint64_t length) noexcept {
    if (fd_ < 0) {
        return make_error_code(DiskErrc::handle_invalid);
    }

    int rc = 0;
    do {
        rc = ::ftruncate(fd_, static_cast<off_t>(length));
    } while (rc != 0 && errno == EINTR);

    return rc == 0 ? std::error_code{} : errno_to_error_code(errno);
}

std::error_code File::write(std::uint64_t offset, const void* data, std::size_t size) noexcept {
    if (fd_ < 0) {
        return make_error_code(DiskErrc::handle_invalid);
    }

    const auto* src = static_cast<const unsigned char*>(data);
    std::size_t written = 0;

    // pwrite may return short counts; loop until everything is on disk
    while (written < size) {
        ssize_t n = ::pwrite(fd_, src + written, size - written,
                             static_cast<off_t>(offset + written));
        if (n < 0) {
            if (errno == EINTR) continue;
            return errno_to_error_code(errno);
        }
        if (n == 0) {
            return make_error_code(DiskErrc::write_error);
        }
        written += static_cast<std::size_t>(n);
    }

    return {};
}

std::error_code File::read(std::uint64_t offset, void* buffer, std::size_t size) const noexcept {
    if (fd_ < 0) {
        return make_error_code(DiskErrc::handle_invalid);
    }

    auto* dst = static_cast<unsigned char*>(buffer);
    std::size_t total = 0;

    while (total < size) {
        ssize_t n = ::pread(fd_, dst + total, size - total,
                            static_cast<off_t>(offset + total));
        if (n < 0) {
            if (errno == EINTR) continue;
            int err = errno;
            return err == EBADF ? make_error_code(DiskErrc::handle_invalid)
                                : make_error_code(DiskErrc::read_error);
        }
        if (n == 0) {
            return make_error_code(DiskErrc::short_read);
        }
        total += static_cast<std::size_t>(n);
    }

    return {};
}

std::expected<std::size_t, std::error_code> File::read_some(void* buffer, std::size_t size) noexcept {
    if (fd_ < 0) {
        return std::unexpected(make_error_code(DiskErrc::handle_invalid));
    }

    ssize_t n = 0;
    do {
        n = ::read(fd_, buffer, size);
    } while (n < 0 && errno == EINTR);

    if (n < 0) {
        return std::unexpected(make_error_code(DiskErrc::read_error));
    }
    return static_cast<std::size_t>(n);
}

std::error_code File::seek(std::uint64_t position) noexcept {
    if (fd_ < 0) {
        return make_error_code(DiskErrc::handle_invalid);
    }

    if (::lseek(fd_, static_cast<off_t>(position), SEEK_SET) < 0) {
        return make_error_code(DiskErrc::seek_error);
    }
    return {};
}

std::error_code File::flush() noexcept {
    if (fd_ < 0) {
        return make_error_code(DiskErrc::handle_invalid);
    }
    return ::fsync(fd_) == 0 ? std::error_code{} : errno_to_error_code(errno);
}

void File::close() noexcept {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

} // namespace tailgate::disk
