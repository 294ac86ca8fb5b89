#pragma once

#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>
#include "../byte_source.hpp"

namespace cogstream {

/// Local file byte source using pread, safe for concurrent read_range() calls.
/// Mostly useful to run the reader against files on disk or a mounted bucket.
class FileSource {
private:
    int fd_{-1};
    uint64_t size_{0};
    std::string path_;

public:
    using ReadViewType = OwnedReadView;

    FileSource() noexcept = default;

    ~FileSource() noexcept {
        close();
    }

    FileSource(const FileSource&) = delete;
    FileSource& operator=(const FileSource&) = delete;

    FileSource(FileSource&& other) noexcept
        : fd_(other.fd_)
        , size_(other.size_)
        , path_(std::move(other.path_)) {
        other.fd_ = -1;
        other.size_ = 0;
    }

    FileSource& operator=(FileSource&& other) noexcept {
        if (this != &other) {
            close();
            fd_ = other.fd_;
            size_ = other.size_;
            path_ = std::move(other.path_);
            other.fd_ = -1;
            other.size_ = 0;
        }
        return *this;
    }

    [[nodiscard]] static Result<FileSource> open(std::string_view path) noexcept {
        FileSource source;
        source.path_ = path;
        source.fd_ = ::open(source.path_.c_str(), O_RDONLY);
        if (source.fd_ < 0) {
            return Err(Error::Code::Transport,
                       "Failed to open file " + source.path_ + ": " + std::strerror(errno));
        }

        struct stat st;
        if (::fstat(source.fd_, &st) != 0) {
            return Err(Error::Code::Transport, "Failed to get file size: " + source.path_);
        }
        source.size_ = static_cast<uint64_t>(st.st_size);
        return Ok(std::move(source));
    }

    void close() noexcept {
        if (fd_ >= 0) {
            ::close(fd_);
            fd_ = -1;
            size_ = 0;
        }
    }

    [[nodiscard]] bool is_open() const noexcept { return fd_ >= 0; }
    [[nodiscard]] const std::string& path() const noexcept { return path_; }

    [[nodiscard]] Result<ReadViewType> read_range(uint64_t offset, uint64_t length) const noexcept {
        if (!is_open()) [[unlikely]] {
            return Err(Error::Code::Transport, "File not open");
        }
        if (!range_within(offset, length, size_)) [[unlikely]] {
            return Err(Error::Code::Transport,
                       "Range [" + std::to_string(offset) + ", +" + std::to_string(length) +
                       ") beyond end of " + path_);
        }

        const auto bytes_to_read = static_cast<std::size_t>(length);
        auto buffer = std::shared_ptr<std::byte[]>(new std::byte[bytes_to_read]);

        std::size_t done = 0;
        while (done < bytes_to_read) {
            ssize_t n = ::pread(fd_, buffer.get() + done, bytes_to_read - done,
                                static_cast<off_t>(offset + done));
            if (n < 0) {
                if (errno == EINTR) {
                    continue;
                }
                return Err(Error::Code::Transport, "pread failed: " + std::string(std::strerror(errno)));
            }
            if (n == 0) {
                return Err(Error::Code::Transport, "Unexpected end of file in " + path_);
            }
            done += static_cast<std::size_t>(n);
        }

        return Ok(OwnedReadView(std::span<const std::byte>(buffer.get(), bytes_to_read), buffer));
    }

    [[nodiscard]] Result<uint64_t> length() const noexcept {
        if (!is_open()) [[unlikely]] {
            return Err(Error::Code::Transport, "File not open");
        }
        return Ok(size_);
    }
};

static_assert(ByteSource<FileSource>, "FileSource must satisfy ByteSource concept");

} // namespace cogstream
