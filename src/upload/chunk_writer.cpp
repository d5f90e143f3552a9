#include "nexus/upload/chunk_writer.hpp"

#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace nexus::upload {
namespace fs = std::filesystem;

namespace {

// Closes the descriptor on scope exit.
class FileDescriptor {
public:
    explicit FileDescriptor(int fd) : fd_(fd) {}
    ~FileDescriptor() {
        if (fd_ >= 0) {
            ::close(fd_);
        }
    }
    FileDescriptor(const FileDescriptor&) = delete;
    FileDescriptor& operator=(const FileDescriptor&) = delete;

    int get() const { return fd_; }
    bool valid() const { return fd_ >= 0; }

private:
    int fd_;
};

Error io_error(const std::string& what, const fs::path& path) {
    return Error{ErrorCode::StorageFailure, what + " " + path.string() + ": " + std::strerror(errno)};
}

} // namespace

ChunkWriter::ChunkWriter(fs::path temp_root) : temp_root_(std::move(temp_root)) {
    std::error_code ec;
    fs::create_directories(temp_root_, ec);
    if (ec) {
        spdlog::error("Cannot create upload temp directory {}: {}", temp_root_.string(), ec.message());
    }
}

fs::path ChunkWriter::path_for(const std::string& id) const {
    return temp_root_ / id;
}

Result<void, Error> ChunkWriter::create(const std::string& id) {
    const auto path = path_for(id);
    FileDescriptor fd(::open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644));
    if (!fd.valid()) {
        return Err<void, Error>(io_error("create", path));
    }
    return Done();
}

Result<std::uint64_t, Error> ChunkWriter::physical_size(const std::string& id) const {
    const auto path = path_for(id);
    struct stat st {};
    if (::stat(path.c_str(), &st) != 0) {
        if (errno == ENOENT) {
            return Fail<std::uint64_t>(ErrorCode::NotFound, "backing file missing: " + path.string());
        }
        return Err<std::uint64_t, Error>(io_error("stat", path));
    }
    return Ok<std::uint64_t, Error>(static_cast<std::uint64_t>(st.st_size));
}

Result<void, Error> ChunkWriter::reconcile_length(const UploadSession& session) {
    const auto size = physical_size(session.id);
    if (size.is_error()) {
        if (size.error().code == ErrorCode::NotFound && session.offset == 0) {
            return create(session.id);
        }
        return Fail<void>(ErrorCode::StorageFailure, size.error().message);
    }

    if (size.value() == session.offset) {
        return Done();
    }
    if (size.value() < session.offset) {
        return Fail<void>(ErrorCode::StorageFailure,
                          "backing file of " + session.id + " holds " + std::to_string(size.value()) +
                          " bytes, expected " + std::to_string(session.offset));
    }

    spdlog::warn("Upload {}: discarding {} unconfirmed bytes past offset {}",
                 session.id, size.value() - session.offset, session.offset);
    const auto path = path_for(session.id);
    if (::truncate(path.c_str(), static_cast<off_t>(session.offset)) != 0) {
        return Err<void, Error>(io_error("truncate", path));
    }
    return Done();
}

Result<std::uint64_t, Error> ChunkWriter::append(const UploadSession& session, const char* data, std::size_t len) {
    if (session.offset > session.size || len > session.size - session.offset) {
        return Fail<std::uint64_t>(ErrorCode::Validation,
                                   "chunk of " + std::to_string(len) + " bytes at offset " +
                                   std::to_string(session.offset) + " exceeds declared size " +
                                   std::to_string(session.size));
    }

    if (auto checked = reconcile_length(session); checked.is_error()) {
        return Err<std::uint64_t, Error>(checked.error());
    }
    if (len == 0) {
        return Ok<std::uint64_t, Error>(session.offset);
    }

    const auto path = path_for(session.id);
    FileDescriptor fd(::open(path.c_str(), O_WRONLY | O_CLOEXEC));
    if (!fd.valid()) {
        return Err<std::uint64_t, Error>(io_error("open", path));
    }

    std::size_t written = 0;
    while (written < len) {
        const ssize_t n = ::pwrite(fd.get(), data + written, len - written,
                                   static_cast<off_t>(session.offset + written));
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            break;
        }
        written += static_cast<std::size_t>(n);
    }

    if (written != len || ::fdatasync(fd.get()) != 0) {
        auto error = io_error("write", path);
        if (::ftruncate(fd.get(), static_cast<off_t>(session.offset)) != 0) {
            spdlog::error("Upload {}: could not cut back to offset {}: {}",
                          session.id, session.offset, std::strerror(errno));
        }
        return Err<std::uint64_t, Error>(std::move(error));
    }

    return Ok<std::uint64_t, Error>(session.offset + len);
}

Result<void, Error> ChunkWriter::remove(const std::string& id) {
    std::error_code ec;
    fs::remove(path_for(id), ec);
    if (ec) {
        return Fail<void>(ErrorCode::StorageFailure, "remove " + path_for(id).string() + ": " + ec.message());
    }
    return Done();
}

} // namespace nexus::upload
