#include "io/file_writer.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <unistd.h>

namespace packsmith {

namespace {

Result ErrnoFail(const std::string& what, int e) {
    return Result::Fail(ErrorKindFromErrno(e), what + " (" + std::strerror(e) + ")", e);
}

} // namespace

Result FileWriter::Open(std::string path, FileWriter& out) {
    out.path_ = std::move(path);

    int fd = ::open(out.path_.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (fd < 0) {
        return ErrnoFail("Failed to open output: " + out.path_, errno);
    }
    out.fd_.Reset(fd);
    return Result::Ok();
}

Result FileWriter::WriteAll(std::span<const std::uint8_t> in) {
    size_t rem = in.size();
    const std::uint8_t* p = in.data();

    while (rem > 0) {
        ssize_t n = ::write(fd_.Get(), p, rem);
        if (n > 0) {
            p += static_cast<size_t>(n);
            rem -= static_cast<size_t>(n);
            continue;
        }
        if (n == -1 && errno == EINTR) {
            continue;
        }
        return ErrnoFail("Write failed: " + path_, errno);
    }

    return Result::Ok();
}

Result FileWriter::FsyncNow() {
    if (::fsync(fd_.Get()) == -1) {
        return ErrnoFail("fsync failed: " + path_, errno);
    }
    return Result::Ok();
}

Result FileWriter::Close() {
    if (fd_.Valid() && fd_.Close() != 0) {
        return ErrnoFail("close failed: " + path_, errno);
    }
    return Result::Ok();
}

AtomicFileWriter::~AtomicFileWriter() {
    if (open_) {
        (void)tmp_.Close();
        ::unlink(tmp_path_.c_str());
    }
}

Result AtomicFileWriter::Open(std::string path, AtomicFileWriter& out) {
    out.path_ = std::move(path);
    out.tmp_path_ = out.path_ + ".part";
    auto res = FileWriter::Open(out.tmp_path_, out.tmp_);
    if (!res.is_ok()) return res;
    out.open_ = true;
    return Result::Ok();
}

Result AtomicFileWriter::WriteAll(std::span<const std::uint8_t> in) {
    return tmp_.WriteAll(in);
}

Result AtomicFileWriter::FsyncNow() {
    return tmp_.FsyncNow();
}

Result AtomicFileWriter::Commit() {
    if (!open_) return Result::Fail(ErrorKind::Io, "Commit on a writer that is not open: " + path_);

    auto res = tmp_.FsyncNow();
    if (res.is_ok()) res = tmp_.Close();
    if (!res.is_ok()) return res;

    if (::rename(tmp_path_.c_str(), path_.c_str()) != 0) {
        return ErrnoFail("Atomic rename failed: " + path_, errno);
    }
    open_ = false;
    return Result::Ok();
}

Result WriteFileAtomic(const std::string& path, std::string_view content) {
    AtomicFileWriter writer;
    auto res = AtomicFileWriter::Open(path, writer);
    if (!res.is_ok()) return res;

    res = writer.WriteAll(std::span<const std::uint8_t>(
        reinterpret_cast<const std::uint8_t*>(content.data()), content.size()));
    if (!res.is_ok()) return res;

    return writer.Commit();
}

Result CreateParentDirs(const std::string& path) {
    namespace fs = std::filesystem;
    const fs::path parent = fs::path(path).parent_path();
    if (parent.empty()) return Result::Ok();

    std::error_code ec;
    fs::create_directories(parent, ec);
    if (ec) {
        return Result::Fail(ErrorKindFromErrno(ec.value()),
                            "Failed to create directory " + parent.string() + ": " + ec.message(),
                            ec.value());
    }
    return Result::Ok();
}

} // namespace packsmith
