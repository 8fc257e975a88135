#include "io/file_reader.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace packsmith {

Result FileReader::Open(std::string path, FileReader& out) {
    out.path_ = std::move(path);

    int fd = ::open(out.path_.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        const int e = errno;
        return Result::Fail(ErrorKindFromErrno(e),
                            "Failed to open input: " + out.path_ + " (" + std::strerror(e) + ")", e);
    }
    out.fd_.Reset(fd);

    struct stat st{};
    if (::fstat(fd, &st) == 0 && S_ISREG(st.st_mode)) {
        out.size_ = static_cast<std::uint64_t>(st.st_size);
    } else {
        out.size_ = std::nullopt;
    }

    return Result::Ok();
}

std::optional<std::uint64_t> FileReader::TotalSize() const { return size_; }

ssize_t FileReader::Read(std::span<std::uint8_t> out) {
    while (true) {
        ssize_t n = ::read(fd_.Get(), out.data(), out.size());
        if (n >= 0) {
            return n;
        }
        if (errno == EINTR) {
            continue;
        }
        return -1;
    }
}

Result ReadFileToString(const std::string& path, std::string& out) {
    FileReader reader;
    auto res = FileReader::Open(path, reader);
    if (!res.is_ok()) return res;

    out.clear();
    if (reader.TotalSize()) out.reserve(static_cast<size_t>(*reader.TotalSize()));

    std::uint8_t buf[64 * 1024];
    while (true) {
        const ssize_t n = reader.Read(std::span<std::uint8_t>(buf, sizeof(buf)));
        if (n == 0) break;
        if (n < 0) {
            const int e = errno;
            return Result::Fail(ErrorKindFromErrno(e),
                                "Read failed: " + path + " (" + std::strerror(e) + ")", e);
        }
        out.append(reinterpret_cast<const char*>(buf), static_cast<size_t>(n));
    }
    return Result::Ok();
}

} // namespace packsmith
