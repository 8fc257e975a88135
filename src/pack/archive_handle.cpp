#include "pack/archive_handle.hpp"

#include "io/file_reader.hpp"
#include "io/file_writer.hpp"
#include "pack/archive_path_policy.hpp"
#include "util/logger.hpp"
#include "util/path_utils.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <filesystem>
#include <set>
#include <sys/stat.h>

namespace packsmith {

namespace {

constexpr size_t kCopyBuffer = 64 * 1024;

Result WriteCurrentEntry(archive* ar, const std::string& dest) {
    auto res = CreateParentDirs(dest);
    if (!res.is_ok()) return res;

    AtomicFileWriter out;
    res = AtomicFileWriter::Open(dest, out);
    if (!res.is_ok()) return res;

    std::vector<std::uint8_t> buf(kCopyBuffer);
    while (true) {
        const la_ssize_t n = archive_read_data(ar, buf.data(), buf.size());
        if (n == 0) break;
        if (n < 0) return Result::Fail(ErrorKind::ArchiveCorrupt, "archive_read_data: " + ArchiveErr(ar));

        res = out.WriteAll(std::span<const std::uint8_t>(buf.data(), static_cast<size_t>(n)));
        if (!res.is_ok()) return res;
    }
    return out.Commit();
}

Result CreateDirectory(const std::string& dest) {
    std::error_code ec;
    std::filesystem::create_directories(dest, ec);
    if (ec) {
        return Result::Fail(ErrorKindFromErrno(ec.value()),
                            "Failed to create directory " + dest + ": " + ec.message(), ec.value());
    }
    return Result::Ok();
}

bool EndsWith(const std::string& s, std::string_view suffix) {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace

bool HasArchiveExtension(const std::string& filename) {
    std::string lower(filename);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    static constexpr std::string_view kExtensions[] = {
        ".zip", ".7z", ".tar", ".tgz", ".tar.gz", ".tar.xz", ".tar.bz2", ".rar",
    };
    for (auto ext : kExtensions) {
        if (EndsWith(lower, ext)) return true;
    }
    return false;
}

Result ArchiveHandle::OpenFile(const std::string& path, const std::string& name, ArchiveHandle& out) {
    struct stat st{};
    if (::stat(path.c_str(), &st) != 0) {
        const int e = errno;
        return Result::Fail(ErrorKindFromErrno(e), "Cannot open archive " + path, e);
    }
    if (!S_ISREG(st.st_mode)) {
        return Result::Fail(ErrorKind::Io, "Not a regular file: " + path);
    }

    out = ArchiveHandle{};
    out.file_path_ = path;
    out.name_ = name.empty() ? std::filesystem::path(path).filename().string() : name;
    return out.Scan();
}

Result ArchiveHandle::OpenMemory(std::string bytes, const std::string& name, ArchiveHandle& out) {
    out = ArchiveHandle{};
    out.bytes_ = std::make_shared<const std::string>(std::move(bytes));
    out.name_ = name.empty() ? std::string("downloaded_file") : name;
    return out.Scan();
}

Result ArchiveHandle::OpenReader(std::unique_ptr<archive, ArchiveReadDeleter>& out) const {
    std::unique_ptr<archive, ArchiveReadDeleter> ar(archive_read_new());
    if (!ar) return Result::Fail(ErrorKind::Io, "archive_read_new failed");

    archive_read_support_filter_all(ar.get());
    archive_read_support_format_all(ar.get());

    const int rc = bytes_
        ? archive_read_open_memory(ar.get(), bytes_->data(), bytes_->size())
        : archive_read_open_filename(ar.get(), file_path_.c_str(), kCopyBuffer);
    if (rc != ARCHIVE_OK) {
        const std::string em = ArchiveErr(ar.get());
        out = std::move(ar);
        return Result::Fail(ErrorKind::ArchiveCorrupt, "archive_read_open: " + em);
    }

    out = std::move(ar);
    return Result::Ok();
}

Result ArchiveHandle::Scan() {
    entries_.clear();
    single_file_ = false;

    std::unique_ptr<archive, ArchiveReadDeleter> ar;
    auto open_res = OpenReader(ar);

    archive_entry* entry = nullptr;
    int hr = ARCHIVE_FATAL;
    if (open_res.is_ok()) {
        hr = archive_read_next_header(ar.get(), &entry);
    }

    if (hr != ARCHIVE_OK && hr != ARCHIVE_WARN && hr != ARCHIVE_EOF) {
        const std::string why = open_res.is_ok() ? ArchiveErr(ar.get()) : open_res.message();
        if (HasArchiveExtension(name_)) {
            return Result::Fail(ErrorKind::ArchiveCorrupt, "Cannot read archive " + name_ + ": " + why);
        }

        LogDebug("%s: not an archive (%s), using it as a single file", name_.c_str(), why.c_str());
        std::uint64_t size = 0;
        if (bytes_) {
            size = bytes_->size();
        } else {
            std::error_code ec;
            size = std::filesystem::file_size(file_path_, ec);
            if (ec) size = 0;
        }
        single_file_ = true;
        entries_.push_back(ArchiveEntry{name_, false, size});
        return Result::Ok();
    }

    std::set<std::string> dirs;
    auto add_dir = [&](const std::string& d) {
        if (dirs.insert(d).second) entries_.push_back(ArchiveEntry{d, true, 0});
    };
    auto add_parents = [&](const std::string& rel) {
        for (size_t pos = rel.find('/'); pos != std::string::npos; pos = rel.find('/', pos + 1)) {
            add_dir(rel.substr(0, pos));
        }
    };

    while (hr != ARCHIVE_EOF) {
        if (hr == ARCHIVE_WARN) {
            LogWarn("%s: %s", name_.c_str(), ArchiveErr(ar.get()).c_str());
        } else if (hr != ARCHIVE_OK) {
            return Result::Fail(ErrorKind::ArchiveCorrupt,
                                name_ + ": archive_read_next_header: " + ArchiveErr(ar.get()));
        }

        std::string rel;
        auto path_res = ArchivePathPolicy::NormalizeEntryPath(archive_entry_pathname(entry), rel);
        if (!path_res.is_ok()) {
            path_res.msg = name_ + ": " + path_res.msg;
            return path_res;
        }

        const char* hardlink = archive_entry_hardlink(entry);
        const auto type = archive_entry_filetype(entry);
        if (!rel.empty()) {
            if (type == AE_IFDIR) {
                add_parents(rel);
                add_dir(rel);
            } else if (type == AE_IFREG && !(hardlink && *hardlink)) {
                add_parents(rel);
                entries_.push_back(ArchiveEntry{rel, false, static_cast<std::uint64_t>(archive_entry_size(entry))});
            } else {
                LogWarn("%s: skipping special entry %s", name_.c_str(), rel.c_str());
            }
        }

        if (archive_read_data_skip(ar.get()) != ARCHIVE_OK) {
            return Result::Fail(ErrorKind::ArchiveCorrupt,
                                name_ + ": archive_read_data_skip: " + ArchiveErr(ar.get()));
        }
        hr = archive_read_next_header(ar.get(), &entry);
    }

    LogDebug("%s: %zu entries", name_.c_str(), entries_.size());
    return Result::Ok();
}

std::vector<ArchiveEntry> ArchiveHandle::Files() const {
    std::vector<ArchiveEntry> out;
    for (const auto& e : entries_) {
        if (!e.is_directory) out.push_back(e);
    }
    return out;
}

Result ArchiveHandle::ExtractSingle(const DestinationFn& dest_for, std::vector<std::string>& written) const {
    const ArchiveEntry& only = entries_.front();
    const std::string dest = dest_for(only);
    if (dest.empty()) return Result::Ok();

    auto res = CreateParentDirs(dest);
    if (!res.is_ok()) return res;

    AtomicFileWriter out;
    res = AtomicFileWriter::Open(dest, out);
    if (!res.is_ok()) return res;

    if (bytes_) {
        res = out.WriteAll(std::span<const std::uint8_t>(
            reinterpret_cast<const std::uint8_t*>(bytes_->data()), bytes_->size()));
        if (!res.is_ok()) return res;
    } else {
        FileReader in;
        res = FileReader::Open(file_path_, in);
        if (!res.is_ok()) return res;

        std::vector<std::uint8_t> buf(kCopyBuffer);
        while (true) {
            const ssize_t n = in.Read(std::span<std::uint8_t>(buf.data(), buf.size()));
            if (n == 0) break;
            if (n < 0) return Result::Fail(ErrorKind::Io, "Read failed: " + file_path_, errno);
            res = out.WriteAll(std::span<const std::uint8_t>(buf.data(), static_cast<size_t>(n)));
            if (!res.is_ok()) return res;
        }
    }

    res = out.Commit();
    if (!res.is_ok()) return res;
    written.push_back(dest);
    return Result::Ok();
}

Result ArchiveHandle::ExtractEach(const DestinationFn& dest_for, std::vector<std::string>& written) const {
    if (single_file_) return ExtractSingle(dest_for, written);

    std::unique_ptr<archive, ArchiveReadDeleter> ar;
    auto res = OpenReader(ar);
    if (!res.is_ok()) return res;

    archive_entry* entry = nullptr;
    while (true) {
        if (cancel_ && cancel_->load(std::memory_order_relaxed)) {
            return Result::Fail(ErrorKind::Cancelled, name_ + ": extraction cancelled");
        }

        const int r = archive_read_next_header(ar.get(), &entry);
        if (r == ARCHIVE_EOF) break;
        if (r != ARCHIVE_OK && r != ARCHIVE_WARN) {
            return Result::Fail(ErrorKind::ArchiveCorrupt,
                                name_ + ": archive_read_next_header: " + ArchiveErr(ar.get()));
        }

        ArchiveEntry e;
        res = ArchivePathPolicy::NormalizeEntryPath(archive_entry_pathname(entry), e.path);
        if (!res.is_ok()) return res;

        const char* hardlink = archive_entry_hardlink(entry);
        const auto type = archive_entry_filetype(entry);
        const bool is_file = type == AE_IFREG && !(hardlink && *hardlink);
        if (e.path.empty() || (!is_file && type != AE_IFDIR)) {
            (void)archive_read_data_skip(ar.get());
            continue;
        }
        e.is_directory = type == AE_IFDIR;
        e.size = static_cast<std::uint64_t>(archive_entry_size(entry));

        const std::string dest = dest_for(e);
        if (dest.empty()) {
            (void)archive_read_data_skip(ar.get());
            continue;
        }

        if (e.is_directory) {
            res = CreateDirectory(dest);
            if (!res.is_ok()) return res;
            continue;
        }

        LogDebug("%s: %s -> %s", name_.c_str(), e.path.c_str(), dest.c_str());
        res = WriteCurrentEntry(ar.get(), dest);
        if (!res.is_ok()) return res;
        written.push_back(dest);
    }

    return Result::Ok();
}

Result ArchiveHandle::Extract(const std::string& entry_path, const std::string& dest) const {
    const std::string want = NormalizeRelPath(entry_path);
    bool found = false;
    std::vector<std::string> written;

    auto res = ExtractEach(
        [&](const ArchiveEntry& e) -> std::string {
            if (e.is_directory || found || e.path != want) return {};
            found = true;
            return dest;
        },
        written);
    if (!res.is_ok()) return res;
    if (!found) return Result::Fail(ErrorKind::NotFound, name_ + ": no entry " + want);
    return Result::Ok();
}

Result ArchiveHandle::ReadEntry(const std::string& entry_path, std::string& out) const {
    const std::string want = NormalizeRelPath(entry_path);
    out.clear();

    if (single_file_) {
        if (want != name_) return Result::Fail(ErrorKind::NotFound, name_ + ": no entry " + want);
        if (bytes_) {
            out = *bytes_;
            return Result::Ok();
        }
        return ReadFileToString(file_path_, out);
    }

    std::unique_ptr<archive, ArchiveReadDeleter> ar;
    auto res = OpenReader(ar);
    if (!res.is_ok()) return res;

    archive_entry* entry = nullptr;
    while (true) {
        const int r = archive_read_next_header(ar.get(), &entry);
        if (r == ARCHIVE_EOF) break;
        if (r != ARCHIVE_OK && r != ARCHIVE_WARN) {
            return Result::Fail(ErrorKind::ArchiveCorrupt,
                                name_ + ": archive_read_next_header: " + ArchiveErr(ar.get()));
        }

        std::string rel;
        res = ArchivePathPolicy::NormalizeEntryPath(archive_entry_pathname(entry), rel);
        if (!res.is_ok()) return res;
        if (rel != want || archive_entry_filetype(entry) != AE_IFREG) {
            (void)archive_read_data_skip(ar.get());
            continue;
        }

        std::vector<char> buf(kCopyBuffer);
        while (true) {
            const la_ssize_t n = archive_read_data(ar.get(), buf.data(), buf.size());
            if (n == 0) break;
            if (n < 0) return Result::Fail(ErrorKind::ArchiveCorrupt, "archive_read_data: " + ArchiveErr(ar.get()));
            out.append(buf.data(), static_cast<size_t>(n));
        }
        return Result::Ok();
    }

    return Result::Fail(ErrorKind::NotFound, name_ + ": no entry " + want);
}

} // namespace packsmith
