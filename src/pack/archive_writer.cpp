#include "pack/archive_writer.hpp"

#include "io/file_reader.hpp"
#include "pack/archive_common.hpp"
#include "util/logger.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <memory>
#include <vector>

namespace packsmith {

namespace {

struct PendingEntry {
    std::string rel;
    std::string abs;
    bool is_dir = false;
    std::uint64_t size = 0;
};

Result CollectEntries(const std::string& src_dir, std::vector<PendingEntry>& out) {
    namespace fs = std::filesystem;

    std::error_code ec;
    fs::recursive_directory_iterator it(src_dir, ec), end;
    if (ec) return Result::Fail(ErrorKindFromErrno(ec.value()), "Cannot read " + src_dir + ": " + ec.message());

    for (; it != end; it.increment(ec)) {
        if (ec) return Result::Fail(ErrorKindFromErrno(ec.value()), "Cannot read " + src_dir + ": " + ec.message());

        const auto st = it->symlink_status(ec);
        if (ec) return Result::Fail(ErrorKindFromErrno(ec.value()), "stat failed: " + it->path().string());

        PendingEntry e;
        e.abs = it->path().string();
        e.rel = fs::relative(it->path(), src_dir, ec).generic_string();
        if (ec) return Result::Fail(ErrorKind::Io, "Cannot relativise " + e.abs);

        if (fs::is_directory(st)) {
            e.is_dir = true;
        } else if (fs::is_regular_file(st)) {
            e.size = it->file_size(ec);
            if (ec) return Result::Fail(ErrorKindFromErrno(ec.value()), "stat failed: " + e.abs);
        } else {
            LogWarn("Not packing special file %s", e.abs.c_str());
            continue;
        }
        out.push_back(std::move(e));
    }

    std::sort(out.begin(), out.end(), [](const PendingEntry& a, const PendingEntry& b) { return a.rel < b.rel; });
    return Result::Ok();
}

Result WriteFileData(archive* aw, const PendingEntry& e) {
    FileReader in;
    auto res = FileReader::Open(e.abs, in);
    if (!res.is_ok()) return res;

    std::vector<std::uint8_t> buf(64 * 1024);
    while (true) {
        const ssize_t n = in.Read(std::span<std::uint8_t>(buf.data(), buf.size()));
        if (n == 0) break;
        if (n < 0) return Result::Fail(ErrorKind::Io, "Read failed: " + e.abs, errno);
        if (archive_write_data(aw, buf.data(), static_cast<size_t>(n)) < 0) {
            return Result::Fail(ErrorKind::Io, "archive_write_data: " + ArchiveErr(aw));
        }
    }
    return Result::Ok();
}

} // namespace

Result WriteZipFromDirectory(const std::string& src_dir, const std::string& out_path) {
    std::vector<PendingEntry> entries;
    auto res = CollectEntries(src_dir, entries);
    if (!res.is_ok()) return res;

    const std::string tmp_path = out_path + ".part";

    std::unique_ptr<archive, ArchiveWriteDeleter> aw(archive_write_new());
    if (!aw) return Result::Fail(ErrorKind::Io, "archive_write_new failed");

    archive_write_set_format_zip(aw.get());
    archive_write_zip_set_compression_deflate(aw.get());

    if (archive_write_open_filename(aw.get(), tmp_path.c_str()) != ARCHIVE_OK) {
        return Result::Fail(ErrorKind::Io, "archive_write_open_filename: " + ArchiveErr(aw.get()));
    }

    auto fail = [&](Result r) {
        (void)archive_write_close(aw.get());
        std::remove(tmp_path.c_str());
        return r;
    };

    for (const auto& e : entries) {
        std::unique_ptr<archive_entry, ArchiveEntryDeleter> ent(archive_entry_new());
        if (!ent) return fail(Result::Fail(ErrorKind::Io, "archive_entry_new failed"));

        const std::string name = e.is_dir ? e.rel + "/" : e.rel;
        archive_entry_set_pathname(ent.get(), name.c_str());
        archive_entry_set_filetype(ent.get(), e.is_dir ? AE_IFDIR : AE_IFREG);
        archive_entry_set_perm(ent.get(), e.is_dir ? 0755 : 0644);
        archive_entry_set_size(ent.get(), e.is_dir ? 0 : static_cast<la_int64_t>(e.size));

        if (archive_write_header(aw.get(), ent.get()) != ARCHIVE_OK) {
            return fail(Result::Fail(ErrorKind::Io, "archive_write_header: " + ArchiveErr(aw.get())));
        }
        if (!e.is_dir) {
            res = WriteFileData(aw.get(), e);
            if (!res.is_ok()) return fail(res);
        }
    }

    if (archive_write_close(aw.get()) != ARCHIVE_OK) {
        std::remove(tmp_path.c_str());
        return Result::Fail(ErrorKind::Io, "archive_write_close: " + ArchiveErr(aw.get()));
    }

    if (std::rename(tmp_path.c_str(), out_path.c_str()) != 0) {
        const int e = errno;
        std::remove(tmp_path.c_str());
        return Result::Fail(ErrorKindFromErrno(e), "rename failed: " + out_path + " (" + std::strerror(e) + ")", e);
    }

    LogInfo("Wrote %s (%zu entries)", out_path.c_str(), entries.size());
    return Result::Ok();
}

} // namespace packsmith
