#pragma once

#include "io/io.hpp"
#include "net/downloader.hpp"
#include "net/release_index.hpp"

#include <archive.h>
#include <archive_entry.h>
#include <algorithm>
#include <array>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <map>
#include <mutex>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <sys/stat.h>
#include <unistd.h>
#include <utility>
#include <vector>

namespace testutil {

class TemporaryDirectory {
  public:
    TemporaryDirectory() {
        char tpl[] = "/tmp/packsmith_tests_XXXXXX";
        char* p = ::mkdtemp(tpl);
        if (!p) {
            throw std::runtime_error("mkdtemp failed");
        }
        path_ = p;
    }

    ~TemporaryDirectory() {
        if (!path_.empty()) {
            std::string cmd = "rm -rf '" + path_ + "'";
            (void)::system(cmd.c_str());
        }
    }

    TemporaryDirectory(const TemporaryDirectory&) = delete;
    TemporaryDirectory& operator=(const TemporaryDirectory&) = delete;

    const std::string& Path() const { return path_; }

  private:
    std::string path_;
};

class MemoryReader final : public packsmith::IReader {
  public:
    explicit MemoryReader(std::string data) : data_(data.begin(), data.end()) {}

    explicit MemoryReader(std::vector<std::uint8_t> data) : data_(std::move(data)) {}

    ssize_t Read(std::span<std::uint8_t> out) override {
        if (pos_ >= data_.size())
            return 0;
        const size_t n = std::min(out.size(), data_.size() - pos_);
        std::copy(data_.begin() + static_cast<std::ptrdiff_t>(pos_),
                  data_.begin() + static_cast<std::ptrdiff_t>(pos_ + n),
                  out.begin());
        pos_ += n;
        return static_cast<ssize_t>(n);
    }

    std::optional<std::uint64_t> TotalSize() const override {
        return static_cast<std::uint64_t>(data_.size());
    }

  private:
    std::vector<std::uint8_t> data_;
    size_t pos_ = 0;
};

struct ArchiveFileEntry {
    std::string path;
    std::string contents;
    mode_t file_type = AE_IFREG;
};

namespace detail {

inline std::string BuildArchive(const std::vector<ArchiveFileEntry>& entries, bool zip) {
    std::vector<std::uint8_t> out(4 * 1024 * 1024);
    size_t used = 0;

    archive* a = archive_write_new();
    if (!a)
        throw std::runtime_error("archive_write_new failed");
    const int fmt = zip ? archive_write_set_format_zip(a) : archive_write_set_format_pax_restricted(a);
    if (fmt != ARCHIVE_OK) {
        (void)archive_write_free(a);
        throw std::runtime_error("archive_write_set_format failed");
    }
    if (archive_write_open_memory(a, out.data(), out.size(), &used) != ARCHIVE_OK) {
        (void)archive_write_free(a);
        throw std::runtime_error("archive_write_open_memory failed");
    }

    for (const auto& entry : entries) {
        archive_entry* hdr = archive_entry_new();
        if (!hdr) {
            (void)archive_write_free(a);
            throw std::runtime_error("archive_entry_new failed");
        }
        archive_entry_set_pathname(hdr, entry.path.c_str());
        archive_entry_set_filetype(hdr, entry.file_type);
        archive_entry_set_perm(hdr, entry.file_type == AE_IFDIR ? 0755 : 0644);
        archive_entry_set_size(hdr, static_cast<la_int64_t>(entry.contents.size()));
        if (archive_write_header(a, hdr) != ARCHIVE_OK) {
            archive_entry_free(hdr);
            (void)archive_write_free(a);
            throw std::runtime_error("archive_write_header failed");
        }
        if (!entry.contents.empty()) {
            if (archive_write_data(a, entry.contents.data(), entry.contents.size()) < 0) {
                archive_entry_free(hdr);
                (void)archive_write_free(a);
                throw std::runtime_error("archive_write_data failed");
            }
        }
        archive_entry_free(hdr);
    }

    if (archive_write_close(a) != ARCHIVE_OK) {
        (void)archive_write_free(a);
        throw std::runtime_error("archive_write_close failed");
    }
    if (archive_write_free(a) != ARCHIVE_OK) {
        throw std::runtime_error("archive_write_free failed");
    }
    return std::string(reinterpret_cast<const char*>(out.data()), used);
}

} // namespace detail

inline std::string BuildTar(const std::vector<ArchiveFileEntry>& entries) {
    return detail::BuildArchive(entries, false);
}

inline std::string BuildZip(const std::vector<ArchiveFileEntry>& entries) {
    return detail::BuildArchive(entries, true);
}

inline bool WriteTextFile(const std::string& path, const std::string& content) {
    std::error_code ec;
    std::filesystem::create_directories(std::filesystem::path(path).parent_path(), ec);
    std::ofstream os(path, std::ios::binary);
    if (!os.good()) {
        return false;
    }
    os << content;
    return os.good();
}

// Empty when the file cannot be opened.
inline std::string ReadFile(const std::string& path) {
    std::ifstream is(path, std::ios::binary);
    if (!is.good()) {
        return {};
    }
    return std::string((std::istreambuf_iterator<char>(is)), std::istreambuf_iterator<char>());
}

inline bool Exists(const std::string& path) {
    std::error_code ec;
    return std::filesystem::exists(std::filesystem::symlink_status(path, ec));
}

inline std::string ReadAll(packsmith::IReader& reader) {
    std::string out;
    std::array<std::uint8_t, 1024> buf{};
    while (true) {
        const ssize_t n = reader.Read(std::span<std::uint8_t>(buf.data(), buf.size()));
        if (n == 0)
            break;
        if (n < 0)
            return {};
        out.append(reinterpret_cast<const char*>(buf.data()), static_cast<size_t>(n));
    }
    return out;
}

// Serves canned bodies by URL; anything else fails as unreachable.
class FakeDownloader final : public packsmith::IDownloader {
  public:
    void Serve(const std::string& url, std::string body) {
        std::lock_guard<std::mutex> lk(mu_);
        bodies_[url] = std::move(body);
    }

    void Fail(const std::string& url, packsmith::Result failure) {
        std::lock_guard<std::mutex> lk(mu_);
        failures_[url] = std::move(failure);
    }

    packsmith::Result Fetch(const std::string& url,
                            const packsmith::FetchOptions&,
                            packsmith::IWriter& out) override {
        std::string body;
        {
            std::lock_guard<std::mutex> lk(mu_);
            requested_.push_back(url);
            auto f = failures_.find(url);
            if (f != failures_.end())
                return f->second;
            auto it = bodies_.find(url);
            if (it == bodies_.end())
                return packsmith::Result::Fail(packsmith::ErrorKind::SourceUnreachable, "no route to " + url);
            body = it->second;
        }
        auto res = out.WriteAll(std::span<const std::uint8_t>(
            reinterpret_cast<const std::uint8_t*>(body.data()), body.size()));
        if (!res.is_ok())
            return res;
        return out.FsyncNow();
    }

    std::vector<std::string> Requested() const {
        std::lock_guard<std::mutex> lk(mu_);
        return requested_;
    }

  private:
    mutable std::mutex mu_;
    std::map<std::string, std::string> bodies_;
    std::map<std::string, packsmith::Result> failures_;
    std::vector<std::string> requested_;
};

// Release listings keyed by "owner/repo"; unknown repos are unreachable.
class FakeReleaseIndex final : public packsmith::IReleaseIndex {
  public:
    void Set(const std::string& repo, std::vector<packsmith::Release> releases) {
        std::lock_guard<std::mutex> lk(mu_);
        releases_[repo] = std::move(releases);
    }

    void SetUnreachable(const std::string& repo) {
        std::lock_guard<std::mutex> lk(mu_);
        releases_.erase(repo);
    }

    packsmith::Result ListReleases(const std::string& owner,
                                   const std::string& repo,
                                   unsigned per_page,
                                   std::vector<packsmith::Release>& out) override {
        std::lock_guard<std::mutex> lk(mu_);
        last_per_page_ = per_page;
        auto it = releases_.find(owner + "/" + repo);
        if (it == releases_.end())
            return packsmith::Result::Fail(packsmith::ErrorKind::SourceUnreachable,
                                           owner + "/" + repo + ": unreachable");
        out = it->second;
        if (out.size() > per_page)
            out.resize(per_page);
        return packsmith::Result::Ok();
    }

    unsigned LastPerPage() const {
        std::lock_guard<std::mutex> lk(mu_);
        return last_per_page_;
    }

  private:
    mutable std::mutex mu_;
    std::map<std::string, std::vector<packsmith::Release>> releases_;
    unsigned last_per_page_ = 0;
};

} // namespace testutil
