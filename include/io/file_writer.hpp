#pragma once

#include "io/fd.hpp"
#include "io/io.hpp"
#include "util/result.hpp"

#include <span>
#include <string>
#include <string_view>

namespace packsmith {

class FileWriter final : public IWriter {
  public:
    static Result Open(std::string path, FileWriter& out);

    Result WriteAll(std::span<const std::uint8_t> in) override;
    Result FsyncNow() override;
    Result Close();

    const std::string& Path() const { return path_; }

  private:
    std::string path_;
    Fd fd_;
};

// Writes "<path>.part" and renames it over <path> on Commit(). An
// uncommitted writer removes its temporary file when destroyed.
class AtomicFileWriter final : public IWriter {
  public:
    AtomicFileWriter() = default;
    AtomicFileWriter(const AtomicFileWriter&) = delete;
    AtomicFileWriter& operator=(const AtomicFileWriter&) = delete;
    ~AtomicFileWriter() override;

    static Result Open(std::string path, AtomicFileWriter& out);

    Result WriteAll(std::span<const std::uint8_t> in) override;
    Result FsyncNow() override;
    Result Commit();

  private:
    std::string path_;
    std::string tmp_path_;
    FileWriter tmp_;
    bool open_ = false;
};

Result WriteFileAtomic(const std::string& path, std::string_view content);

// mkdir -p of the directory that will hold path.
Result CreateParentDirs(const std::string& path);

} // namespace packsmith
