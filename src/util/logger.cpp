#include "util/logger.hpp"
#include "pack/progress_sinks.hpp"
#include "util/time_utils.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <cstdio>
#include <mutex>
#include <string>

namespace packsmith {

namespace {

std::mutex g_write_mu;
std::atomic<int> g_level{static_cast<int>(LogLevel::Info)};

// Fixed width so messages line up.
std::string_view LevelTag(LogLevel lvl) {
    switch (lvl) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO ";
        case LogLevel::Warn:  return "WARN ";
        case LogLevel::Error: return "ERROR";
        default:              return "?    ";
    }
}

std::string_view SourceFileName(const char* file) {
    if (file == nullptr) return {};
    std::string_view path(file);
    const auto slash = path.find_last_of('/');
    return slash == std::string_view::npos ? path : path.substr(slash + 1);
}

std::string Lowercase(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

} // namespace

std::optional<LogLevel> ParseLogLevel(std::string_view s) {
    const std::string v = Lowercase(s);
    if (v == "debug") return LogLevel::Debug;
    if (v == "info") return LogLevel::Info;
    if (v == "warn" || v == "warning") return LogLevel::Warn;
    if (v == "error") return LogLevel::Error;
    if (v == "none") return LogLevel::None;
    return std::nullopt;
}

Logger& Logger::Instance() {
    static Logger inst;
    return inst;
}

void Logger::SetLevel(LogLevel lvl) {
    g_level.store(static_cast<int>(lvl), std::memory_order_relaxed);
}

bool Logger::Enabled(LogLevel lvl) const {
    return lvl != LogLevel::None &&
           static_cast<int>(lvl) >= g_level.load(std::memory_order_relaxed);
}

void Logger::Write(LogLevel lvl, const char* file, int line, const char* fmt, ...) {
    if (!Enabled(lvl)) return;
    va_list ap;
    va_start(ap, fmt);
    WriteV(lvl, file, line, fmt, ap);
    va_end(ap);
}

void Logger::WriteV(LogLevel lvl, const char* file, int line, const char* fmt, va_list ap) {
    std::string text;
    va_list sizing;
    va_copy(sizing, ap);
    const int need = std::vsnprintf(nullptr, 0, fmt, sizing);
    va_end(sizing);
    if (need > 0) {
        text.resize(static_cast<size_t>(need) + 1);
        std::vsnprintf(text.data(), text.size(), fmt, ap);
        text.resize(static_cast<size_t>(need));
    }

    std::string out = NowIso8601Utc();
    out += ' ';
    out += LevelTag(lvl);
    const auto src = SourceFileName(file);
    if (!src.empty() && line > 0) {
        out += ' ';
        out += src;
        out += ':';
        out += std::to_string(line);
    }
    out += " | ";
    out += text;
    out += '\n';

    // Fetch workers log concurrently; the progress line must be gone before the
    // record lands on the terminal.
    std::lock_guard<std::mutex> lk(g_write_mu);
    if (IsProgressLineActive()) {
        ClearProgressLine();
    }
    std::fwrite(out.data(), 1, out.size(), stderr);
}

} // namespace packsmith
