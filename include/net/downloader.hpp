#pragma once

#include "io/io.hpp"
#include "pack/progress.hpp"
#include "util/pipeline_config.hpp"
#include "util/result.hpp"

#include <atomic>
#include <cstdint>
#include <string>
#include <vector>

namespace packsmith {

struct HttpHeader {
    std::string name;
    std::string value;
};

struct FetchOptions {
    std::uint64_t chunk_size = 2 * 1024 * 1024ULL;
    long timeout_ms = 120000;
    long connect_timeout_ms = 15000;
    std::string user_agent = "packsmith";
    std::vector<HttpHeader> headers;

    // Polled between chunks; a set flag aborts the transfer with Cancelled.
    const std::atomic_bool* cancel = nullptr;

    IProgress* progress = nullptr;
    std::string tag; // label for progress events
};

FetchOptions MakeFetchOptions(const PipelineConfig& cfg);

// Transport contract the pipeline relies on. Implementations do not retry.
//
// Fails with:
//   SourceUnreachable  connection/DNS/TLS failure or timeout
//   HttpError          non-2xx HTTP status (Result::err carries the status)
//   Cancelled          cancel flag observed
//   any writer error   propagated unchanged
class IDownloader {
public:
    virtual ~IDownloader() = default;
    virtual Result Fetch(const std::string& url, const FetchOptions& opt, IWriter& out) = 0;
};

} // namespace packsmith
