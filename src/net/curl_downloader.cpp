#include "net/curl_downloader.hpp"

#include "util/logger.hpp"

#include <curl/curl.h>

#include <memory>
#include <mutex>
#include <vector>

namespace packsmith {

namespace {

struct CurlEasyDeleter {
    void operator()(CURL* c) const {
        if (c) curl_easy_cleanup(c);
    }
};

struct CurlSlistDeleter {
    void operator()(curl_slist* l) const {
        if (l) curl_slist_free_all(l);
    }
};

std::once_flag g_curl_init;

struct TransferCtx {
    IWriter* out = nullptr;
    const FetchOptions* opt = nullptr;
    std::vector<std::uint8_t> chunk;
    std::uint64_t received = 0;
    Result write_result;
    bool cancelled = false;

    bool CancelRequested() const {
        return opt->cancel && opt->cancel->load(std::memory_order_relaxed);
    }

    bool Flush() {
        if (chunk.empty()) return true;
        write_result = out->WriteAll(std::span<const std::uint8_t>(chunk.data(), chunk.size()));
        chunk.clear();
        return write_result.is_ok();
    }
};

size_t WriteCb(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* ctx = static_cast<TransferCtx*>(userdata);
    const size_t n = size * nmemb;

    ctx->chunk.insert(ctx->chunk.end(),
                      reinterpret_cast<const std::uint8_t*>(ptr),
                      reinterpret_cast<const std::uint8_t*>(ptr) + n);
    ctx->received += n;

    if (ctx->chunk.size() >= ctx->opt->chunk_size) {
        if (ctx->CancelRequested()) {
            ctx->cancelled = true;
            return 0;
        }
        if (!ctx->Flush()) return 0;
    }
    return n;
}

int XferInfoCb(void* userdata, curl_off_t dltotal, curl_off_t dlnow, curl_off_t, curl_off_t) {
    auto* ctx = static_cast<TransferCtx*>(userdata);
    if (ctx->CancelRequested()) {
        ctx->cancelled = true;
        return 1;
    }
    if (ctx->opt->progress && dlnow > 0) {
        ProgressEvent event{};
        event.component = ctx->opt->tag;
        event.done = static_cast<std::uint64_t>(dlnow);
        event.total = dltotal > 0 ? static_cast<std::uint64_t>(dltotal) : 0;
        ctx->opt->progress->OnProgress(event);
    }
    return 0;
}

bool IsHttpUrl(const std::string& url) {
    return url.rfind("http://", 0) == 0 || url.rfind("https://", 0) == 0;
}

} // namespace

FetchOptions MakeFetchOptions(const PipelineConfig& cfg) {
    FetchOptions opt;
    opt.chunk_size = cfg.download_chunk_size;
    opt.timeout_ms = cfg.download_timeout_ms;
    opt.connect_timeout_ms = cfg.connect_timeout_ms;
    opt.user_agent = cfg.user_agent;
    opt.cancel = cfg.cancel;
    return opt;
}

CurlDownloader::CurlDownloader() {
    std::call_once(g_curl_init, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

Result CurlDownloader::Fetch(const std::string& url, const FetchOptions& opt, IWriter& out) {
    std::unique_ptr<CURL, CurlEasyDeleter> curl(curl_easy_init());
    if (!curl) return Result::Fail(ErrorKind::SourceUnreachable, "curl_easy_init failed");

    std::unique_ptr<curl_slist, CurlSlistDeleter> headers;
    for (const auto& h : opt.headers) {
        const std::string line = h.name + ": " + h.value;
        curl_slist* next = curl_slist_append(headers.get(), line.c_str());
        if (!next) return Result::Fail(ErrorKind::SourceUnreachable, "curl_slist_append failed");
        (void)headers.release();
        headers.reset(next);
    }

    TransferCtx ctx;
    ctx.out = &out;
    ctx.opt = &opt;
    ctx.chunk.reserve(static_cast<size_t>(opt.chunk_size));

    CURL* c = curl.get();
    curl_easy_setopt(c, CURLOPT_URL, url.c_str());
    curl_easy_setopt(c, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(c, CURLOPT_FAILONERROR, 1L);
    curl_easy_setopt(c, CURLOPT_USERAGENT, opt.user_agent.c_str());
    curl_easy_setopt(c, CURLOPT_TIMEOUT_MS, opt.timeout_ms);
    curl_easy_setopt(c, CURLOPT_CONNECTTIMEOUT_MS, opt.connect_timeout_ms);
    curl_easy_setopt(c, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(c, CURLOPT_WRITEFUNCTION, WriteCb);
    curl_easy_setopt(c, CURLOPT_WRITEDATA, &ctx);
    curl_easy_setopt(c, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(c, CURLOPT_XFERINFOFUNCTION, XferInfoCb);
    curl_easy_setopt(c, CURLOPT_XFERINFODATA, &ctx);
    if (headers) curl_easy_setopt(c, CURLOPT_HTTPHEADER, headers.get());

    LogDebug("fetch: %s", url.c_str());
    const CURLcode rc = curl_easy_perform(c);

    long status = 0;
    curl_easy_getinfo(c, CURLINFO_RESPONSE_CODE, &status);

    if (ctx.cancelled) {
        return Result::Fail(ErrorKind::Cancelled, "download cancelled: " + url);
    }
    if (!ctx.write_result.is_ok()) {
        return ctx.write_result;
    }
    if (rc == CURLE_HTTP_RETURNED_ERROR) {
        return Result::Fail(ErrorKind::HttpError,
                            "HTTP " + std::to_string(status) + " for " + url,
                            static_cast<int>(status));
    }
    if (rc == CURLE_OPERATION_TIMEDOUT) {
        return Result::Fail(ErrorKind::SourceUnreachable, "timed out fetching " + url);
    }
    if (rc != CURLE_OK) {
        return Result::Fail(ErrorKind::SourceUnreachable,
                            std::string(curl_easy_strerror(rc)) + ": " + url);
    }
    if (IsHttpUrl(url) && (status < 200 || status >= 300)) {
        return Result::Fail(ErrorKind::HttpError,
                            "HTTP " + std::to_string(status) + " for " + url,
                            static_cast<int>(status));
    }

    if (!ctx.Flush()) return ctx.write_result;
    auto fr = out.FsyncNow();
    if (!fr.is_ok()) return fr;

    LogDebug("fetched %llu bytes from %s", (unsigned long long)ctx.received, url.c_str());
    return Result::Ok();
}

} // namespace packsmith
