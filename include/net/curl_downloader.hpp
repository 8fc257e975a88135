#pragma once

#include "net/downloader.hpp"

namespace packsmith {

// libcurl-backed downloader. Accepts http(s):// and file:// URLs.
class CurlDownloader final : public IDownloader {
public:
    CurlDownloader();

    Result Fetch(const std::string& url, const FetchOptions& opt, IWriter& out) override;
};

} // namespace packsmith
