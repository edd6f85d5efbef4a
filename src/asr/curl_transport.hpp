#pragma once
#include "asr/http_transport.hpp"

namespace asr {

// libcurl implementation; curl_global_init is reference-counted across instances
class CurlTransport : public IHttpTransport {
public:
    CurlTransport();
    ~CurlTransport() override;

    CurlTransport(const CurlTransport&) = delete;
    CurlTransport& operator=(const CurlTransport&) = delete;

    core::Result<HttpResponse> post_multipart(const MultipartRequest& request) override;

private:
    bool global_ok_ = false;
};

} // namespace asr
