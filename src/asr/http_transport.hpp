#pragma once
#include "core/result.hpp"
#include <string>
#include <utility>
#include <vector>

namespace asr {

struct HttpResponse {
    long status = 0;
    std::string body;
};

// multipart/form-data POST with one file part
struct MultipartRequest {
    std::string url;
    std::vector<std::string> headers;                         ///< "Name: value"
    std::vector<std::pair<std::string, std::string>> fields;  ///< Plain form fields, in order
    std::string file_field = "file";
    std::string file_path;      ///< Streamed from disk when set
    std::string file_name;      ///< Used with file_bytes
    std::string file_bytes;     ///< In-memory payload when file_path is empty
    long timeout_seconds = 300;
};

// Seam between the provider client and the network. Transport errors come back
// as TransientProvider; any HTTP status, including errors, is a successful response.
class IHttpTransport {
public:
    virtual ~IHttpTransport() = default;
    virtual core::Result<HttpResponse> post_multipart(const MultipartRequest& request) = 0;
};

} // namespace asr
