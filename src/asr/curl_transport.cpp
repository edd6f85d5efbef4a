#include "asr/curl_transport.hpp"
#include "core/logging.hpp"
#include <curl/curl.h>
#include <mutex>

namespace asr {

namespace {
std::mutex g_curl_mutex;
int g_curl_refcount = 0;

bool acquire_curl_global() {
    std::lock_guard<std::mutex> lock(g_curl_mutex);
    if (g_curl_refcount == 0) {
        const CURLcode rc = curl_global_init(CURL_GLOBAL_DEFAULT);
        if (rc != CURLE_OK) {
            core::log_error(std::string("[http] curl_global_init failed: ") + curl_easy_strerror(rc));
            return false;
        }
    }
    ++g_curl_refcount;
    return true;
}

void release_curl_global() {
    std::lock_guard<std::mutex> lock(g_curl_mutex);
    if (g_curl_refcount <= 0) return;
    if (--g_curl_refcount == 0) curl_global_cleanup();
}

size_t write_callback(void* contents, size_t size, size_t nmemb, void* userp) {
    auto* response = static_cast<std::string*>(userp);
    response->append(static_cast<const char*>(contents), size * nmemb);
    return size * nmemb;
}
} // namespace

CurlTransport::CurlTransport() : global_ok_(acquire_curl_global()) {}

CurlTransport::~CurlTransport() {
    if (global_ok_) release_curl_global();
}

core::Result<HttpResponse> CurlTransport::post_multipart(const MultipartRequest& request) {
    using R = core::Result<HttpResponse>;
    if (!global_ok_) return R::fail(core::ErrorKind::TransientProvider, "libcurl not initialized");

    CURL* curl = curl_easy_init();
    if (!curl) return R::fail(core::ErrorKind::TransientProvider, "curl_easy_init failed");

    curl_mime* mime = curl_mime_init(curl);
    for (const auto& field : request.fields) {
        curl_mimepart* part = curl_mime_addpart(mime);
        curl_mime_name(part, field.first.c_str());
        curl_mime_data(part, field.second.c_str(), CURL_ZERO_TERMINATED);
    }
    curl_mimepart* file_part = curl_mime_addpart(mime);
    curl_mime_name(file_part, request.file_field.c_str());
    CURLcode file_rc = CURLE_OK;
    if (!request.file_path.empty()) {
        file_rc = curl_mime_filedata(file_part, request.file_path.c_str());
    } else {
        curl_mime_data(file_part, request.file_bytes.data(), request.file_bytes.size());
        curl_mime_filename(file_part, request.file_name.empty() ? "audio.wav" : request.file_name.c_str());
    }
    if (file_rc != CURLE_OK) {
        curl_mime_free(mime);
        curl_easy_cleanup(curl);
        return R::fail(core::ErrorKind::RecognitionFailed,
                       "cannot attach " + request.file_path + ": " + curl_easy_strerror(file_rc));
    }

    struct curl_slist* header_list = nullptr;
    for (const auto& header : request.headers) {
        header_list = curl_slist_append(header_list, header.c_str());
    }

    std::string body;
    curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(curl, CURLOPT_MIMEPOST, mime);
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &body);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, request.timeout_seconds);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    core::log_debug("[http] POST " + request.url);
    const CURLcode res = curl_easy_perform(curl);
    long status = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);

    curl_slist_free_all(header_list);
    curl_mime_free(mime);
    curl_easy_cleanup(curl);

    if (res != CURLE_OK) {
        core::log_warn(std::string("[http] request failed: ") + curl_easy_strerror(res));
        return R::fail(core::ErrorKind::TransientProvider, std::string("transport error: ") + curl_easy_strerror(res));
    }
    core::log_debug("[http] status " + std::to_string(status) + ", " + std::to_string(body.size()) + " bytes");
    return HttpResponse{status, std::move(body)};
}

} // namespace asr
