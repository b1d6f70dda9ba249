#include <curl/curl.h>

#include <memory>
#include <mutex>

#include "datasource/remote_http_backend.hpp"

namespace datasource {

namespace {
std::once_flag curlInitFlag;

// curl_global_init is not thread safe, run it once for the whole process.
void ensureCurlInitialized() {
    std::call_once(curlInitFlag, []() { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

size_t writeCallback(void *contents, size_t size, size_t nmemb, void *userp) {
    size_t totalSize = size * nmemb;
    auto *body = static_cast<std::vector<char> *>(userp);
    const char *data = static_cast<const char *>(contents);
    body->insert(body->end(), data, data + totalSize);
    return totalSize;
}

struct CurlDeleter {
    void operator()(CURL *curl) const {
        curl_easy_cleanup(curl);
    }
};

struct SlistDeleter {
    void operator()(struct curl_slist *list) const {
        curl_slist_free_all(list);
    }
};
}  // namespace

RemoteHttpBackend::RemoteHttpBackend(const std::string &baseUrl, Settings settings)
    : baseUrl_(baseUrl), settings_(std::move(settings)) {
    ensureCurlInitialized();
}

SourceKind RemoteHttpBackend::kind() const {
    return SourceKind::RemoteHttp;
}

std::string RemoteHttpBackend::urlFor(const LogicalPath &path) const {
    std::string url = baseUrl_;
    while (!url.empty() && url.back() == '/') {
        url.pop_back();
    }

    for (const auto &segment : path.segments()) {
        char *escaped = curl_easy_escape(nullptr, segment.c_str(), static_cast<int>(segment.size()));
        url += '/';
        if (escaped) {
            url += escaped;
            curl_free(escaped);
        } else {
            url += segment;
        }
    }
    return url;
}

bool RemoteHttpBackend::perform(const std::string &url, bool headOnly, Transfer &transfer) const {
    std::unique_ptr<CURL, CurlDeleter> curl(curl_easy_init());
    if (!curl) {
        transfer.err_ = "Failed to initialize CURL";
        return false;
    }

    struct curl_slist *list = nullptr;
    for (const auto &header : settings_.headers_) {
        struct curl_slist *appended = curl_slist_append(list, header.c_str());
        if (appended == nullptr) {
            curl_slist_free_all(list);
            transfer.err_ = "Failed to add request header: " + header;
            return false;
        }
        list = appended;
    }
    std::unique_ptr<struct curl_slist, SlistDeleter> headers(list);

    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &transfer.body_);
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, settings_.followRedirects_ ? 1L : 0L);
    if (headers) {
        curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
    }
    if (!settings_.userAgent_.empty()) {
        curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, settings_.userAgent_.c_str());
    }
    if (settings_.timeoutSeconds_ > 0) {
        curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, settings_.timeoutSeconds_);
    }
    if (settings_.connectTimeoutSeconds_ > 0) {
        curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT, settings_.connectTimeoutSeconds_);
    }
    if (headOnly) {
        curl_easy_setopt(curl.get(), CURLOPT_NOBODY, 1L);
    }

    CURLcode res = curl_easy_perform(curl.get());
    if (res != CURLE_OK) {
        transfer.err_ = std::string("HTTP request failed: ") + curl_easy_strerror(res);
        return false;
    }

    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &transfer.httpCode_);
    return true;
}

bool RemoteHttpBackend::exists(const LogicalPath &path) const {
    Transfer transfer;
    if (!perform(urlFor(path), true, transfer)) {
        return false;
    }
    if (transfer.httpCode_ == 405 || transfer.httpCode_ == 501) {
        return fetch(path).ok();
    }
    return transfer.httpCode_ >= 200 && transfer.httpCode_ < 300;
}

FetchResult RemoteHttpBackend::fetch(const LogicalPath &path) const {
    const std::string url = urlFor(path);
    Transfer transfer;
    if (!perform(url, false, transfer)) {
        return FetchResult::failure(FetchError::IoError, transfer.err_ + " (" + url + ")");
    }

    if (transfer.httpCode_ == 404) {
        return FetchResult::failure(FetchError::NotFound, "Upstream has no " + url);
    }
    if (transfer.httpCode_ < 200 || transfer.httpCode_ >= 300) {
        return FetchResult::failure(
            FetchError::UpstreamError,
            "Upstream answered " + std::to_string(transfer.httpCode_) + " for " + url);
    }

    auto body = std::make_shared<const std::vector<char>>(std::move(transfer.body_));
    return FetchResult::success(std::make_unique<MemoryStream>(body), url);
}

std::string RemoteHttpBackend::describe() const {
    return "remote[" + baseUrl_ + "]";
}

}  // namespace datasource
