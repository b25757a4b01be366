#include "agentcard/signatures/jwks_fetcher.h"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>

#include <curl/curl.h>

namespace agentcard::signatures {

namespace {

using CurlPtr = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;

struct ResponseSink {
  std::string* body = nullptr;
  std::size_t limit = 0;
  bool overflow = false;
};

size_t WriteCallback(char* ptr, size_t size, size_t nmemb, void* userdata) {
  auto* sink = static_cast<ResponseSink*>(userdata);
  const size_t total = size * nmemb;
  if (sink->body->size() + total > sink->limit) {
    // Returning less than total aborts the transfer with CURLE_WRITE_ERROR.
    sink->overflow = true;
    return 0;
  }
  sink->body->append(ptr, total);
  return total;
}

void EnsureCurlInitialized() {
  static std::once_flag once;
  std::call_once(once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

bool IsHttpsUri(std::string_view uri) {
  if (uri.size() < 8) {
    return false;
  }
  for (std::size_t i = 0; i < 8; ++i) {
    const char c = static_cast<char>(std::tolower(static_cast<unsigned char>(uri[i])));
    if (c != "https://"[i]) {
      return false;
    }
  }
  return true;
}

} // namespace

class CurlJwksFetcher final : public IJwksFetcher {
 public:
  JwksFetchResponse FetchJwksJson(std::string_view uri,
                                  std::uint32_t timeout_ms,
                                  std::size_t max_response_bytes) const override {
    EnsureCurlInitialized();

    JwksFetchResponse out;
    const std::string url(uri);
    // CURLOPT_TIMEOUT_MS of 0 means no timeout at all.
    const std::uint32_t bounded_timeout_ms = std::max<std::uint32_t>(timeout_ms, 1);
    const char* protocols = IsHttpsUri(uri) ? "https" : "http,https";

    CurlPtr curl(curl_easy_init(), &curl_easy_cleanup);
    if (!curl) {
      out.error = "curl_easy_init failed";
      return out;
    }

    std::string body;
    ResponseSink sink{&body, max_response_bytes, false};
    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_HTTPGET, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_MAXREDIRS, 5L);
    curl_easy_setopt(curl.get(), CURLOPT_PROTOCOLS_STR, protocols);
    curl_easy_setopt(curl.get(), CURLOPT_REDIR_PROTOCOLS_STR, protocols);
    curl_easy_setopt(curl.get(), CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_SSL_VERIFYHOST, 2L);
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, &WriteCallback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &sink);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, static_cast<long>(bounded_timeout_ms));
    curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, "agentcard-signatures/0.1");

    const CURLcode rc = curl_easy_perform(curl.get());
    if (rc == CURLE_OPERATION_TIMEDOUT) {
      out.status = JwksFetchStatus::kTimeout;
      out.error = "Timed out after " + std::to_string(bounded_timeout_ms) + " ms";
      return out;
    }
    if (sink.overflow) {
      out.error = "Response exceeds " + std::to_string(max_response_bytes) + " bytes";
      return out;
    }
    if (rc != CURLE_OK) {
      out.error = curl_easy_strerror(rc);
      return out;
    }

    long http_code = 0;
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &http_code);
    if (http_code < 200 || http_code >= 300) {
      out.error = "HTTP " + std::to_string(http_code);
      return out;
    }

    out.status = JwksFetchStatus::kOk;
    out.body = std::move(body);
    return out;
  }
};

const IJwksFetcher& GetDefaultJwksFetcher() {
  static CurlJwksFetcher f;
  return f;
}

} // namespace agentcard::signatures
