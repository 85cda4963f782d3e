#include "smartscan_core/llm/http_transport.hpp"

#include <curl/curl.h>

#include <memory>

#include "smartscan_core/errors.hpp"

namespace smartscan_core {

namespace {

struct CurlEasyDeleter {
  void operator()(CURL *handle) const {
    curl_easy_cleanup(handle);
  }
};

struct CurlSlistDeleter {
  void operator()(curl_slist *list) const {
    curl_slist_free_all(list);
  }
};

}  // namespace

CurlHttpTransport::CurlHttpTransport() {
  curl_global_init(CURL_GLOBAL_DEFAULT);
}

CurlHttpTransport::~CurlHttpTransport() {
  curl_global_cleanup();
}

size_t CurlHttpTransport::write_callback(void *contents, size_t size, size_t nmemb, std::string *userp) {
  userp->append(static_cast<char *>(contents), size * nmemb);
  return size * nmemb;
}

HttpResponse CurlHttpTransport::get(const std::string &url, std::chrono::milliseconds timeout) {
  return perform(url, nullptr, timeout);
}

HttpResponse CurlHttpTransport::post_json(const std::string &url, const std::string &body,
                                          std::chrono::milliseconds timeout) {
  return perform(url, &body, timeout);
}

HttpResponse CurlHttpTransport::perform(const std::string &url, const std::string *body,
                                        std::chrono::milliseconds timeout) {
  // One handle per request keeps the transport usable from several worker threads
  std::unique_ptr<CURL, CurlEasyDeleter> curl(curl_easy_init());
  if (!curl) {
    throw TransportError("Failed to initialize CURL");
  }

  HttpResponse response;
  curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_callback);
  curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response.body);
  curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, static_cast<long>(timeout.count()));
  curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, "SmartScan/1.0");

  std::unique_ptr<curl_slist, CurlSlistDeleter> headers;
  if (body != nullptr) {
    headers.reset(curl_slist_append(nullptr, "Content-Type: application/json"));
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
    curl_easy_setopt(curl.get(), CURLOPT_POST, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, body->c_str());
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(body->size()));
  }

  CURLcode res = curl_easy_perform(curl.get());
  if (res != CURLE_OK) {
    if (res == CURLE_OPERATION_TIMEDOUT) {
      throw TransportError("Request to " + url + " timed out after " +
                           std::to_string(timeout.count()) + " ms");
    }
    throw TransportError("HTTP request to " + url + " failed: " + curl_easy_strerror(res));
  }

  curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.status_code);
  return response;
}

}  // namespace smartscan_core
