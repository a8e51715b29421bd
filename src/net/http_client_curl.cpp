#include "net/http_client.hpp"
#include "common/logger.hpp"
#include <curl/curl.h>

namespace {
size_t WriteCallback(char* ptr, size_t size, size_t nmemb, void* userdata) {
  auto* s = static_cast<std::string*>(userdata);
  s->append(ptr, size * nmemb);
  return size * nmemb;
}

// RAII for the easy handle and its header list.
struct CurlRequest {
  CURL* curl = nullptr;
  curl_slist* headers = nullptr;
  CurlRequest() : curl(curl_easy_init()) {}
  ~CurlRequest() {
    if (headers) curl_slist_free_all(headers);
    if (curl) curl_easy_cleanup(curl);
  }
  CurlRequest(const CurlRequest&) = delete;
  CurlRequest& operator=(const CurlRequest&) = delete;
};
}

class CurlHttpClient : public HttpClient {
public:
  explicit CurlHttpClient(const HttpClientTuning& tuning) : tuning_(tuning) {
    curl_global_init(CURL_GLOBAL_DEFAULT);
  }
  ~CurlHttpClient() override {
    curl_global_cleanup();
  }

  HttpResponse Post(const std::string& url,
                    const std::string& body,
                    const std::unordered_map<std::string, std::string>& headers,
                    int timeout_ms) override {
    return Perform(url, &body, headers, timeout_ms);
  }

  HttpResponse Get(const std::string& url,
                   const std::unordered_map<std::string, std::string>& headers,
                   int timeout_ms) override {
    return Perform(url, nullptr, headers, timeout_ms);
  }

private:
  HttpResponse Perform(const std::string& url,
                       const std::string* body,
                       const std::unordered_map<std::string, std::string>& headers,
                       int timeout_ms) {
    HttpResponse resp;
    CurlRequest req;
    if (!req.curl) {
      resp.error = "curl_easy_init failed";
      Logger::Error(resp.error, __FILE__, __LINE__);
      return resp;
    }
    std::string response_string;
    for (const auto& kv : headers) {
      std::string line = kv.first + ": " + kv.second;
      req.headers = curl_slist_append(req.headers, line.c_str());
    }
    curl_easy_setopt(req.curl, CURLOPT_URL, url.c_str());
    if (body) {
      curl_easy_setopt(req.curl, CURLOPT_POST, 1L);
      curl_easy_setopt(req.curl, CURLOPT_POSTFIELDS, body->c_str());
      curl_easy_setopt(req.curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body->size()));
    } else {
      curl_easy_setopt(req.curl, CURLOPT_HTTPGET, 1L);
    }
    curl_easy_setopt(req.curl, CURLOPT_HTTPHEADER, req.headers);
    curl_easy_setopt(req.curl, CURLOPT_WRITEFUNCTION, WriteCallback);
    curl_easy_setopt(req.curl, CURLOPT_WRITEDATA, &response_string);
    curl_easy_setopt(req.curl, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_ms));
    curl_easy_setopt(req.curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(req.curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(req.curl, CURLOPT_USERAGENT, tuning_.user_agent.c_str());
    curl_easy_setopt(req.curl, CURLOPT_ACCEPT_ENCODING, "");
    curl_easy_setopt(req.curl, CURLOPT_TCP_KEEPALIVE, tuning_.enable_tcp_keepalive ? 1L : 0L);
    curl_easy_setopt(req.curl, CURLOPT_TCP_KEEPIDLE, static_cast<long>(tuning_.tcp_keepidle_s));
    curl_easy_setopt(req.curl, CURLOPT_TCP_KEEPINTVL, static_cast<long>(tuning_.tcp_keepintvl_s));
    if (tuning_.enable_http2) curl_easy_setopt(req.curl, CURLOPT_HTTP_VERSION, CURL_HTTP_VERSION_2TLS);
    if (!tuning_.verify_tls) {
      curl_easy_setopt(req.curl, CURLOPT_SSL_VERIFYPEER, 0L);
      curl_easy_setopt(req.curl, CURLOPT_SSL_VERIFYHOST, 0L);
    }
    CURLcode rc = curl_easy_perform(req.curl);
    if (rc != CURLE_OK) {
      resp.error = curl_easy_strerror(rc);
      Logger::Warning("curl request to " + url + " failed: " + resp.error, __FILE__, __LINE__);
    } else {
      long code = 0;
      curl_easy_getinfo(req.curl, CURLINFO_RESPONSE_CODE, &code);
      resp.status = code;
      resp.body = std::move(response_string);
    }
    return resp;
  }

  HttpClientTuning tuning_;
};

HttpClient* CreateCurlHttpClient(const HttpClientTuning& tuning) {
  return new CurlHttpClient(tuning);
}
