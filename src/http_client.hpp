#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "cancellation.hpp"
#include "log.hpp"

// Blocking libcurl wrapper. One instance per thread; every transfer can be
// aborted through a CancellationHandle and reports upload progress.
class HttpClient {
public:
  struct Response {
    int status_code = 0;
    std::string body;
    std::map<std::string, std::string> headers; // names lower-cased

    bool ok() const { return status_code >= 200 && status_code < 300; }
  };

  struct Request {
    std::string url;
    std::map<std::string, std::string> headers;
    std::string body;

    Request() = default;
    explicit Request(std::string target) : url(std::move(target)) {}
  };

  struct FormPart {
    std::string name;
    std::string data;
    std::string filename;     // set for file parts
    std::string content_type; // optional
    // When set, sent instead of `data`. Not owned; must outlive the request.
    const char* view = nullptr;
    std::size_t view_size = 0;

    std::size_t size() const { return view ? view_size : data.size(); }
  };

  using ProgressCallback = std::function<void(uint64_t bytes_sent, uint64_t bytes_total)>;

  explicit HttpClient(std::shared_ptr<Logger> logger = nullptr);
  ~HttpClient();

  HttpClient(const HttpClient&) = delete;
  HttpClient& operator=(const HttpClient&) = delete;
  HttpClient(HttpClient&&) noexcept;
  HttpClient& operator=(HttpClient&&) noexcept;

  // 0 disables the per-request timeout.
  void set_timeout(long timeout_seconds);
  void set_cancellation(const CancellationHandle* cancel);

  // All three throw UploadError: NetworkError on transport failure, Cancelled
  // when the token fired mid-transfer. HTTP error statuses are returned as-is.
  Response get(const Request& req);
  Response post(const Request& req);
  Response post_form(const Request& req,
                     const std::vector<FormPart>& parts,
                     const ProgressCallback& on_progress = {});

private:
  class impl;
  std::unique_ptr<impl> pimpl;

  enum class Method { Get, Post, PostForm };

  Response perform_request(const Request& req,
                           Method method,
                           const std::vector<FormPart>* parts,
                           const ProgressCallback* on_progress);
  static void parse_response_headers(const std::string& header_string, Response& resp);
};
