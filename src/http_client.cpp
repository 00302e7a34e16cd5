#include "http_client.hpp"

#include <curl/curl.h>

#include <algorithm>
#include <mutex>
#include <sstream>
#include <stdexcept>

#include "upload_error.hpp"
#include "utils.hpp"

constexpr const char* USER_AGENT = "chunkup/1.0";

namespace {

std::once_flag g_curl_init_once;

size_t write_callback(void* contents, size_t size, size_t nmemb, std::string* userp) {
  size_t total_size = size * nmemb;
  userp->append(static_cast<char*>(contents), total_size);
  return total_size;
}

size_t header_callback(void* contents, size_t size, size_t nmemb, std::string* userp) {
  size_t total_size = size * nmemb;
  userp->append(static_cast<char*>(contents), total_size);
  return total_size;
}

std::string trim(const std::string& str) {
  size_t first = str.find_first_not_of(' ');
  if(first == std::string::npos) return "";
  size_t last = str.find_last_not_of(' ');
  return str.substr(first, (last - first + 1));
}

struct TransferContext {
  const CancellationHandle* cancel = nullptr;
  const HttpClient::ProgressCallback* on_progress = nullptr;
  bool aborted = false;
};

// Returning non-zero makes libcurl abort with CURLE_ABORTED_BY_CALLBACK.
int transfer_info_callback(void* clientp,
                           curl_off_t /*dltotal*/,
                           curl_off_t /*dlnow*/,
                           curl_off_t ultotal,
                           curl_off_t ulnow) {
  auto* ctx = static_cast<TransferContext*>(clientp);
  if(ctx->cancel && ctx->cancel->is_cancelled()) {
    ctx->aborted = true;
    return 1;
  }
  if(ctx->on_progress && *ctx->on_progress && ultotal > 0) {
    (*ctx->on_progress)(static_cast<uint64_t>(ulnow), static_cast<uint64_t>(ultotal));
  }
  return 0;
}

struct MimeDeleter {
  void operator()(curl_mime* mime) const { curl_mime_free(mime); }
};

struct HeaderListDeleter {
  void operator()(curl_slist* list) const { curl_slist_free_all(list); }
};

} // namespace

class HttpClient::impl {
public:
  impl() {
    std::call_once(g_curl_init_once, [](){
      curl_global_init(CURL_GLOBAL_DEFAULT);
    });
    curl_handle = curl_easy_init();
    if(!curl_handle) {
      throw std::runtime_error("Failed to initialize curl handle");
    }
    curl_easy_setopt(curl_handle, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl_handle, CURLOPT_HEADERFUNCTION, header_callback);
    curl_easy_setopt(curl_handle, CURLOPT_XFERINFOFUNCTION, transfer_info_callback);
    curl_easy_setopt(curl_handle, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(curl_handle, CURLOPT_FOLLOWLOCATION, 0L);
    curl_easy_setopt(curl_handle, CURLOPT_USERAGENT, USER_AGENT);
    // Worker threads must not receive SIGALRM from the resolver.
    curl_easy_setopt(curl_handle, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl_handle, CURLOPT_ACCEPT_ENCODING, "");
  }

  ~impl() {
    if(curl_handle) {
      curl_easy_cleanup(curl_handle);
    }
  }

  impl(const impl&) = delete;
  impl& operator=(const impl&) = delete;

  CURL* curl_handle = nullptr;
  long timeout_seconds = 0;
  const CancellationHandle* cancel = nullptr;
  std::shared_ptr<Logger> logger;
};

HttpClient::HttpClient(std::shared_ptr<Logger> logger) : pimpl(std::make_unique<impl>()) {
  pimpl->logger = std::move(logger);
}

HttpClient::~HttpClient() = default;

HttpClient::HttpClient(HttpClient&&) noexcept = default;
HttpClient& HttpClient::operator=(HttpClient&&) noexcept = default;

void HttpClient::set_timeout(long timeout_seconds) {
  pimpl->timeout_seconds = timeout_seconds;
  curl_easy_setopt(pimpl->curl_handle, CURLOPT_TIMEOUT, timeout_seconds);
}

void HttpClient::set_cancellation(const CancellationHandle* cancel) {
  pimpl->cancel = cancel;
}

HttpClient::Response HttpClient::get(const Request& req) {
  return perform_request(req, Method::Get, nullptr, nullptr);
}

HttpClient::Response HttpClient::post(const Request& req) {
  return perform_request(req, Method::Post, nullptr, nullptr);
}

HttpClient::Response HttpClient::post_form(const Request& req,
                                           const std::vector<FormPart>& parts,
                                           const ProgressCallback& on_progress) {
  return perform_request(req, Method::PostForm, &parts, &on_progress);
}

HttpClient::Response HttpClient::perform_request(const Request& req,
                                                 Method method,
                                                 const std::vector<FormPart>* parts,
                                                 const ProgressCallback* on_progress) {
  CURL* curl = pimpl->curl_handle;
  if(pimpl->cancel && pimpl->cancel->is_cancelled()) {
    throw UploadError::cancelled();
  }

  Response resp;
  std::string response_body;
  std::string response_headers;
  TransferContext transfer;
  transfer.cancel = pimpl->cancel;
  transfer.on_progress = on_progress;

  curl_easy_setopt(curl, CURLOPT_URL, req.url.c_str());
  curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response_body);
  curl_easy_setopt(curl, CURLOPT_HEADERDATA, &response_headers);
  curl_easy_setopt(curl, CURLOPT_XFERINFODATA, &transfer);

  std::unique_ptr<curl_mime, MimeDeleter> mime;
  switch(method) {
    case Method::Get:
      curl_easy_setopt(curl, CURLOPT_MIMEPOST, nullptr);
      curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
      break;
    case Method::Post:
      curl_easy_setopt(curl, CURLOPT_MIMEPOST, nullptr);
      curl_easy_setopt(curl, CURLOPT_POSTFIELDS, req.body.c_str());
      curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(req.body.size()));
      break;
    case Method::PostForm:
      mime.reset(curl_mime_init(curl));
      for(const auto& part : *parts) {
        curl_mimepart* field = curl_mime_addpart(mime.get());
        curl_mime_name(field, part.name.c_str());
        curl_mime_data(field, part.view ? part.view : part.data.data(), part.size());
        if(!part.filename.empty()) curl_mime_filename(field, part.filename.c_str());
        if(!part.content_type.empty()) curl_mime_type(field, part.content_type.c_str());
      }
      curl_easy_setopt(curl, CURLOPT_MIMEPOST, mime.get());
      break;
  }

  std::unique_ptr<curl_slist, HeaderListDeleter> header_list;
  for(const auto& header : req.headers) {
    // An empty value ("Expect:") suppresses a header libcurl would add itself.
    std::string header_string = header.second.empty()
      ? header.first + ":"
      : header.first + ": " + header.second;
    curl_slist* appended = curl_slist_append(header_list.get(), header_string.c_str());
    if(!appended) throw std::runtime_error("Failed to build header list");
    header_list.release();
    header_list.reset(appended);
  }
  curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list.get());

  log_to(pimpl->logger.get(), LogChannel::Debug, "{} {}",
            method == Method::Get ? "GET" : "POST", req.url);

  CURLcode res = curl_easy_perform(curl);

  // Detach per-request pointers before they go out of scope.
  curl_easy_setopt(curl, CURLOPT_HTTPHEADER, nullptr);
  curl_easy_setopt(curl, CURLOPT_MIMEPOST, nullptr);
  curl_easy_setopt(curl, CURLOPT_XFERINFODATA, nullptr);

  if(res != CURLE_OK) {
    if(transfer.aborted || res == CURLE_ABORTED_BY_CALLBACK) {
      log_to(pimpl->logger.get(), LogChannel::Debug, "{} aborted by cancellation", req.url);
      throw UploadError::cancelled();
    }
    throw UploadError::network(std::string(curl_easy_strerror(res)) + " (" + req.url + ")");
  }

  long status_code = 0;
  curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status_code);
  resp.status_code = static_cast<int>(status_code);
  parse_response_headers(response_headers, resp);
  resp.body = std::move(response_body);

  log_to(pimpl->logger.get(), LogChannel::Debug, "{} -> {} ({} bytes)", req.url, resp.status_code, resp.body.size());
  return resp;
}

void HttpClient::parse_response_headers(const std::string& header_string, Response& resp) {
  std::istringstream stream(header_string);
  std::string line;

  while(std::getline(stream, line)) {
    if(!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    size_t colon_pos = line.find(':');
    if(colon_pos != std::string::npos) {
      std::string header_name = trim(line.substr(0, colon_pos));
      std::string header_value = trim(line.substr(colon_pos + 1));
      resp.headers[to_lower_copy(header_name)] = header_value;
    }
  }
}
