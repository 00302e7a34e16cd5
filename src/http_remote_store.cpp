#include "http_remote_store.hpp"

#include <algorithm>

#include "protocol.hpp"
#include "upload_error.hpp"

namespace {

std::string trim_trailing_slashes(std::string url) {
  while(!url.empty() && url.back() == '/') url.pop_back();
  return url;
}

void throw_for_status(const HttpClient::Response& resp) {
  if(resp.ok()) return;
  throw UploadError::server(resp.status_code, error_message_from_body(resp.body));
}

} // namespace

HttpRemoteStore::HttpRemoteStore(Options options, std::shared_ptr<Logger> logger)
  : options_(std::move(options)),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("remote-store")) {
  options_.base_url = trim_trailing_slashes(options_.base_url);
}

HttpClient HttpRemoteStore::make_client(const CancellationHandle& cancel) const {
  HttpClient client(logger_);
  client.set_timeout(options_.request_timeout_seconds);
  client.set_cancellation(&cancel);
  return client;
}

std::string HttpRemoteStore::endpoint(const char* path) const {
  return options_.base_url + path;
}

HttpClient::Response HttpRemoteStore::post_json(const char* path,
                                                const std::string& body,
                                                const CancellationHandle& cancel) const {
  auto client = make_client(cancel);
  HttpClient::Request req(endpoint(path));
  req.headers["Content-Type"] = "application/json";
  req.body = body;
  return client.post(req);
}

CheckResult HttpRemoteStore::check(const std::string& fingerprint,
                                   const std::string& filename,
                                   uint64_t size,
                                   const CancellationHandle& cancel) {
  auto resp = post_json(kCheckPath, make_check_request(fingerprint, filename, size).dump(), cancel);
  throw_for_status(resp);
  try {
    auto result = parse_check_response(resp.body);
    logger_->debug("check {}: complete={} received={}",
                   fingerprint, result.already_complete, result.received_chunk_indexes.size());
    return result;
  } catch(const json::exception& e) {
    throw UploadError::server(resp.status_code, std::string("malformed check response: ") + e.what());
  }
}

void HttpRemoteStore::upload_chunk(const std::string& fingerprint,
                                   const std::string& filename,
                                   uint32_t chunk_index,
                                   uint32_t total_chunks,
                                   const std::vector<char>& bytes,
                                   const ChunkProgress& on_progress,
                                   const CancellationHandle& cancel) {
  auto client = make_client(cancel);
  HttpClient::Request req(endpoint(kUploadPath));
  // The store files the part before it parses the form, so the key travels as headers too.
  req.headers[kHashHeader] = fingerprint;
  req.headers[kChunkIndexHeader] = std::to_string(chunk_index);
  req.headers["Expect"] = "";

  std::vector<HttpClient::FormPart> parts;
  parts.push_back({"hash", fingerprint, "", ""});
  parts.push_back({"filename", filename, "", ""});
  parts.push_back({"chunkIndex", std::to_string(chunk_index), "", ""});
  parts.push_back({"totalChunks", std::to_string(total_chunks), "", ""});
  HttpClient::FormPart file_part;
  file_part.name = "file";
  file_part.filename = filename;
  file_part.content_type = "application/octet-stream";
  file_part.view = bytes.empty() ? "" : bytes.data();
  file_part.view_size = bytes.size();
  parts.push_back(std::move(file_part));

  HttpClient::ProgressCallback progress;
  if(on_progress) {
    // libcurl's total includes the multipart framing; clamp to the chunk's own bytes.
    const uint64_t chunk_bytes = bytes.size();
    progress = [&on_progress, chunk_bytes](uint64_t sent, uint64_t total){
      if(total == 0) return;
      uint64_t scaled = chunk_bytes == 0 ? 0 : static_cast<uint64_t>(
        static_cast<double>(sent) / static_cast<double>(total) * static_cast<double>(chunk_bytes));
      on_progress(std::min(scaled, chunk_bytes), chunk_bytes);
    };
  }

  auto resp = client.post_form(req, parts, progress);
  throw_for_status(resp);
  if(on_progress) on_progress(bytes.size(), bytes.size());
}

MergeResult HttpRemoteStore::merge(const std::string& fingerprint,
                                   const std::string& filename,
                                   uint64_t size,
                                   uint32_t total_chunks,
                                   const CancellationHandle& cancel) {
  auto resp = post_json(kMergePath,
                        make_merge_request(fingerprint, filename, size, total_chunks).dump(),
                        cancel);
  throw_for_status(resp);
  auto result = parse_merge_response(resp.body);
  logger_->debug("merge {} ({} chunks) -> {}", fingerprint, total_chunks,
                 result.url.empty() ? "<no url>" : result.url);
  return result;
}

bool HttpRemoteStore::ping(const CancellationHandle& cancel) {
  try {
    auto client = make_client(cancel);
    auto resp = client.get(HttpClient::Request(endpoint("/")));
    if(!resp.ok()) {
      logger_->warn("health check of {} returned {}", options_.base_url, resp.status_code);
    }
    return resp.ok();
  } catch(const UploadError& e) {
    logger_->warn("health check of {} failed: {}", options_.base_url, e.what());
    return false;
  }
}
