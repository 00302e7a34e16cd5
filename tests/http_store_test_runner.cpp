#include "http_remote_store.hpp"
#include "log.hpp"
#include "protocol.hpp"
#include "test_runner_utils.hpp"
#include "upload_queue_manager.hpp"

#include <asio.hpp>
#include <nlohmann/json.hpp>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <functional>
#include <iostream>
#include <map>
#include <mutex>
#include <set>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

namespace {

using namespace std::chrono_literals;
using chunkup::test::make_content;
using chunkup::test::make_memory_file;
using chunkup::test::md5_of;

struct HttpRequest {
  std::string method;
  std::string target;
  std::map<std::string, std::string> headers; // lower-cased names
  std::string body;
};

struct FormField {
  std::string name;
  std::string filename;
  std::string data;
};

std::string lower(std::string value) {
  for(auto& c : value) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return value;
}

std::string trim(const std::string& value) {
  auto first = value.find_first_not_of(" \t");
  if(first == std::string::npos) return "";
  auto last = value.find_last_not_of(" \t\r");
  return value.substr(first, last - first + 1);
}

std::string quoted_attribute(const std::string& header, const std::string& attribute) {
  auto key = attribute + "=\"";
  auto pos = header.find(key);
  if(pos == std::string::npos) return "";
  pos += key.size();
  auto end = header.find('"', pos);
  return end == std::string::npos ? "" : header.substr(pos, end - pos);
}

std::vector<FormField> parse_multipart(const HttpRequest& req) {
  std::vector<FormField> fields;
  auto content_type = req.headers.count("content-type") ? req.headers.at("content-type") : "";
  auto bpos = content_type.find("boundary=");
  if(bpos == std::string::npos) return fields;
  auto boundary = "--" + content_type.substr(bpos + 9);
  const auto& body = req.body;
  std::size_t pos = body.find(boundary);
  while(pos != std::string::npos) {
    pos += boundary.size();
    if(body.compare(pos, 2, "--") == 0) break;
    pos += 2; // CRLF after the boundary
    auto header_end = body.find("\r\n\r\n", pos);
    if(header_end == std::string::npos) break;
    auto part_headers = body.substr(pos, header_end - pos);
    auto data_start = header_end + 4;
    auto next = body.find("\r\n" + boundary, data_start);
    if(next == std::string::npos) break;
    FormField field;
    std::istringstream lines(part_headers);
    std::string line;
    while(std::getline(lines, line)) {
      if(lower(line).rfind("content-disposition:", 0) == 0) {
        field.name = quoted_attribute(line, "name");
        field.filename = quoted_attribute(line, "filename");
      }
    }
    field.data = body.substr(data_start, next - data_start);
    fields.push_back(std::move(field));
    pos = next + 2;
  }
  return fields;
}

// Minimal HTTP/1.1 chunk store speaking the /check, /upload, /merge protocol.
// One request per connection, each connection on its own thread.
class TestStoreServer {
public:
  struct ReceivedUpload {
    std::map<std::string, std::string> headers;
    std::vector<FormField> fields;
  };

  TestStoreServer()
    : acceptor_(io_, asio::ip::tcp::endpoint(asio::ip::make_address("127.0.0.1"), 0)) {
    port_ = acceptor_.local_endpoint().port();
    accept_thread_ = std::thread([this](){ accept_loop(); });
  }

  ~TestStoreServer() {
    stop();
  }

  void stop() {
    if(stopping_.exchange(true)) return;
    // Wake the blocking accept.
    try {
      asio::io_context wake_io;
      asio::ip::tcp::socket wake(wake_io);
      wake.connect(asio::ip::tcp::endpoint(asio::ip::make_address("127.0.0.1"), port_));
    } catch(const std::exception& e) {
      std::cerr << "wake connect failed: " << e.what() << "\n";
    }
    if(accept_thread_.joinable()) accept_thread_.join();
    std::vector<std::thread> workers;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      workers.swap(workers_);
    }
    for(auto& worker : workers) {
      if(worker.joinable()) worker.join();
    }
  }

  std::string base_url() const {
    return "http://127.0.0.1:" + std::to_string(port_);
  }

  void preload(const std::string& hash, uint32_t index, const std::string& data) {
    std::lock_guard<std::mutex> lock(mutex_);
    chunks_[hash][index] = data;
  }

  void fail_next_uploads(int count) { fail_uploads_ = count; }
  void hold_uploads(std::chrono::milliseconds hold) { hold_ms_ = static_cast<int>(hold.count()); }
  void malformed_check(bool enabled) { malformed_check_ = enabled; }

  std::vector<ReceivedUpload> uploads() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return uploads_;
  }

  std::vector<std::string> paths() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return paths_;
  }

  std::size_t count_path(const std::string& path) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<std::size_t>(std::count(paths_.begin(), paths_.end(), path));
  }

  std::string assembled(const std::string& hash) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = files_.find(hash);
    return it == files_.end() ? std::string() : it->second;
  }

private:
  void accept_loop() {
    while(!stopping_) {
      asio::ip::tcp::socket socket(io_);
      std::error_code ec;
      acceptor_.accept(socket, ec);
      if(ec || stopping_) break;
      std::lock_guard<std::mutex> lock(mutex_);
      workers_.emplace_back([this, s = std::move(socket)]() mutable {
        serve(std::move(s));
      });
    }
  }

  void serve(asio::ip::tcp::socket socket) {
    std::error_code ec;
    asio::streambuf buffer;
    auto header_bytes = asio::read_until(socket, buffer, "\r\n\r\n", ec);
    if(ec) return;
    std::string raw(asio::buffers_begin(buffer.data()),
                    asio::buffers_begin(buffer.data()) + static_cast<std::ptrdiff_t>(header_bytes));
    buffer.consume(header_bytes);

    HttpRequest req;
    std::istringstream head(raw);
    std::string line;
    std::getline(head, line);
    std::istringstream request_line(line);
    request_line >> req.method >> req.target;
    while(std::getline(head, line)) {
      if(line == "\r" || line.empty()) break;
      auto colon = line.find(':');
      if(colon == std::string::npos) continue;
      req.headers[lower(trim(line.substr(0, colon)))] = trim(line.substr(colon + 1));
    }
    std::size_t content_length = 0;
    if(req.headers.count("content-length")) {
      content_length = static_cast<std::size_t>(std::stoull(req.headers["content-length"]));
    }
    if(buffer.size() < content_length) {
      asio::read(socket, buffer, asio::transfer_exactly(content_length - buffer.size()), ec);
      if(ec) return;
    }
    req.body.assign(asio::buffers_begin(buffer.data()),
                    asio::buffers_begin(buffer.data()) + static_cast<std::ptrdiff_t>(content_length));

    int status = 200;
    std::string body = handle(req, status);
    std::ostringstream response;
    response << "HTTP/1.1 " << status << (status < 300 ? " OK" : " Error") << "\r\n"
             << "Content-Type: application/json\r\n"
             << "Content-Length: " << body.size() << "\r\n"
             << "Connection: close\r\n\r\n"
             << body;
    asio::write(socket, asio::buffer(response.str()), ec);
    socket.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
  }

  std::string handle(const HttpRequest& req, int& status) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      paths_.push_back(req.target);
    }
    if(req.method == "GET" && req.target == "/") {
      return "{\"status\":\"ok\"}";
    }
    if(req.method != "POST") {
      status = 404;
      return "{\"error\":\"not found\"}";
    }
    if(req.target == kCheckPath) {
      if(malformed_check_) return "this is not json";
      auto j = nlohmann::json::parse(req.body);
      auto hash = j.at("hash").get<std::string>();
      std::lock_guard<std::mutex> lock(mutex_);
      if(files_.count(hash)) {
        return nlohmann::json{{"uploaded", true}, {"url", "/uploads/" + j.value("filename", "")}}.dump();
      }
      nlohmann::json received = nlohmann::json::array();
      for(const auto& chunk : chunks_[hash]) received.push_back(chunk.first);
      received.push_back("index.tmp");
      return nlohmann::json{{"uploaded", false}, {"uploaded_chunks", received}}.dump();
    }
    if(req.target == kUploadPath) {
      int hold = hold_ms_.load();
      auto until = std::chrono::steady_clock::now() + std::chrono::milliseconds(hold);
      while(hold > 0 && !stopping_ && std::chrono::steady_clock::now() < until) {
        std::this_thread::sleep_for(10ms);
      }
      if(fail_uploads_.load() > 0) {
        --fail_uploads_;
        status = 500;
        return "{\"error\":\"disk full\"}";
      }
      auto it = req.headers.find(lower(kHashHeader));
      if(it == req.headers.end()) {
        status = 400;
        return "{\"error\":\"missing hash header\"}";
      }
      auto fields = parse_multipart(req);
      std::string data;
      uint32_t index = 0;
      for(const auto& field : fields) {
        if(field.name == "file") data = field.data;
        if(field.name == "chunkIndex") index = static_cast<uint32_t>(std::stoul(field.data));
      }
      std::lock_guard<std::mutex> lock(mutex_);
      chunks_[it->second][index] = data;
      uploads_.push_back({req.headers, fields});
      return "{\"success\":true}";
    }
    if(req.target == kMergePath) {
      auto j = nlohmann::json::parse(req.body);
      auto hash = j.at("hash").get<std::string>();
      auto total = j.at("totalChunks").get<uint32_t>();
      std::lock_guard<std::mutex> lock(mutex_);
      auto& have = chunks_[hash];
      for(uint32_t i = 0; i < total; ++i) {
        if(!have.count(i)) {
          status = 400;
          return "{\"error\":\"missing chunks\"}";
        }
      }
      std::string whole;
      for(const auto& chunk : have) whole += chunk.second;
      files_[hash] = whole;
      return nlohmann::json{{"success", true}, {"url", "/uploads/" + j.value("filename", "")}}.dump();
    }
    status = 404;
    return "{\"error\":\"not found\"}";
  }

  asio::io_context io_;
  asio::ip::tcp::acceptor acceptor_;
  unsigned short port_ = 0;
  std::thread accept_thread_;
  std::atomic<bool> stopping_{false};

  mutable std::mutex mutex_;
  std::vector<std::thread> workers_;
  std::map<std::string, std::map<uint32_t, std::string>> chunks_;
  std::map<std::string, std::string> files_;
  std::vector<ReceivedUpload> uploads_;
  std::vector<std::string> paths_;
  std::atomic<int> fail_uploads_{0};
  std::atomic<int> hold_ms_{0};
  std::atomic<bool> malformed_check_{false};
};

unsigned short unused_port() {
  asio::io_context io;
  asio::ip::tcp::acceptor port_finder(io, asio::ip::tcp::endpoint(asio::ip::make_address("127.0.0.1"), 0));
  return port_finder.local_endpoint().port();
}

struct TestContext {
  chunkup::test::LogCapture& logs;
  bool verbose = false;
};

bool expect(bool condition, const std::string& what) {
  if(!condition) std::cout << "\n    expectation failed: " << what << "\n";
  return condition;
}

HttpRemoteStore make_store(TestContext& ctx, const std::string& url, long timeout = 10) {
  auto logger = std::make_shared<Logger>("http-store");
  ctx.logs.attach(logger);
  HttpRemoteStore::Options options;
  options.base_url = url + "/";
  options.request_timeout_seconds = timeout;
  return HttpRemoteStore(options, logger);
}

bool test_protocol_bodies(TestContext&) {
  auto check = make_check_request("abc", "a.bin", 42);
  auto merge = make_merge_request("abc", "a.bin", 42, 3);
  auto parsed = parse_check_response(R"({"uploaded":false,"uploaded_chunks":[2,0,"junk",-1]})");
  auto done = parse_check_response(R"({"uploaded":true,"url":"/uploads/a.bin"})");
  bool ok = true;
  ok &= expect(check["hash"] == "abc" && check["fileSize"] == 42, "check body fields");
  ok &= expect(merge["totalChunks"] == 3 && merge["size"] == 42, "merge body fields");
  ok &= expect(parsed.received_chunk_indexes == std::vector<uint32_t>({2, 0}), "non-numeric entries skipped");
  ok &= expect(done.already_complete && done.url == "/uploads/a.bin", "complete response");
  ok &= expect(error_message_from_body(R"({"error":"boom"})") == "boom", "json error message");
  ok &= expect(error_message_from_body("plain text") == "plain text", "raw error body");
  ok &= expect(parse_merge_response("").url.empty(), "empty merge body");
  return ok;
}

bool test_ping(TestContext& ctx) {
  TestStoreServer server;
  auto store = make_store(ctx, server.base_url());
  auto dead = make_store(ctx, "http://127.0.0.1:" + std::to_string(unused_port()), 2);
  CancellationHandle cancel;
  bool ok = true;
  ok &= expect(store.ping(cancel), "running server is healthy");
  ok &= expect(!dead.ping(cancel), "closed port is unhealthy");
  return ok;
}

bool test_check_lists_received_chunks(TestContext& ctx) {
  TestStoreServer server;
  server.preload("abc", 0, "x");
  server.preload("abc", 2, "z");
  auto store = make_store(ctx, server.base_url());
  CancellationHandle cancel;
  auto result = store.check("abc", "a.bin", 3, cancel);
  std::set<uint32_t> got(result.received_chunk_indexes.begin(), result.received_chunk_indexes.end());
  return expect(!result.already_complete, "not complete") &&
         expect(got == std::set<uint32_t>({0, 2}), "received chunks listed");
}

bool test_upload_chunk_sends_form(TestContext& ctx) {
  TestStoreServer server;
  auto store = make_store(ctx, server.base_url());
  CancellationHandle cancel;
  std::string payload("bin\0ary\r\n--data", 15);
  std::vector<char> bytes(payload.begin(), payload.end());
  uint64_t last_sent = 0;
  uint64_t last_total = 0;
  store.upload_chunk("f00d", "photo.jpg", 1, 3, bytes,
                     [&](uint64_t sent, uint64_t total){ last_sent = sent; last_total = total; },
                     cancel);
  auto uploads = server.uploads();
  if(!expect(uploads.size() == 1, "one upload received")) return false;
  const auto& up = uploads[0];
  std::map<std::string, FormField> by_name;
  for(const auto& f : up.fields) by_name[f.name] = f;
  bool ok = true;
  ok &= expect(up.headers.count("x-file-hash") && up.headers.at("x-file-hash") == "f00d", "hash header");
  ok &= expect(up.headers.count("x-chunk-index") && up.headers.at("x-chunk-index") == "1", "index header");
  ok &= expect(by_name["hash"].data == "f00d", "hash field");
  ok &= expect(by_name["filename"].data == "photo.jpg", "filename field");
  ok &= expect(by_name["chunkIndex"].data == "1", "chunkIndex field");
  ok &= expect(by_name["totalChunks"].data == "3", "totalChunks field");
  ok &= expect(by_name["file"].data == payload, "binary chunk intact");
  ok &= expect(by_name["file"].filename == "photo.jpg", "file part carries the file name");
  ok &= expect(last_sent == bytes.size() && last_total == bytes.size(), "progress ends at the chunk size");

  // The caller's buffer is sent as-is, including an empty one.
  store.upload_chunk("f00d", "photo.jpg", 2, 3, std::vector<char>(), {}, cancel);
  uploads = server.uploads();
  if(!expect(uploads.size() == 2, "empty chunk received")) return false;
  bool has_file_part = false;
  for(const auto& f : uploads[1].fields) {
    if(f.name == "file") has_file_part = f.data.empty() && f.filename == "photo.jpg";
  }
  ok &= expect(has_file_part, "empty chunk still carries a file part");
  return ok;
}

bool test_server_errors(TestContext& ctx) {
  TestStoreServer server;
  auto store = make_store(ctx, server.base_url());
  CancellationHandle cancel;
  bool ok = true;

  server.fail_next_uploads(1);
  try {
    store.upload_chunk("abc", "a.bin", 0, 1, std::vector<char>(10, 'a'), {}, cancel);
    ok &= expect(false, "500 throws");
  } catch(const UploadError& e) {
    ok &= expect(e.kind() == UploadErrorKind::ServerError && e.status() == 500, "500 is ServerError");
    ok &= expect(std::string(e.what()).find("disk full") != std::string::npos, "message from error field");
  }

  try {
    store.merge("abc", "a.bin", 20, 2, cancel);
    ok &= expect(false, "merge with a missing chunk throws");
  } catch(const UploadError& e) {
    ok &= expect(e.status() == 400, "missing chunks is a 400");
    ok &= expect(std::string(e.what()).find("missing chunks") != std::string::npos, "merge error text");
  }

  server.malformed_check(true);
  try {
    store.check("abc", "a.bin", 10, cancel);
    ok &= expect(false, "malformed check throws");
  } catch(const UploadError& e) {
    ok &= expect(e.kind() == UploadErrorKind::ServerError, "malformed body is ServerError");
  }
  return ok;
}

bool test_network_error(TestContext& ctx) {
  auto store = make_store(ctx, "http://127.0.0.1:" + std::to_string(unused_port()), 2);
  CancellationHandle cancel;
  try {
    store.check("abc", "a.bin", 1, cancel);
  } catch(const UploadError& e) {
    return expect(e.kind() == UploadErrorKind::NetworkError, "refused connection is NetworkError");
  }
  return expect(false, "unreachable store throws");
}

bool test_cancel_aborts_request(TestContext& ctx) {
  TestStoreServer server;
  server.hold_uploads(5s);
  auto store = make_store(ctx, server.base_url(), 0);
  CancellationHandle cancel;
  std::thread canceller([cancel]() mutable {
    std::this_thread::sleep_for(100ms);
    cancel.cancel();
  });
  auto started = std::chrono::steady_clock::now();
  bool cancelled = false;
  try {
    store.upload_chunk("slow", "slow.bin", 0, 1, std::vector<char>(1024, 's'), {}, cancel);
  } catch(const UploadError& e) {
    cancelled = e.is_cancelled();
  }
  canceller.join();
  auto elapsed = std::chrono::steady_clock::now() - started;
  server.hold_uploads(0ms);
  server.stop();
  return expect(cancelled, "in-flight request reports Cancelled") &&
         expect(elapsed < 4s, "request aborted before the server answered");
}

bool test_pipeline_over_http(TestContext& ctx) {
  TestStoreServer server;
  auto logger = std::make_shared<Logger>("queue");
  ctx.logs.attach(logger);
  HttpRemoteStore::Options options;
  options.base_url = server.base_url();
  options.request_timeout_seconds = 10;
  auto store = std::make_shared<HttpRemoteStore>(options, logger->child("store"));
  auto config = chunkup::test::small_config(4096, 3, 2);
  UploadQueueManager manager(store, config, logger);

  auto content = make_content(3 * 4096 + 100, 99);
  auto first = manager.enqueue(make_memory_file("h1", "report.pdf", content));
  if(!expect(manager.wait_idle(20s), "first upload drains")) return false;
  auto uploads_after_first = server.uploads().size();
  auto again = manager.enqueue(make_memory_file("h2", "report-copy.pdf", content));
  if(!expect(manager.wait_idle(20s), "second upload drains")) return false;

  auto snap_first = manager.snapshot(first);
  auto snap_again = manager.snapshot(again);
  bool ok = true;
  ok &= expect(snap_first && snap_first->state.phase == UploadPhase::Succeeded, "first upload Succeeded");
  ok &= expect(snap_first && snap_first->state.remote_url == "/uploads/report.pdf", "merge url recorded");
  ok &= expect(uploads_after_first == 4, "four chunks sent");
  ok &= expect(server.assembled(md5_of(content)) == content, "server reassembled the file");
  ok &= expect(snap_again && snap_again->state.phase == UploadPhase::Succeeded, "duplicate Succeeded");
  ok &= expect(server.uploads().size() == 4, "duplicate sent no chunks");
  ok &= expect(server.count_path(kMergePath) == 1, "duplicate never merged");
  return ok;
}

bool test_resume_over_http(TestContext& ctx) {
  TestStoreServer server;
  auto content = make_content(3000, 17);
  auto fp = md5_of(content);
  server.preload(fp, 0, content.substr(0, 1000));
  auto logger = std::make_shared<Logger>("queue");
  ctx.logs.attach(logger);
  HttpRemoteStore::Options options;
  options.base_url = server.base_url();
  auto store = std::make_shared<HttpRemoteStore>(options, logger);
  UploadQueueManager manager(store, chunkup::test::small_config(1000), logger);
  auto id = manager.enqueue(make_memory_file("r1", "resume.bin", content));
  if(!expect(manager.wait_idle(20s), "queue drains")) return false;
  std::set<std::string> indexes;
  for(const auto& up : server.uploads()) {
    for(const auto& field : up.fields) {
      if(field.name == "chunkIndex") indexes.insert(field.data);
    }
  }
  return expect(manager.snapshot(id)->state.phase == UploadPhase::Succeeded, "resumed upload Succeeded") &&
         expect(indexes == std::set<std::string>({"1", "2"}), "only missing chunks sent") &&
         expect(server.assembled(fp) == content, "assembled bytes match");
}

struct TestCase {
  const char* name;
  std::function<bool(TestContext&)> fn;
};

} // namespace

int main(int argc, char** argv) {
  bool verbose = (std::getenv("CHUNKUP_TEST_VERBOSE") != nullptr);
  for(int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if(arg == "-v" || arg == "--verbose") {
      verbose = true;
    }
  }

  bool show_logs = (std::getenv("CHUNKUP_TEST_LOGS") != nullptr) || verbose;
  const bool suppress_logs = !show_logs;
  init(verbose);
  if(suppress_logs) {
    set_log_passthrough(false);
  }
  chunkup::test::LogCapture logs;
  TestContext ctx{logs, verbose};
  std::vector<TestCase> tests = {
    {"protocol_bodies", test_protocol_bodies},
    {"ping", test_ping},
    {"check_lists_received_chunks", test_check_lists_received_chunks},
    {"upload_chunk_sends_form", test_upload_chunk_sends_form},
    {"server_errors", test_server_errors},
    {"network_error", test_network_error},
    {"cancel_aborts_request", test_cancel_aborts_request},
    {"pipeline_over_http", test_pipeline_over_http},
    {"resume_over_http", test_resume_over_http},
  };

  std::size_t failures = 0;
  std::cout << "Running " << tests.size() << " http store tests: " << std::flush;

  for(std::size_t idx = 0; idx < tests.size(); ++idx) {
    const auto& test = tests[idx];
    logs.clear();
    bool passed = false;
    try {
      passed = test.fn(ctx);
    } catch(const std::exception& e) {
      passed = false;
      std::cerr << "Exception in test " << test.name << ": " << e.what() << "\n";
    }
    logs.detach_all();
    if(passed) {
      std::cout << '.' << std::flush;
    } else {
      std::cout << 'F' << " (" << test.name << ")\n";
      failures++;
      for(const auto& line : logs.snapshot()) {
        std::cout << "    " << line << "\n";
      }
      if(idx + 1 < tests.size()) {
        std::cout << "Running " << tests.size() << " http store tests: " << std::flush;
      }
    }
  }
  std::cout << "\n";
  if(suppress_logs) {
    set_log_passthrough(true);
  }
  if(failures == 0) {
    std::cout << "PASS (" << tests.size() << " tests)\n";
    return 0;
  }
  std::cout << "FAIL (" << failures << "/" << tests.size() << " failed)\n";
  return 1;
}
