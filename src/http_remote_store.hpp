#pragma once

#include <memory>
#include <string>

#include "http_client.hpp"
#include "log.hpp"
#include "remote_store.hpp"

// RemoteStore over the check/upload/merge HTTP endpoints.
class HttpRemoteStore : public RemoteStore {
public:
  struct Options {
    std::string base_url = "http://localhost:3001";
    long request_timeout_seconds = 0; // 0 = no timeout
  };

  explicit HttpRemoteStore(Options options, std::shared_ptr<Logger> logger = nullptr);

  CheckResult check(const std::string& fingerprint,
                    const std::string& filename,
                    uint64_t size,
                    const CancellationHandle& cancel) override;

  void upload_chunk(const std::string& fingerprint,
                    const std::string& filename,
                    uint32_t chunk_index,
                    uint32_t total_chunks,
                    const std::vector<char>& bytes,
                    const ChunkProgress& on_progress,
                    const CancellationHandle& cancel) override;

  MergeResult merge(const std::string& fingerprint,
                    const std::string& filename,
                    uint64_t size,
                    uint32_t total_chunks,
                    const CancellationHandle& cancel) override;

  bool ping(const CancellationHandle& cancel) override;

  const Options& options() const { return options_; }

private:
  HttpClient make_client(const CancellationHandle& cancel) const;
  std::string endpoint(const char* path) const;
  HttpClient::Response post_json(const char* path,
                                 const std::string& body,
                                 const CancellationHandle& cancel) const;

  Options options_;
  std::shared_ptr<Logger> logger_;
};
