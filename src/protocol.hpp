#pragma once
#include <nlohmann/json.hpp>
#include <cstdint>
#include <string>

#include "remote_store.hpp"

using json = nlohmann::json;

// protocol.hpp: request/response bodies of the remote store endpoints
inline constexpr const char* kCheckPath = "/check";
inline constexpr const char* kUploadPath = "/upload";
inline constexpr const char* kMergePath = "/merge";
inline constexpr const char* kHashHeader = "X-File-Hash";
inline constexpr const char* kChunkIndexHeader = "X-Chunk-Index";

json make_check_request(const std::string& hash,
                        const std::string& filename,
                        uint64_t file_size);
json make_merge_request(const std::string& hash,
                        const std::string& filename,
                        uint64_t size,
                        uint32_t total_chunks);

// Throws json::exception on malformed bodies.
CheckResult parse_check_response(const std::string& body);
MergeResult parse_merge_response(const std::string& body);

// The store reports failures as {"error": "..."}; falls back to the raw body.
std::string error_message_from_body(const std::string& body);
