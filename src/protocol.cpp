#include "protocol.hpp"

json make_check_request(const std::string& hash,
                        const std::string& filename,
                        uint64_t file_size) {
    json j;
    j["hash"] = hash;
    j["filename"] = filename;
    j["fileSize"] = file_size;
    return j;
}

json make_merge_request(const std::string& hash,
                        const std::string& filename,
                        uint64_t size,
                        uint32_t total_chunks) {
    json j;
    j["hash"] = hash;
    j["filename"] = filename;
    j["size"] = size;
    j["totalChunks"] = total_chunks;
    return j;
}

CheckResult parse_check_response(const std::string& body) {
    auto j = json::parse(body);
    CheckResult result;
    result.already_complete = j.value("uploaded", false);
    result.url = j.value("url", "");
    if(j.contains("uploaded_chunks") && j["uploaded_chunks"].is_array()) {
        for(const auto& index : j["uploaded_chunks"]) {
            // Stray non-numeric entries in the chunk directory are not chunks.
            if(index.is_number_unsigned() || (index.is_number_integer() && index.get<int64_t>() >= 0)) {
                result.received_chunk_indexes.push_back(index.get<uint32_t>());
            }
        }
    }
    return result;
}

MergeResult parse_merge_response(const std::string& body) {
    MergeResult result;
    if(body.empty()) return result;
    auto j = json::parse(body, nullptr, false);
    if(j.is_object()) result.url = j.value("url", "");
    return result;
}

std::string error_message_from_body(const std::string& body) {
    auto j = json::parse(body, nullptr, false);
    if(j.is_object() && j.contains("error") && j["error"].is_string()) {
        return j["error"].get<std::string>();
    }
    return body;
}
