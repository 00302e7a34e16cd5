#include "utils.hpp"
#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>
#include <unordered_map>

std::string hex_from_bytes(const std::vector<unsigned char>& b){
    std::ostringstream oss;
    for(auto c: b) oss << std::hex << std::setw(2) << std::setfill('0') << (int)c;
    return oss.str();
}

std::string format_bytes(uint64_t bytes){
    static const char* units[] = {"B", "KB", "MB", "GB", "TB", "PB"};

    int unit_index = 0;
    uint64_t scale = 1ULL;
    while(unit_index < 5 && bytes >= scale * 1024ULL) {
        scale *= 1024ULL;
        ++unit_index;
    }

    double in_unit = static_cast<double>(bytes) / static_cast<double>(scale);

    std::ostringstream oss;
    oss.setf(std::ios::fixed);
    if(unit_index == 0) {
        oss.precision(0);
    } else {
        oss.precision(in_unit < 10.0 ? 2 : (in_unit < 100.0 ? 1 : 0));
    }
    oss << in_unit << ' ' << units[unit_index];
    return oss.str();
}

std::string format_rate(double bytes_per_sec){
    if(bytes_per_sec <= 0.0) return "0 B/s";
    return format_bytes(static_cast<uint64_t>(bytes_per_sec)) + "/s";
}

std::string to_lower_copy(std::string value){
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char ch){ return static_cast<char>(std::tolower(ch)); });
    return value;
}

std::string guess_mime_type(const std::filesystem::path& path){
    static const std::unordered_map<std::string, std::string> by_extension = {
        {".txt", "text/plain"},
        {".json", "application/json"},
        {".pdf", "application/pdf"},
        {".zip", "application/zip"},
        {".gz", "application/gzip"},
        {".tar", "application/x-tar"},
        {".png", "image/png"},
        {".jpg", "image/jpeg"},
        {".jpeg", "image/jpeg"},
        {".gif", "image/gif"},
        {".webp", "image/webp"},
        {".mp4", "video/mp4"},
        {".mov", "video/quicktime"},
        {".mp3", "audio/mpeg"},
        {".wav", "audio/wav"},
    };
    auto it = by_extension.find(to_lower_copy(path.extension().string()));
    if(it == by_extension.end()) return "application/octet-stream";
    return it->second;
}
