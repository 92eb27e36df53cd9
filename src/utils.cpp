#include "utils.hpp"
#include <openssl/sha.h>
#include <algorithm>
#include <cmath>
#include <sstream>
#include <iomanip>

std::string hex_from_bytes(const std::vector<unsigned char>& b){
    std::ostringstream oss;
    for(auto c: b) oss << std::hex << std::setw(2) << std::setfill('0') << (int)c;
    return oss.str();
}

std::vector<unsigned char> sha256_bytes(const std::string &data){
    std::vector<unsigned char> out(SHA256_DIGEST_LENGTH);
    SHA256((const unsigned char*)data.data(), data.size(), out.data());
    return out;
}

std::string sha256_hex(const std::string &data){
    return hex_from_bytes(sha256_bytes(data));
}

std::string resolve_page_url(const std::string& server_url, const std::string& path){
    if(path.rfind("http://", 0) == 0 || path.rfind("https://", 0) == 0) return path;
    std::string base = server_url;
    while(!base.empty() && base.back() == '/') base.pop_back();
    if(path.empty()) return base;
    if(path.front() == '/') return base + path;
    return base + "/" + path;
}

std::string image_cache_key(const std::string& server_url, const std::string& path){
    return sha256_hex(resolve_page_url(server_url, path));
}

double clamp_fraction(double value){
    if(std::isnan(value)) return 0.0;
    return std::min(1.0, std::max(0.0, value));
}

int64_t to_epoch_ms(std::chrono::system_clock::time_point tp){
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

std::chrono::system_clock::time_point from_epoch_ms(int64_t ms){
    return std::chrono::system_clock::time_point(
        std::chrono::duration_cast<std::chrono::system_clock::duration>(std::chrono::milliseconds(ms)));
}

std::chrono::system_clock::time_point truncate_to_ms(std::chrono::system_clock::time_point tp){
    return from_epoch_ms(to_epoch_ms(tp));
}
