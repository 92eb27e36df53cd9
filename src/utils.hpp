#pragma once
#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

std::string hex_from_bytes(const std::vector<unsigned char>&);
std::vector<unsigned char> sha256_bytes(const std::string &data);
std::string sha256_hex(const std::string &data);

// Absolute page URL for a server-relative path; absolute URLs pass through.
std::string resolve_page_url(const std::string& server_url, const std::string& path);

// Memory cache key for a page image, stable across processes.
std::string image_cache_key(const std::string& server_url, const std::string& path);

double clamp_fraction(double value);

int64_t to_epoch_ms(std::chrono::system_clock::time_point tp);
std::chrono::system_clock::time_point from_epoch_ms(int64_t ms);
// Drops precision below what to_epoch_ms keeps.
std::chrono::system_clock::time_point truncate_to_ms(std::chrono::system_clock::time_point tp);
