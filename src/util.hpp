#pragma once
#include <string>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace ledgerchat {

// ISO 8601 timestamp
std::string timestamp_now();

// Unix epoch seconds
uint64_t epoch_seconds();

// Trim whitespace
std::string trim(const std::string& s);

// ASCII lowercase
std::string to_lower(std::string s);

// Generate a simple unique ID (hex)
std::string generate_id();

// Estimate token count from text (~4 chars per token)
uint32_t estimate_tokens(const std::string& text);

// Field readers for JSON from peers. A missing key, a null value or a value
// of another type yields the fallback instead of throwing.
std::string json_string(const nlohmann::json& obj, const char* key,
                        const std::string& fallback = "");
bool json_bool(const nlohmann::json& obj, const char* key, bool fallback = false);
uint32_t json_uint(const nlohmann::json& obj, const char* key, uint32_t fallback = 0);

// Expand ~ to home directory
std::string expand_home(const std::string& path);

// Write via a temp file + rename, creating parent directories.
// Returns false if any step failed.
bool atomic_write_file(const std::string& path, const std::string& content);

} // namespace ledgerchat
