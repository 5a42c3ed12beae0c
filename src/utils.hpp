#pragma once
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

std::string hex_from_bytes(const unsigned char* data, std::size_t size);
std::string sha256_hex(const std::string &data);
std::string sha256_hex(const char* data, std::size_t size);

// Hashes exactly `size` bytes of `path` starting at `offset`. Throws
// MeshError(TransferFailed) when the range cannot be read in full.
std::string sha256_file_range(const std::filesystem::path& path, uint64_t offset, uint64_t size);

std::string random_hex(std::size_t bytes);
std::string generate_node_id();

std::string to_lower(std::string value);
bool iequals(const std::string& a, const std::string& b);
std::string trim_copy(std::string value);

std::string format_bytes(uint64_t bytes);
std::vector<std::string> local_ipv4_addresses();
int64_t unix_time_seconds();

// "host:port" -> pair; returns false when the port is missing or not numeric.
bool split_host_port(const std::string& address, std::string& host, uint16_t& port);
