#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "transfer_types.hpp"

// ceil(file_size / chunk_size). Throws MeshError(Configuration) for a zero
// chunk size.
std::size_t chunk_count(uint64_t file_size, uint64_t chunk_size);

// Chunk layout without checksums: offset = index * chunk_size, the last chunk
// holds the remainder.
std::vector<ChunkInfo> plan_chunks(uint64_t file_size, uint64_t chunk_size);

// Hashes every chunk of `path` before anything is sent. An empty file_id is
// replaced by a random one.
FileTransferInfo build_manifest(const std::filesystem::path& path,
                                uint64_t chunk_size,
                                std::string file_id = "");

// Manifest fields of a DATA_TRANSFER manifest document.
nlohmann::json manifest_to_json(const FileTransferInfo& info);

// Parses and checks the layout (indices, offsets, sizes, checksum format).
// Throws MeshError(ProtocolViolation).
FileTransferInfo manifest_from_json(const nlohmann::json& doc);

// Final path component of a peer supplied name. Throws
// MeshError(ProtocolViolation) for names that would leave the destination.
std::string safe_file_name(const std::string& name);
