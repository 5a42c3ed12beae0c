#include "chunk_manifest.hpp"

#include <algorithm>
#include <cctype>
#include <system_error>

#include "errors.hpp"
#include "utils.hpp"

namespace {

bool is_sha256_hex(const std::string& value) {
  if(value.size() != 64) return false;
  return std::all_of(value.begin(), value.end(), [](unsigned char c){
    return std::isdigit(c) || (c >= 'a' && c <= 'f');
  });
}

} // namespace

std::size_t chunk_count(uint64_t file_size, uint64_t chunk_size) {
  if(chunk_size == 0) {
    throw MeshError(ErrorCode::Configuration, "chunk size must be greater than zero");
  }
  return static_cast<std::size_t>(file_size / chunk_size + (file_size % chunk_size != 0 ? 1 : 0));
}

std::vector<ChunkInfo> plan_chunks(uint64_t file_size, uint64_t chunk_size) {
  std::size_t total = chunk_count(file_size, chunk_size);
  std::vector<ChunkInfo> chunks(total);
  for(std::size_t i = 0; i < total; ++i) {
    chunks[i].index = i;
    chunks[i].offset = static_cast<uint64_t>(i) * chunk_size;
    chunks[i].size = std::min<uint64_t>(chunk_size, file_size - chunks[i].offset);
  }
  return chunks;
}

FileTransferInfo build_manifest(const std::filesystem::path& path,
                                uint64_t chunk_size,
                                std::string file_id) {
  std::error_code ec;
  if(!std::filesystem::is_regular_file(path, ec)) {
    throw MeshError(ErrorCode::TransferFailed, path.string() + " is not a readable file");
  }
  auto size = std::filesystem::file_size(path, ec);
  if(ec) {
    throw MeshError(ErrorCode::TransferFailed, "cannot stat " + path.string() + ": " + ec.message());
  }

  FileTransferInfo info;
  info.file_id = file_id.empty() ? random_hex(8) : std::move(file_id);
  info.file_name = path.filename().string();
  info.file_path = path.string();
  info.file_size = size;
  info.chunk_size = chunk_size;
  info.chunks = plan_chunks(size, chunk_size);
  info.total_chunks = info.chunks.size();
  for(auto& chunk : info.chunks) {
    chunk.checksum = sha256_file_range(path, chunk.offset, chunk.size);
  }
  return info;
}

nlohmann::json manifest_to_json(const FileTransferInfo& info) {
  nlohmann::json j;
  j["file_name"] = info.file_name;
  j["file_size"] = info.file_size;
  j["chunk_size"] = info.chunk_size;
  nlohmann::json chunks = nlohmann::json::array();
  for(const auto& chunk : info.chunks) {
    chunks.push_back({{"index", chunk.index},
                      {"offset", chunk.offset},
                      {"size", chunk.size},
                      {"checksum", chunk.checksum}});
  }
  j["chunks"] = std::move(chunks);
  return j;
}

FileTransferInfo manifest_from_json(const nlohmann::json& doc) {
  auto violation = [](const std::string& what){
    return MeshError(ErrorCode::ProtocolViolation, "bad manifest: " + what);
  };
  if(!doc.is_object()) throw violation("not an object");

  FileTransferInfo info;
  try {
    info.file_id = doc.at("file_id").get<std::string>();
    info.file_name = doc.at("file_name").get<std::string>();
    info.file_size = doc.at("file_size").get<uint64_t>();
    info.chunk_size = doc.at("chunk_size").get<uint64_t>();
  } catch(const nlohmann::json::exception& e) {
    throw violation(e.what());
  }
  if(info.file_id.empty()) throw violation("empty file_id");
  if(info.chunk_size == 0) throw violation("chunk_size is zero");

  if(!doc.contains("chunks") || !doc["chunks"].is_array()) throw violation("missing chunks");
  const auto& chunks = doc["chunks"];
  // Count first: the declared sizes alone must not drive an allocation.
  auto declared = chunk_count(info.file_size, info.chunk_size);
  if(chunks.size() != declared) {
    throw violation("expected " + std::to_string(declared) + " chunks, got " +
                    std::to_string(chunks.size()));
  }
  auto expected = plan_chunks(info.file_size, info.chunk_size);
  for(std::size_t i = 0; i < chunks.size(); ++i) {
    ChunkInfo chunk;
    try {
      chunk.index = chunks[i].at("index").get<std::size_t>();
      chunk.offset = chunks[i].at("offset").get<uint64_t>();
      chunk.size = chunks[i].at("size").get<uint64_t>();
      chunk.checksum = chunks[i].at("checksum").get<std::string>();
    } catch(const nlohmann::json::exception& e) {
      throw violation(e.what());
    }
    if(chunk.index != expected[i].index ||
       chunk.offset != expected[i].offset ||
       chunk.size != expected[i].size) {
      throw violation("chunk " + std::to_string(i) + " does not match the layout");
    }
    if(!is_sha256_hex(chunk.checksum)) {
      throw violation("chunk " + std::to_string(i) + " has a malformed checksum");
    }
    info.chunks.push_back(std::move(chunk));
  }
  info.total_chunks = info.chunks.size();
  return info;
}

std::string safe_file_name(const std::string& name) {
  auto leaf = std::filesystem::path(name).filename().string();
  if(leaf.empty() || leaf == "." || leaf == "..") {
    throw MeshError(ErrorCode::ProtocolViolation, "unusable file name '" + name + "'");
  }
  return leaf;
}
