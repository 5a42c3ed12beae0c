#include "protocol.hpp"
#include "utils.hpp"

namespace {

void put_u32(std::string& out, uint32_t value) {
  out.push_back(static_cast<char>((value >> 24) & 0xFF));
  out.push_back(static_cast<char>((value >> 16) & 0xFF));
  out.push_back(static_cast<char>((value >> 8) & 0xFF));
  out.push_back(static_cast<char>(value & 0xFF));
}

uint32_t get_u32(const unsigned char* p) {
  return (static_cast<uint32_t>(p[0]) << 24) |
         (static_cast<uint32_t>(p[1]) << 16) |
         (static_cast<uint32_t>(p[2]) << 8) |
         static_cast<uint32_t>(p[3]);
}

} // namespace

std::string encode_frame(const std::string& payload){
  std::string out;
  out.reserve(kFrameHeaderBytes + payload.size());
  put_u32(out, static_cast<uint32_t>(payload.size()));
  out += payload;
  return out;
}

int32_t decode_frame_length(const unsigned char* header){
  return static_cast<int32_t>(get_u32(header));
}

bool is_control_payload(const std::string& payload){
  return !payload.empty() && payload.front() == '{';
}

std::string field_string(const json& doc, const char* key, const std::string& fallback){
  if(!doc.is_object()) return fallback;
  auto it = doc.find(key);
  if(it == doc.end() || !it->is_string()) return fallback;
  return it->get<std::string>();
}

bool field_bool(const json& doc, const char* key, bool fallback){
  if(!doc.is_object()) return fallback;
  auto it = doc.find(key);
  if(it == doc.end() || !it->is_boolean()) return fallback;
  return it->get<bool>();
}

int64_t field_int(const json& doc, const char* key, int64_t fallback){
  if(!doc.is_object()) return fallback;
  auto it = doc.find(key);
  if(it == doc.end() || !it->is_number_integer()) return fallback;
  if(it->is_number_unsigned()) {
    auto value = it->get<uint64_t>();
    return value > static_cast<uint64_t>(INT64_MAX) ? fallback : static_cast<int64_t>(value);
  }
  return it->get<int64_t>();
}

json make_hello(const std::string& node_id,
                const std::string& node_name,
                const std::string& transport,
                const std::set<std::string>& capabilities){
  json j;
  j["type"] = kMsgHello;
  j["node_id"] = node_id;
  j["node_name"] = node_name;
  j["transport"] = transport;
  j["capabilities"] = capabilities;
  return j;
}

json make_ping(){
  json j;
  j["type"] = kMsgPing;
  j["time"] = unix_time_seconds();
  return j;
}

json make_pong(){
  json j;
  j["type"] = kMsgPong;
  j["time"] = unix_time_seconds();
  return j;
}

json make_bye(const std::string& node_id){
  json j;
  j["type"] = kMsgBye;
  j["node_id"] = node_id;
  return j;
}

json make_discover_message(const std::string& type,
                           const std::string& node_id,
                           const std::string& node_name,
                           uint16_t port,
                           const std::set<std::string>& capabilities){
  json j;
  j["type"] = type;
  j["node_id"] = node_id;
  j["node_name"] = node_name;
  j["port"] = port;
  j["capabilities"] = capabilities;
  return j;
}

json make_data_transfer(const std::string& op, const std::string& file_id){
  json j;
  j["type"] = kMsgDataTransfer;
  j["op"] = op;
  j["file_id"] = file_id;
  return j;
}

json make_route_advert(const std::string& origin, const json& routes){
  json j;
  j["type"] = kMsgMeshRoute;
  j["origin"] = origin;
  j["routes"] = routes;
  return j;
}

std::string encode_chunk_frame(const std::string& file_id,
                               uint32_t index,
                               const char* data,
                               std::size_t size){
  std::string out;
  out.reserve(2 + 2 + file_id.size() + 4 + size);
  out.push_back(static_cast<char>(kChunkFrameMagic));
  out.push_back(static_cast<char>(kChunkFrameVersion));
  out.push_back(static_cast<char>((file_id.size() >> 8) & 0xFF));
  out.push_back(static_cast<char>(file_id.size() & 0xFF));
  out += file_id;
  put_u32(out, index);
  out.append(data, size);
  return out;
}

bool decode_chunk_frame(const std::string& payload, ChunkFrame& out){
  const auto* p = reinterpret_cast<const unsigned char*>(payload.data());
  if(payload.size() < 4) return false;
  if(p[0] != kChunkFrameMagic || p[1] != kChunkFrameVersion) return false;
  std::size_t id_len = (static_cast<std::size_t>(p[2]) << 8) | p[3];
  std::size_t header = 4 + id_len + 4;
  if(payload.size() < header) return false;
  out.file_id.assign(payload.data() + 4, id_len);
  out.index = get_u32(p + 4 + id_len);
  out.data.assign(payload.data() + header, payload.size() - header);
  return true;
}
