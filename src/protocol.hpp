#pragma once
#include <nlohmann/json.hpp>
#include <cstdint>
#include <set>
#include <string>

using json = nlohmann::json;

// Framing: 4-byte big-endian length, then exactly that many payload bytes.
inline constexpr std::size_t kFrameHeaderBytes = 4;
inline constexpr uint32_t kDefaultMaxFrameBytes = 100u * 1024u * 1024u;

// Control document types.
inline constexpr const char* kMsgHello = "HELLO";
inline constexpr const char* kMsgPing = "PING";
inline constexpr const char* kMsgPong = "PONG";
inline constexpr const char* kMsgBye = "BYE";
inline constexpr const char* kMsgDataTransfer = "DATA_TRANSFER";
inline constexpr const char* kMsgMeshRoute = "MESH_ROUTE";

// UDP discovery datagrams (TCP transport).
inline constexpr const char* kMsgDiscover = "DISCOVER";
inline constexpr const char* kMsgDiscoverResponse = "DISCOVER_RESPONSE";

// Relay rendezvous.
inline constexpr const char* kMsgRelayRegister = "RELAY_REGISTER";
inline constexpr const char* kMsgRelayList = "RELAY_LIST";
inline constexpr const char* kMsgRelayPeers = "RELAY_PEERS";
inline constexpr const char* kMsgRelayConnect = "RELAY_CONNECT";
inline constexpr const char* kMsgRelayIncoming = "RELAY_INCOMING";
inline constexpr const char* kMsgRelayAccept = "RELAY_ACCEPT";
inline constexpr const char* kMsgRelayOk = "RELAY_OK";
inline constexpr const char* kMsgRelayError = "RELAY_ERROR";

// Binary chunk payloads start with this byte, never with '{'.
inline constexpr unsigned char kChunkFrameMagic = 0xC4;
inline constexpr unsigned char kChunkFrameVersion = 1;

std::string encode_frame(const std::string& payload);
// Signed on purpose: prefixes with the high bit set read as negative lengths.
int32_t decode_frame_length(const unsigned char* header);

bool is_control_payload(const std::string& payload);

// Field readers for documents received from the network. A missing field or
// one of the wrong type yields `fallback`; they never throw.
std::string field_string(const json& doc, const char* key, const std::string& fallback = std::string());
bool field_bool(const json& doc, const char* key, bool fallback);
int64_t field_int(const json& doc, const char* key, int64_t fallback);

json make_hello(const std::string& node_id,
                const std::string& node_name,
                const std::string& transport,
                const std::set<std::string>& capabilities);
json make_ping();
json make_pong();
json make_bye(const std::string& node_id);

json make_discover_message(const std::string& type,
                           const std::string& node_id,
                           const std::string& node_name,
                           uint16_t port,
                           const std::set<std::string>& capabilities);

json make_data_transfer(const std::string& op, const std::string& file_id);
json make_route_advert(const std::string& origin, const json& routes);

struct ChunkFrame {
  std::string file_id;
  uint32_t index = 0;
  std::string data;
};

std::string encode_chunk_frame(const std::string& file_id,
                               uint32_t index,
                               const char* data,
                               std::size_t size);
bool decode_chunk_frame(const std::string& payload, ChunkFrame& out);
