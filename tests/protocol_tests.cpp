#include "chunk_manifest.hpp"
#include "command_line_parser.hpp"
#include "errors.hpp"
#include "mesh_config.hpp"
#include "protocol.hpp"
#include "settings_manager.hpp"
#include "test_runner_utils.hpp"
#include "utils.hpp"

#include <nlohmann/json.hpp>

#include <iostream>
#include <limits>
#include <string>
#include <vector>

namespace {

using meshshare::test::TestCase;
using meshshare::test::TestContext;
using meshshare::test::throws_code;

bool test_frame_header_is_big_endian(TestContext&) {
  auto frame = encode_frame("abc");
  const auto* p = reinterpret_cast<const unsigned char*>(frame.data());
  bool ok = frame.size() == kFrameHeaderBytes + 3 &&
            p[0] == 0 && p[1] == 0 && p[2] == 0 && p[3] == 3 &&
            frame.substr(kFrameHeaderBytes) == "abc";

  const unsigned char big[4] = {0x00, 0x01, 0x02, 0x03};
  const unsigned char negative[4] = {0xff, 0xff, 0xff, 0xfe};
  ok = ok && decode_frame_length(big) == 0x00010203;
  ok = ok && decode_frame_length(negative) == -2;
  return ok;
}

bool test_control_payload_detection(TestContext&) {
  return is_control_payload("{\"type\":\"PING\"}") &&
         !is_control_payload("") &&
         !is_control_payload(std::string(1, static_cast<char>(kChunkFrameMagic)) + "{");
}

bool test_chunk_frame_carries_file_and_index(TestContext&) {
  std::string data = "\x00\x01{binary}\xff";
  auto payload = encode_chunk_frame("f00d", 42, data.data(), data.size());
  ChunkFrame frame;
  bool ok = !is_control_payload(payload) && decode_chunk_frame(payload, frame);
  ok = ok && frame.file_id == "f00d" && frame.index == 42 && frame.data == data;

  ChunkFrame ignored;
  ok = ok && !decode_chunk_frame("{\"type\":\"PING\"}", ignored);
  ok = ok && !decode_chunk_frame(payload.substr(0, 5), ignored);
  return ok;
}

bool test_chunk_layout_of_ten_and_a_half_megabytes(TestContext&) {
  const uint64_t size = 10500000;
  const uint64_t chunk = 1024 * 1024;
  auto chunks = plan_chunks(size, chunk);
  if(chunk_count(size, chunk) != 11 || chunks.size() != 11) return false;
  uint64_t total = 0;
  for(std::size_t i = 0; i < chunks.size(); ++i) {
    if(chunks[i].index != i || chunks[i].offset != i * chunk) return false;
    total += chunks[i].size;
  }
  return chunks[10].offset == 10485760 &&
         chunks[10].size == 14240 &&
         chunks[9].size == chunk &&
         total == size;
}

bool test_chunk_layout_edges(TestContext&) {
  bool ok = chunk_count(0, 1024) == 0 && plan_chunks(0, 1024).empty();
  ok = ok && chunk_count(1024, 1024) == 1;
  ok = ok && chunk_count(1025, 1024) == 2;
  ok = ok && throws_code([]{ chunk_count(10, 0); }, ErrorCode::Configuration);

  const uint64_t max = std::numeric_limits<uint64_t>::max();
  ok = ok && chunk_count(max, 1024) == max / 1024 + 1;
  ok = ok && chunk_count(max, max) == 1;
  ok = ok && chunk_count(max - 1, 2) == max / 2;
  return ok;
}

bool test_field_readers_tolerate_wrong_types(TestContext&) {
  auto hello = nlohmann::json::parse("{\"type\":\"HELLO\",\"node_id\":5}");
  auto transfer = nlohmann::json::parse("{\"type\":\"DATA_TRANSFER\",\"op\":7,\"ok\":\"yes\"}");
  auto discover = nlohmann::json::parse("{\"type\":\"DISCOVER\",\"port\":\"9000\"}");
  auto route = nlohmann::json::parse("{\"hop_count\":\"x\",\"quality\":70}");
  return field_string(hello, "node_id") == "" &&
         field_string(hello, "type") == kMsgHello &&
         field_string(transfer, "op", "none") == "none" &&
         field_bool(transfer, "ok", false) == false &&
         field_int(discover, "port", 0) == 0 &&
         field_int(route, "hop_count", 1) == 1 &&
         field_int(route, "quality", 0) == 70 &&
         field_string(nlohmann::json::array(), "type", "x") == "x";
}

bool test_manifest_chunk_count_checked_before_layout(TestContext&) {
  auto doc = make_data_transfer("manifest", "huge");
  doc["file_name"] = "huge.bin";
  doc["file_size"] = uint64_t(1) << 40;
  doc["chunk_size"] = 1;
  doc["chunks"] = nlohmann::json::array();
  std::string detail;
  bool ok = throws_code([&]{ manifest_from_json(doc); }, ErrorCode::ProtocolViolation, &detail);
  return ok && detail.find("expected 1099511627776 chunks, got 0") != std::string::npos;
}

bool test_manifest_round_trip_and_validation(TestContext&) {
  auto dir = meshshare::test::scratch_dir("manifest");
  auto path = dir / "sample.bin";
  meshshare::test::write_random_file(path, 2500);

  auto info = build_manifest(path, 1000, "abcd");
  bool ok = info.file_id == "abcd" && info.total_chunks == 3 && info.file_size == 2500;
  ok = ok && info.chunks[0].checksum == sha256_file_range(path, 0, 1000);
  ok = ok && info.chunks[0].checksum.size() == 64;

  auto doc = make_data_transfer("manifest", info.file_id);
  doc.update(manifest_to_json(info));
  auto parsed = manifest_from_json(doc);
  ok = ok && parsed.file_name == "sample.bin" && parsed.total_chunks == 3 &&
       parsed.chunks[2].size == 500 && parsed.chunks[2].checksum == info.chunks[2].checksum;

  auto shifted = doc;
  shifted["chunks"][1]["offset"] = 999;
  ok = ok && throws_code([&]{ manifest_from_json(shifted); }, ErrorCode::ProtocolViolation);

  auto short_list = doc;
  short_list["chunks"].erase(2);
  ok = ok && throws_code([&]{ manifest_from_json(short_list); }, ErrorCode::ProtocolViolation);

  auto bad_checksum = doc;
  bad_checksum["chunks"][0]["checksum"] = "XYZ";
  ok = ok && throws_code([&]{ manifest_from_json(bad_checksum); }, ErrorCode::ProtocolViolation);

  auto no_id = doc;
  no_id.erase("file_id");
  ok = ok && throws_code([&]{ manifest_from_json(no_id); }, ErrorCode::ProtocolViolation);

  ok = ok && throws_code([&]{ build_manifest(dir / "missing.bin", 1000); }, ErrorCode::TransferFailed);
  return ok;
}

bool test_safe_file_name_strips_directories(TestContext&) {
  return safe_file_name("../../etc/passwd") == "passwd" &&
         safe_file_name("report.pdf") == "report.pdf" &&
         safe_file_name("nested/dir/a.txt") == "a.txt" &&
         throws_code([]{ safe_file_name(".."); }, ErrorCode::ProtocolViolation) &&
         throws_code([]{ safe_file_name(""); }, ErrorCode::ProtocolViolation);
}

bool test_sha256_known_vector(TestContext&) {
  return sha256_hex("abc") ==
         "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad";
}

bool test_command_line_sets_settings(TestContext&) {
  SettingsManager settings;
  CommandLineParser parser;
  std::vector<std::string> args = {"meshshare", "--listen_port", "9100", "-v",
                                   "--relay_servers=r1.example:9100,r2.example:9200",
                                   "--enable_bluetooth", "false", "bob", "notes.txt"};
  std::vector<char*> argv;
  for(auto& a : args) argv.push_back(a.data());
  parser.parse(static_cast<int>(argv.size()), argv.data(), settings);

  auto relays = settings.get<std::vector<std::string>>("relay_servers");
  return settings.get<long long>("listen_port") == 9100 &&
         settings.get<bool>("verbose") &&
         !settings.get<bool>("enable_bluetooth") &&
         relays.size() == 2 && relays[1] == "r2.example:9200" &&
         settings.get<std::string>("send_to") == "bob" &&
         settings.get<std::string>("send_file") == "notes.txt";
}

bool test_command_line_rejects_unknown_options(TestContext&) {
  SettingsManager settings;
  CommandLineParser parser;
  std::vector<std::string> unknown = {"meshshare", "--no_such_option", "1"};
  std::vector<std::string> out_of_range = {"meshshare", "--listen_port", "70000"};
  auto run = [&](std::vector<std::string>& args){
    std::vector<char*> argv;
    for(auto& a : args) argv.push_back(a.data());
    parser.parse(static_cast<int>(argv.size()), argv.data(), settings);
  };
  return throws_code([&]{ run(unknown); }, ErrorCode::Configuration) &&
         throws_code([&]{ run(out_of_range); }, ErrorCode::Configuration);
}

bool test_config_validation(TestContext&) {
  SettingsManager settings;
  auto config = MeshConfig::from_settings(settings);
  bool ok = config.listen_port == 9000 && config.discovery_port == 9876 &&
            config.effective_discovery_target_port() == 9876 &&
            config.transfer.chunk_size == 1024 * 1024 &&
            config.transfer.parallelism == 5 &&
            config.transfer.retry_count == 3 &&
            !config.relay_servers.empty();

  auto no_transport = config;
  no_transport.enable_tcp = no_transport.enable_wifi_direct = false;
  no_transport.enable_bluetooth = no_transport.enable_relay = false;
  ok = ok && throws_code([&]{ no_transport.validate(); }, ErrorCode::Configuration);

  auto oversized_chunk = config;
  oversized_chunk.max_frame_bytes = 4096;
  ok = ok && throws_code([&]{ oversized_chunk.validate(); }, ErrorCode::Configuration);

  auto bad_relay = config;
  bad_relay.relay_servers = {"no-port-here"};
  ok = ok && throws_code([&]{ bad_relay.validate(); }, ErrorCode::Configuration);
  return ok;
}

bool test_settings_persist_only_persistent_keys(TestContext&) {
  auto dir = meshshare::test::scratch_dir("settings");
  SettingsManager settings;
  settings.set_settings_path(dir / ".config" / "settings.json");
  std::string error;
  bool ok = settings.set_from_string("node_name", "kitchen", error);
  ok = ok && settings.set_from_string("send_to", "bob", error);
  ok = ok && settings.save();

  SettingsManager reloaded;
  reloaded.set_settings_path(dir / ".config" / "settings.json");
  ok = ok && reloaded.load();
  return ok && reloaded.get<std::string>("node_name") == "kitchen" &&
         reloaded.get<std::string>("send_to").empty();
}

} // namespace

int main(int argc, char** argv) {
  std::vector<TestCase> tests = {
    {"frame_header_is_big_endian", test_frame_header_is_big_endian},
    {"control_payload_detection", test_control_payload_detection},
    {"chunk_frame_carries_file_and_index", test_chunk_frame_carries_file_and_index},
    {"chunk_layout_of_ten_and_a_half_megabytes", test_chunk_layout_of_ten_and_a_half_megabytes},
    {"chunk_layout_edges", test_chunk_layout_edges},
    {"field_readers_tolerate_wrong_types", test_field_readers_tolerate_wrong_types},
    {"manifest_chunk_count_checked_before_layout", test_manifest_chunk_count_checked_before_layout},
    {"manifest_round_trip_and_validation", test_manifest_round_trip_and_validation},
    {"safe_file_name_strips_directories", test_safe_file_name_strips_directories},
    {"sha256_known_vector", test_sha256_known_vector},
    {"command_line_sets_settings", test_command_line_sets_settings},
    {"command_line_rejects_unknown_options", test_command_line_rejects_unknown_options},
    {"config_validation", test_config_validation},
    {"settings_persist_only_persistent_keys", test_settings_persist_only_persistent_keys}
  };
  return meshshare::test::run_tests("protocol", tests, argc, argv);
}
