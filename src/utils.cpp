#include "utils.hpp"
#include "errors.hpp"

#include <openssl/evp.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <fstream>
#include <iomanip>
#include <memory>
#include <random>
#include <sstream>

#include <arpa/inet.h>
#include <ifaddrs.h>
#include <netinet/in.h>

namespace {

struct DigestContextDeleter {
  void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};
using DigestContext = std::unique_ptr<EVP_MD_CTX, DigestContextDeleter>;

DigestContext make_sha256_context() {
  DigestContext ctx(EVP_MD_CTX_new());
  if(!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
    throw std::runtime_error("EVP sha256 init failed");
  }
  return ctx;
}

std::string finish_hex(EVP_MD_CTX* ctx) {
  std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
  unsigned int length = 0;
  if(EVP_DigestFinal_ex(ctx, digest.data(), &length) != 1) {
    throw std::runtime_error("EVP sha256 final failed");
  }
  return hex_from_bytes(digest.data(), length);
}

} // namespace

std::string hex_from_bytes(const unsigned char* data, std::size_t size){
  std::ostringstream oss;
  for(std::size_t i = 0; i < size; ++i) {
    oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(data[i]);
  }
  return oss.str();
}

std::string sha256_hex(const char* data, std::size_t size){
  auto ctx = make_sha256_context();
  if(size > 0 && EVP_DigestUpdate(ctx.get(), data, size) != 1) {
    throw std::runtime_error("EVP sha256 update failed");
  }
  return finish_hex(ctx.get());
}

std::string sha256_hex(const std::string &data){
  return sha256_hex(data.data(), data.size());
}

std::string sha256_file_range(const std::filesystem::path& path, uint64_t offset, uint64_t size){
  std::ifstream in(path, std::ios::binary);
  if(!in) {
    throw MeshError(ErrorCode::TransferFailed, "cannot open " + path.string());
  }
  in.seekg(static_cast<std::streamoff>(offset), std::ios::beg);
  if(!in) {
    throw MeshError(ErrorCode::TransferFailed, "cannot seek " + path.string());
  }

  auto ctx = make_sha256_context();
  std::vector<char> buffer(64 * 1024);
  uint64_t remaining = size;
  while(remaining > 0) {
    auto want = static_cast<std::streamsize>(std::min<uint64_t>(remaining, buffer.size()));
    in.read(buffer.data(), want);
    auto got = in.gcount();
    if(got <= 0) {
      throw MeshError(ErrorCode::TransferFailed,
                      "short read hashing " + path.string() + " at offset " +
                      std::to_string(offset + (size - remaining)));
    }
    if(EVP_DigestUpdate(ctx.get(), buffer.data(), static_cast<std::size_t>(got)) != 1) {
      throw std::runtime_error("EVP sha256 update failed");
    }
    remaining -= static_cast<uint64_t>(got);
  }
  return finish_hex(ctx.get());
}

std::string random_hex(std::size_t bytes){
  static thread_local std::mt19937_64 rng(std::random_device{}());
  std::uniform_int_distribution<int> dist(0, 255);
  std::vector<unsigned char> raw(bytes);
  for(auto& b : raw) b = static_cast<unsigned char>(dist(rng));
  return hex_from_bytes(raw.data(), raw.size());
}

std::string generate_node_id(){
  auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(
    std::chrono::system_clock::now().time_since_epoch()).count();
  std::ostringstream oss;
  oss << "node-" << std::hex << nanos << "-" << random_hex(2);
  return oss.str();
}

std::string to_lower(std::string value){
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char ch){ return static_cast<char>(std::tolower(ch)); });
  return value;
}

bool iequals(const std::string& a, const std::string& b){
  if(a.size() != b.size()) return false;
  for(std::size_t i = 0; i < a.size(); ++i) {
    if(std::tolower(static_cast<unsigned char>(a[i])) !=
       std::tolower(static_cast<unsigned char>(b[i]))) {
      return false;
    }
  }
  return true;
}

std::string trim_copy(std::string value){
  value.erase(value.begin(), std::find_if(value.begin(), value.end(),
    [](unsigned char ch){ return !std::isspace(ch); }));
  value.erase(std::find_if(value.rbegin(), value.rend(),
    [](unsigned char ch){ return !std::isspace(ch); }).base(), value.end());
  return value;
}

std::string format_bytes(uint64_t bytes){
  constexpr uint64_t unit = 1024;
  if(bytes < unit) return std::to_string(bytes) + " B";
  uint64_t div = unit;
  int exp = 0;
  for(uint64_t n = bytes / unit; n >= unit; n /= unit) {
    div *= unit;
    ++exp;
  }
  std::ostringstream oss;
  oss << std::fixed << std::setprecision(1)
      << static_cast<double>(bytes) / static_cast<double>(div)
      << ' ' << "KMGTPE"[exp] << "iB";
  return oss.str();
}

std::vector<std::string> local_ipv4_addresses(){
  std::vector<std::string> out;
  ifaddrs* list = nullptr;
  if(getifaddrs(&list) != 0) return out;
  std::unique_ptr<ifaddrs, decltype(&freeifaddrs)> guard(list, &freeifaddrs);
  for(auto* it = list; it != nullptr; it = it->ifa_next) {
    if(!it->ifa_addr || it->ifa_addr->sa_family != AF_INET) continue;
    auto* sin = reinterpret_cast<sockaddr_in*>(it->ifa_addr);
    char buf[INET_ADDRSTRLEN] = {0};
    if(!inet_ntop(AF_INET, &sin->sin_addr, buf, sizeof(buf))) continue;
    std::string ip(buf);
    if(ip.rfind("127.", 0) == 0) continue;
    out.push_back(ip);
  }
  return out;
}

int64_t unix_time_seconds(){
  return std::chrono::duration_cast<std::chrono::seconds>(
    std::chrono::system_clock::now().time_since_epoch()).count();
}

bool split_host_port(const std::string& address, std::string& host, uint16_t& port){
  auto pos = address.rfind(':');
  if(pos == std::string::npos || pos == 0 || pos + 1 >= address.size()) return false;
  try {
    int value = std::stoi(address.substr(pos + 1));
    if(value <= 0 || value > 65535) return false;
    host = address.substr(0, pos);
    port = static_cast<uint16_t>(value);
    return true;
  } catch(const std::exception&) {
    return false;
  }
}
