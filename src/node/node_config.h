#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <system_error>
#include <vector>

namespace nodelink::node {

// A node this node dials at startup.
struct PeerConfig {
  // Name the peer's certificate is issued to.
  std::string name;
  // "a.b.c.d:port" or "[v6]:port".
  std::string address;
};

struct NodeConfig {
  // General settings.
  std::string config_file;
  std::string name{"node"};
  bool verbose{false};
  std::string log_file;
  std::size_t worker_threads{0};

  // Network.
  std::string listen_address{"127.0.0.1:3030"};
  std::size_t max_concurrent_streams{256};

  // TLS material, PEM files.
  std::string ca_cert_file;
  std::string cert_file;
  std::string key_file;

  // Outbound connections.
  std::vector<PeerConfig> peers;
  std::uint32_t connect_retries{5};
  std::uint32_t retry_backoff_ms{2000};

  // Chunk protocol.
  std::size_t max_chunk_size{16 * 1024};
  std::size_t max_message_size{0};
};

// Parses "name=host:port".
bool parse_peer(const std::string& text, PeerConfig& peer, std::error_code& ec);

// Parses the command line, then overlays the file given by --config. Returns
// false with `ec` clear when only help was requested.
bool parse_args(int argc, char* argv[], NodeConfig& config, std::error_code& ec);

// Reads an INI file with [node], [tls], [peers] and [framing] sections.
bool load_config_file(const std::string& path, NodeConfig& config, std::error_code& ec);

bool validate_config(const NodeConfig& config, std::string& error);

}  // namespace nodelink::node
