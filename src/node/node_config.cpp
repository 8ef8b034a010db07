#include "node/node_config.h"

#include <fstream>
#include <limits>
#include <stdexcept>
#include <type_traits>

#include <CLI/CLI.hpp>

#include "common/errors/error.h"
#include "common/logging/logger.h"
#include "transport/endpoint/address.h"

namespace nodelink::node {

namespace {
constexpr std::size_t kMaxChunkSizeLimit = 16 * 1024 * 1024;
constexpr std::size_t kMaxWorkerThreads = 1024;

template <typename T>
bool safe_parse_int(const std::string& value, T& out, const std::string& field_name,
                    std::error_code& ec) {
  static_assert(std::is_unsigned_v<T>);
  try {
    if (!value.empty() && value[0] == '-') {
      LOG_ERROR("Configuration error: {} value '{}' cannot be negative", field_name, value);
      ec = std::make_error_code(std::errc::result_out_of_range);
      return false;
    }
    std::size_t consumed = 0;
    const unsigned long long parsed = std::stoull(value, &consumed);
    if (consumed != value.size()) {
      LOG_ERROR("Configuration error: {} value '{}' is not a valid number", field_name, value);
      ec = std::make_error_code(std::errc::invalid_argument);
      return false;
    }
    if (parsed > std::numeric_limits<T>::max()) {
      LOG_ERROR("Configuration error: {} value '{}' is out of range", field_name, value);
      ec = std::make_error_code(std::errc::result_out_of_range);
      return false;
    }
    out = static_cast<T>(parsed);
    return true;
  } catch (const std::invalid_argument&) {
    LOG_ERROR("Configuration error: {} value '{}' is not a valid number", field_name, value);
    ec = std::make_error_code(std::errc::invalid_argument);
    return false;
  } catch (const std::out_of_range&) {
    LOG_ERROR("Configuration error: {} value '{}' is out of range", field_name, value);
    ec = std::make_error_code(std::errc::result_out_of_range);
    return false;
  }
}

bool parse_bool(const std::string& value) {
  return value == "true" || value == "1" || value == "yes" || value == "on";
}

void trim(std::string& text) {
  while (!text.empty() && (text.back() == ' ' || text.back() == '\t' || text.back() == '\r')) {
    text.pop_back();
  }
  while (!text.empty() && (text.front() == ' ' || text.front() == '\t')) {
    text.erase(0, 1);
  }
}

bool parse_ini_value(const std::string& line, std::string& key, std::string& value) {
  if (line.empty() || line[0] == '#' || line[0] == ';' || line[0] == '[') {
    return false;
  }
  const auto pos = line.find('=');
  if (pos == std::string::npos) {
    return false;
  }
  key = line.substr(0, pos);
  value = line.substr(pos + 1);
  trim(key);
  trim(value);
  return !key.empty();
}

std::string get_current_section(std::string line) {
  trim(line);
  if (line.size() >= 2 && line.front() == '[' && line.back() == ']') {
    return line.substr(1, line.size() - 2);
  }
  return "";
}
}  // namespace

bool parse_peer(const std::string& text, PeerConfig& peer, std::error_code& ec) {
  const auto pos = text.find('=');
  if (pos == std::string::npos || pos == 0 || pos + 1 == text.size()) {
    LOG_ERROR("Configuration error: peer '{}' must look like name=host:port", text);
    ec = NodeErrc::kInvalidConfig;
    return false;
  }
  peer.name = text.substr(0, pos);
  peer.address = text.substr(pos + 1);
  trim(peer.name);
  trim(peer.address);
  ec.clear();
  return true;
}

bool parse_args(int argc, char* argv[], NodeConfig& config, std::error_code& ec) {
  CLI::App app{"nodelink node"};

  std::vector<std::string> peer_texts;

  // General options.
  app.add_option("-c,--config", config.config_file, "Configuration file path");
  app.add_option("-n,--name", config.name, "Node name used in greetings");
  app.add_flag("-v,--verbose", config.verbose, "Enable verbose logging");
  app.add_option("--log-file", config.log_file, "Log file path");
  app.add_option("--threads", config.worker_threads, "Worker threads, 0 for one per core");

  // Network.
  app.add_option("-l,--listen", config.listen_address, "Listen address (host:port)")
      ->default_val("127.0.0.1:3030");
  app.add_option("--max-streams", config.max_concurrent_streams,
                 "Inbound streams open at once per connection")
      ->default_val(256);

  // TLS.
  app.add_option("--ca-cert", config.ca_cert_file, "CA certificate (PEM)");
  app.add_option("--cert", config.cert_file, "Node certificate (PEM)");
  app.add_option("--key", config.key_file, "Node private key (PKCS#8 PEM)");

  // Peers.
  app.add_option("-p,--peer", peer_texts, "Peer to dial, name=host:port (repeatable)");
  app.add_option("--retries", config.connect_retries, "Connection attempts per peer")
      ->default_val(5);
  app.add_option("--retry-backoff-ms", config.retry_backoff_ms,
                 "Pause between connection attempts in milliseconds")
      ->default_val(2000);

  // Framing.
  app.add_option("--max-chunk-size", config.max_chunk_size, "Largest chunk sent, in bytes")
      ->default_val(16 * 1024);
  app.add_option("--max-message-size", config.max_message_size,
                 "Largest message accepted, in bytes, 0 for no limit")
      ->default_val(0);

  try {
    app.parse(argc, argv);
  } catch (const CLI::CallForHelp& e) {
    app.exit(e);
    ec.clear();
    return false;
  } catch (const CLI::ParseError& e) {
    app.exit(e);
    ec = NodeErrc::kInvalidConfig;
    return false;
  }

  for (const auto& text : peer_texts) {
    PeerConfig peer;
    if (!parse_peer(text, peer, ec)) {
      return false;
    }
    config.peers.push_back(std::move(peer));
  }

  // Load config file if specified.
  if (!config.config_file.empty()) {
    if (!load_config_file(config.config_file, config, ec)) {
      return false;
    }
  }

  ec.clear();
  return true;
}

bool load_config_file(const std::string& path, NodeConfig& config, std::error_code& ec) {
  std::ifstream file(path);
  if (!file) {
    ec = std::error_code(errno, std::generic_category());
    LOG_ERROR("Failed to open config file: {}", path);
    return false;
  }

  std::string line;
  std::string section;

  while (std::getline(file, line)) {
    std::string new_section = get_current_section(line);
    if (!new_section.empty()) {
      section = new_section;
      continue;
    }

    std::string key;
    std::string value;
    if (!parse_ini_value(line, key, value)) {
      continue;
    }

    if (section == "node" || section.empty()) {
      if (key == "name") {
        config.name = value;
      } else if (key == "listen") {
        config.listen_address = value;
      } else if (key == "verbose") {
        config.verbose = parse_bool(value);
      } else if (key == "log_file") {
        config.log_file = value;
      } else if (key == "threads") {
        if (!safe_parse_int(value, config.worker_threads, "threads", ec)) {
          return false;
        }
      } else if (key == "max_streams") {
        if (!safe_parse_int(value, config.max_concurrent_streams, "max_streams", ec)) {
          return false;
        }
      }
    } else if (section == "tls") {
      if (key == "ca_cert") {
        config.ca_cert_file = value;
      } else if (key == "cert") {
        config.cert_file = value;
      } else if (key == "key") {
        config.key_file = value;
      }
    } else if (section == "peers") {
      if (key == "retries") {
        if (!safe_parse_int(value, config.connect_retries, "retries", ec)) {
          return false;
        }
      } else if (key == "retry_backoff_ms") {
        if (!safe_parse_int(value, config.retry_backoff_ms, "retry_backoff_ms", ec)) {
          return false;
        }
      } else {
        // Any other key names a peer: name = host:port
        config.peers.push_back(PeerConfig{key, value});
      }
    } else if (section == "framing") {
      if (key == "max_chunk_size") {
        if (!safe_parse_int(value, config.max_chunk_size, "max_chunk_size", ec)) {
          return false;
        }
      } else if (key == "max_message_size") {
        if (!safe_parse_int(value, config.max_message_size, "max_message_size", ec)) {
          return false;
        }
      }
    } else {
      LOG_WARN("Ignoring unknown config section [{}]", section);
    }
  }

  LOG_DEBUG("Loaded configuration from {}", path);
  ec.clear();
  return true;
}

bool validate_config(const NodeConfig& config, std::string& error) {
  std::error_code ec;
  if (!transport::parse_address(config.listen_address, ec)) {
    error = "Invalid listen address: " + config.listen_address;
    return false;
  }

  if (config.ca_cert_file.empty()) {
    error = "CA certificate file is required (--ca-cert)";
    return false;
  }
  if (config.cert_file.empty()) {
    error = "Certificate file is required (--cert)";
    return false;
  }
  if (config.key_file.empty()) {
    error = "Private key file is required (--key)";
    return false;
  }

  for (const auto& peer : config.peers) {
    if (peer.name.empty()) {
      error = "Peer name cannot be empty";
      return false;
    }
    if (!transport::parse_address(peer.address, ec)) {
      error = "Invalid address for peer " + peer.name + ": " + peer.address;
      return false;
    }
  }

  if (!config.peers.empty() && config.connect_retries == 0) {
    error = "Connection retries must be greater than 0";
    return false;
  }

  if (config.max_chunk_size == 0 || config.max_chunk_size > kMaxChunkSizeLimit) {
    error = "Max chunk size must be between 1 and " + std::to_string(kMaxChunkSizeLimit);
    return false;
  }

  if (config.max_concurrent_streams == 0) {
    error = "Max streams must be greater than 0";
    return false;
  }

  if (config.worker_threads > kMaxWorkerThreads) {
    error = "Worker threads cannot exceed " + std::to_string(kMaxWorkerThreads);
    return false;
  }

  return true;
}

}  // namespace nodelink::node
