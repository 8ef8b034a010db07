#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include "common/errors/error.h"
#include "node/node_config.h"

namespace nodelink::tests {

namespace {

// Builds a mutable argv from string literals.
class Argv {
 public:
  Argv(std::initializer_list<std::string> args) : storage_(args) {
    for (auto& arg : storage_) {
      pointers_.push_back(arg.data());
    }
    pointers_.push_back(nullptr);
  }

  int argc() const { return static_cast<int>(storage_.size()); }
  char** argv() { return pointers_.data(); }

 private:
  std::vector<std::string> storage_;
  std::vector<char*> pointers_;
};

node::NodeConfig valid_config() {
  node::NodeConfig config;
  config.ca_cert_file = "ca.pem";
  config.cert_file = "node.pem";
  config.key_file = "node.key";
  return config;
}

}  // namespace

class NodeConfigFileTest : public ::testing::Test {
 protected:
  void SetUp() override {
    path_ = std::filesystem::temp_directory_path() /
            ("nodelink_config_" + std::to_string(::testing::UnitTest::GetInstance()->random_seed()) +
             "_" + ::testing::UnitTest::GetInstance()->current_test_info()->name() + ".ini");
  }

  void TearDown() override {
    std::error_code ignored;
    std::filesystem::remove(path_, ignored);
  }

  void write(const std::string& contents) {
    std::ofstream file(path_);
    file << contents;
  }

  std::filesystem::path path_;
};

TEST(ParsePeerTest, SplitsNameAndAddress) {
  node::PeerConfig peer;
  std::error_code ec;
  ASSERT_TRUE(node::parse_peer("node-b=10.0.0.2:3030", peer, ec));
  EXPECT_FALSE(ec);
  EXPECT_EQ(peer.name, "node-b");
  EXPECT_EQ(peer.address, "10.0.0.2:3030");
}

TEST(ParsePeerTest, RejectsMissingParts) {
  for (const char* text : {"node-b", "=10.0.0.2:3030", "node-b="}) {
    node::PeerConfig peer;
    std::error_code ec;
    EXPECT_FALSE(node::parse_peer(text, peer, ec)) << text;
    EXPECT_EQ(ec, make_error_code(NodeErrc::kInvalidConfig)) << text;
  }
}

TEST(ParseArgsTest, DefaultsWithoutArguments) {
  Argv args{"nodelink-node"};
  node::NodeConfig config;
  std::error_code ec;
  ASSERT_TRUE(node::parse_args(args.argc(), args.argv(), config, ec)) << ec.message();
  EXPECT_EQ(config.listen_address, "127.0.0.1:3030");
  EXPECT_EQ(config.max_concurrent_streams, 256U);
  EXPECT_EQ(config.connect_retries, 5U);
  EXPECT_EQ(config.retry_backoff_ms, 2000U);
  EXPECT_EQ(config.max_chunk_size, 16U * 1024U);
  EXPECT_EQ(config.max_message_size, 0U);
  EXPECT_TRUE(config.peers.empty());
}

TEST(ParseArgsTest, ReadsEveryOption) {
  Argv args{"nodelink-node", "--name", "node-a", "-l", "0.0.0.0:4000", "--ca-cert", "ca.pem",
            "--cert", "a.pem", "--key", "a.key", "-p", "node-b=10.0.0.2:4000", "--peer",
            "node-c=[::1]:4001", "--retries", "3", "--retry-backoff-ms", "250",
            "--max-chunk-size", "1024", "--max-message-size", "65536", "--threads", "2", "-v"};
  node::NodeConfig config;
  std::error_code ec;
  ASSERT_TRUE(node::parse_args(args.argc(), args.argv(), config, ec)) << ec.message();

  EXPECT_EQ(config.name, "node-a");
  EXPECT_EQ(config.listen_address, "0.0.0.0:4000");
  EXPECT_EQ(config.ca_cert_file, "ca.pem");
  EXPECT_EQ(config.cert_file, "a.pem");
  EXPECT_EQ(config.key_file, "a.key");
  ASSERT_EQ(config.peers.size(), 2U);
  EXPECT_EQ(config.peers[0].name, "node-b");
  EXPECT_EQ(config.peers[1].address, "[::1]:4001");
  EXPECT_EQ(config.connect_retries, 3U);
  EXPECT_EQ(config.retry_backoff_ms, 250U);
  EXPECT_EQ(config.max_chunk_size, 1024U);
  EXPECT_EQ(config.max_message_size, 65536U);
  EXPECT_EQ(config.worker_threads, 2U);
  EXPECT_TRUE(config.verbose);
}

TEST(ParseArgsTest, UnknownOptionIsInvalidConfig) {
  Argv args{"nodelink-node", "--no-such-option"};
  node::NodeConfig config;
  std::error_code ec;
  EXPECT_FALSE(node::parse_args(args.argc(), args.argv(), config, ec));
  EXPECT_EQ(ec, make_error_code(NodeErrc::kInvalidConfig));
}

TEST(ParseArgsTest, MalformedPeerIsInvalidConfig) {
  Argv args{"nodelink-node", "--peer", "10.0.0.2:4000"};
  node::NodeConfig config;
  std::error_code ec;
  EXPECT_FALSE(node::parse_args(args.argc(), args.argv(), config, ec));
  EXPECT_EQ(ec, make_error_code(NodeErrc::kInvalidConfig));
}

TEST_F(NodeConfigFileTest, LoadsAllSections) {
  write(
      "# node settings\n"
      "[node]\n"
      "name = node-a\n"
      "listen = 127.0.0.1:5000\n"
      "verbose = yes\n"
      "threads = 4\n"
      "max_streams = 32\n"
      "\n"
      "[tls]\n"
      "ca_cert = /etc/nodelink/ca.pem\n"
      "cert = /etc/nodelink/node.pem\n"
      "key = /etc/nodelink/node.key\n"
      "\n"
      "[peers]\n"
      "retries = 7\n"
      "retry_backoff_ms = 500\n"
      "node-b = 10.0.0.2:5000\n"
      "\n"
      "[framing]\n"
      "max_chunk_size = 4096\n"
      "max_message_size = 1048576\n");

  node::NodeConfig config;
  std::error_code ec;
  ASSERT_TRUE(node::load_config_file(path_.string(), config, ec)) << ec.message();
  EXPECT_EQ(config.name, "node-a");
  EXPECT_EQ(config.listen_address, "127.0.0.1:5000");
  EXPECT_TRUE(config.verbose);
  EXPECT_EQ(config.worker_threads, 4U);
  EXPECT_EQ(config.max_concurrent_streams, 32U);
  EXPECT_EQ(config.ca_cert_file, "/etc/nodelink/ca.pem");
  EXPECT_EQ(config.key_file, "/etc/nodelink/node.key");
  EXPECT_EQ(config.connect_retries, 7U);
  EXPECT_EQ(config.retry_backoff_ms, 500U);
  ASSERT_EQ(config.peers.size(), 1U);
  EXPECT_EQ(config.peers[0].name, "node-b");
  EXPECT_EQ(config.peers[0].address, "10.0.0.2:5000");
  EXPECT_EQ(config.max_chunk_size, 4096U);
  EXPECT_EQ(config.max_message_size, 1048576U);
}

TEST_F(NodeConfigFileTest, RejectsNegativeNumbers) {
  write("[peers]\nretries = -1\n");
  node::NodeConfig config;
  std::error_code ec;
  EXPECT_FALSE(node::load_config_file(path_.string(), config, ec));
  EXPECT_TRUE(ec);
}

TEST_F(NodeConfigFileTest, RejectsTrailingGarbage) {
  write("[framing]\nmax_chunk_size = 12kb\n");
  node::NodeConfig config;
  std::error_code ec;
  EXPECT_FALSE(node::load_config_file(path_.string(), config, ec));
  EXPECT_EQ(ec, std::make_error_code(std::errc::invalid_argument));
}

TEST_F(NodeConfigFileTest, MissingFileFails) {
  node::NodeConfig config;
  std::error_code ec;
  EXPECT_FALSE(node::load_config_file(path_.string(), config, ec));
  EXPECT_TRUE(ec);
}

TEST_F(NodeConfigFileTest, ConfigOptionOverlaysFile) {
  write("[node]\nname = from-file\n");
  const auto path = path_.string();
  Argv args{"nodelink-node", "--name", "from-cli", "--config", path};
  node::NodeConfig config;
  std::error_code ec;
  ASSERT_TRUE(node::parse_args(args.argc(), args.argv(), config, ec)) << ec.message();
  EXPECT_EQ(config.name, "from-file");
}

TEST(ValidateConfigTest, AcceptsCompleteConfig) {
  auto config = valid_config();
  config.peers.push_back({"node-b", "10.0.0.2:3030"});
  std::string error;
  EXPECT_TRUE(node::validate_config(config, error)) << error;
}

TEST(ValidateConfigTest, ReportsFirstProblem) {
  std::string error;

  auto config = valid_config();
  config.listen_address = "localhost:3030";
  EXPECT_FALSE(node::validate_config(config, error));
  EXPECT_NE(error.find("listen"), std::string::npos);

  config = valid_config();
  config.key_file.clear();
  EXPECT_FALSE(node::validate_config(config, error));
  EXPECT_NE(error.find("--key"), std::string::npos);

  config = valid_config();
  config.peers.push_back({"node-b", "nowhere"});
  EXPECT_FALSE(node::validate_config(config, error));
  EXPECT_NE(error.find("node-b"), std::string::npos);

  config = valid_config();
  config.peers.push_back({"node-b", "10.0.0.2:3030"});
  config.connect_retries = 0;
  EXPECT_FALSE(node::validate_config(config, error));

  config = valid_config();
  config.max_chunk_size = 0;
  EXPECT_FALSE(node::validate_config(config, error));

  config = valid_config();
  config.max_concurrent_streams = 0;
  EXPECT_FALSE(node::validate_config(config, error));

  config = valid_config();
  config.worker_threads = 4096;
  EXPECT_FALSE(node::validate_config(config, error));
}

TEST(ValidateConfigTest, ZeroRetriesAllowedWithoutPeers) {
  auto config = valid_config();
  config.connect_retries = 0;
  std::string error;
  EXPECT_TRUE(node::validate_config(config, error)) << error;
}

}  // namespace nodelink::tests
