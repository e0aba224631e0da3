#include "util/Asserts.hpp"
#include "util/BoostUtil.hpp"
#include "util/Config.hpp"
#include "util/Exception.hpp"
#include "util/GTestUtil.hpp"
#include "util/Random.hpp"
#include "util/SocketUtil.hpp"
#include "util/StringUtil.hpp"

#include <boost/filesystem.hpp>
#include <boost/program_options.hpp>
#include <gtest/gtest.h>

#include <fstream>
#include <memory>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

namespace bf = boost::filesystem;

namespace {

bf::path temp_path(const std::string& name) {
  bf::path dir = bf::temp_directory_path() / bf::unique_path("dc3-util-%%%%-%%%%");
  bf::create_directories(dir);
  return dir / name;
}

std::string slurp(const bf::path& path) {
  std::ifstream in(path.string());
  std::stringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

}  // namespace

TEST(StringUtil, atof_safe) {
  EXPECT_EQ(util::atof_safe("0.0"), 0.0);
  EXPECT_EQ(util::atof_safe("5"), 5.0);
  EXPECT_EQ(util::atof_safe("-5"), -5.0);
  EXPECT_EQ(util::atof_safe("3.25"), 3.25);
  EXPECT_EQ(util::atof_safe("1e3"), 1000.0);
  EXPECT_EQ(util::atof_safe("-1.0e+3"), -1000.0);

  EXPECT_THROW(util::atof_safe(""), util::CleanException);
  EXPECT_THROW(util::atof_safe("abc"), util::CleanException);
  EXPECT_THROW(util::atof_safe("1.0abc"), util::CleanException);
}

TEST(StringUtil, atoi_safe) {
  EXPECT_EQ(util::atoi_safe("42"), 42);
  EXPECT_EQ(util::atoi_safe("-7"), -7);
  EXPECT_THROW(util::atoi_safe("4.2"), util::CleanException);
  EXPECT_THROW(util::atoi_safe("x"), util::CleanException);
}

TEST(StringUtil, split) {
  std::vector<std::string> result1 = util::split("a,b,c", ",");
  std::vector<std::string> result2 = util::split(" a \tb   c ");
  std::vector<std::string> result3 = util::split("1,,2", ",");

  EXPECT_EQ(result1, (std::vector<std::string>{"a", "b", "c"}));
  EXPECT_EQ(result2, (std::vector<std::string>{"a", "b", "c"}));
  EXPECT_EQ(result3, (std::vector<std::string>{"1", "", "2"}));
}

TEST(Asserts, release_assert) {
  EXPECT_NO_THROW(RELEASE_ASSERT(1 + 1 == 2));
  EXPECT_THROW(RELEASE_ASSERT(1 + 1 == 3), util::ReleaseAssertionError);
  EXPECT_THROW(RELEASE_ASSERT(false, "value was {}", 3), util::ReleaseAssertionError);
  EXPECT_THROW(CLEAN_ASSERT(false, "bad input {}", "x"), util::CleanException);

  try {
    RELEASE_ASSERT(false, "value was {}", 3);
  } catch (const util::Exception& e) {
    EXPECT_NE(std::string(e.what()).find("value was 3"), std::string::npos);
  }
}

TEST(BoostUtil, get_option_value) {
  std::vector<std::string> args = util::split("--foo=bar --baz 7 --flag");
  EXPECT_EQ(boost_util::get_option_value(args, "foo"), "bar");
  EXPECT_EQ(boost_util::get_option_value(args, "baz"), "7");
  EXPECT_EQ(boost_util::get_option_value(args, "missing"), "");
}

TEST(BoostUtil, formatted_default_value) {
  namespace po2 = boost_util::program_options;

  double rate = 0.25;
  std::unique_ptr<boost::program_options::typed_value<double>> value(
    po2::default_value("{:.3f}", &rate));
  EXPECT_EQ(value->name(), "arg (=0.250)");

  int cap = 200;
  std::unique_ptr<boost::program_options::typed_value<int>> int_value(
    po2::default_value("{}", &cap, 50));
  EXPECT_EQ(int_value->name(), "arg (=50)");
}

TEST(BoostUtil, parse_args) {
  namespace po = boost::program_options;
  namespace po2 = boost_util::program_options;

  int depth = 3;
  double ratio = 4.0;
  bool verbose = false;

  po2::options_description raw_desc("Test options");
  auto desc =
    raw_desc.template add_option<"depth", 'd'>(po::value<int>(&depth)->default_value(depth), "d")
      .template add_option<"ratio">(po2::default_value("{:.1f}", &ratio), "r")
      .template add_flag<"verbose", "quiet">(&verbose, "v", "q");

  std::vector<std::string> args = {"-d", "9", "--ratio", "2.5", "--verbose"};
  po2::parse_args(desc, args);
  EXPECT_EQ(depth, 9);
  EXPECT_EQ(ratio, 2.5);
  EXPECT_TRUE(verbose);

  std::vector<std::string> bad_args = {"--no-such-option"};
  EXPECT_THROW(po2::parse_args(desc, bad_args), util::CleanException);
}

TEST(BoostUtil, atomic_write_file) {
  bf::path path = temp_path("data.txt");
  boost_util::atomic_write_file("first\n", path);
  EXPECT_EQ(slurp(path), "first\n");

  boost_util::atomic_write_file("second\n", path);
  EXPECT_EQ(slurp(path), "second\n");
  EXPECT_FALSE(bf::exists(path.string() + ".tmp"));
}

TEST(Config, read_and_save) {
  bf::path path = temp_path("dc3.cfg");
  {
    std::ofstream out(path.string());
    out << "# comment line\n";
    out << "tt_filename = /tmp/table.dc3t\n";
    out << "  checkpoint_filename=ckpt.txt  # trailing comment\n";
  }

  util::Config config(path);
  EXPECT_TRUE(config.contains("tt_filename"));
  EXPECT_EQ(config.get("tt_filename"), "/tmp/table.dc3t");
  EXPECT_EQ(config.get("checkpoint_filename"), "ckpt.txt");
  EXPECT_EQ(config.get("missing", "fallback"), "fallback");
  EXPECT_THROW(config.get("missing"), util::Exception);

  config.set("games", "12");
  bf::path copy_path = temp_path("copy.cfg");
  config.save(copy_path);

  util::Config copy(copy_path);
  EXPECT_EQ(copy.get("games"), "12");
  EXPECT_EQ(copy.dump(), config.dump());
}

TEST(Config, missing_file_is_empty) {
  util::Config config(temp_path("absent.cfg"));
  EXPECT_FALSE(config.contains("tt_filename"));
  EXPECT_EQ(config.dump(), "");
}

TEST(Config, malformed_line) {
  bf::path path = temp_path("bad.cfg");
  {
    std::ofstream out(path.string());
    out << "no equals sign here\n";
  }
  EXPECT_THROW(util::Config config(path), util::CleanException);
}

TEST(Random, seeded_prng_is_deterministic) {
  std::mt19937 a(17);
  std::mt19937 b(17);
  for (int i = 0; i < 100; ++i) {
    int x = util::Random::uniform_sample(a, 0, 10);
    EXPECT_EQ(x, util::Random::uniform_sample(b, 0, 10));
    EXPECT_GE(x, 0);
    EXPECT_LT(x, 10);

    double r = util::Random::uniform_real(a, -0.5, 0.5);
    EXPECT_EQ(r, util::Random::uniform_real(b, -0.5, 0.5));
    EXPECT_GE(r, -0.5);
    EXPECT_LT(r, 0.5);
  }
  EXPECT_THROW(util::Random::uniform_sample(a, 3, 3), util::Exception);
}

TEST(Socket, line_exchange) {
  io::Socket* server = io::Socket::create_server_socket(0, 1);
  io::port_t port = server->get_port();
  ASSERT_GT(port, 0);

  std::string received_by_client;
  bool client_ok = false;
  std::thread client_thread([&] {
    io::Socket* client = io::Socket::create_client_socket("localhost", port);
    client->write_line("game-17");
    client->write_line("12E");
    client_ok = client->read_line(&received_by_client, 5000);
    client->shutdown();
  });

  io::Socket* connection = server->accept();
  std::string line;
  ASSERT_TRUE(connection->read_line(&line, 5000));
  EXPECT_EQ(line, "game-17");
  ASSERT_TRUE(connection->read_line(&line, 5000));
  EXPECT_EQ(line, "12E");
  connection->write_line("34NW");

  client_thread.join();
  EXPECT_TRUE(client_ok);
  EXPECT_EQ(received_by_client, "34NW");

  // The client has shut down its end.
  EXPECT_FALSE(connection->read_line(&line, 5000));
  connection->shutdown();
  server->shutdown();
}

TEST(Socket, read_timeout) {
  io::Socket* server = io::Socket::create_server_socket(0, 1);
  io::Socket* client = io::Socket::create_client_socket("localhost", server->get_port());
  io::Socket* connection = server->accept();

  std::string line;
  EXPECT_THROW(client->read_line(&line, 50), io::RelayError);

  connection->shutdown();
  client->shutdown();
  server->shutdown();
}

int main(int argc, char** argv) { return launch_gtest(argc, argv); }
