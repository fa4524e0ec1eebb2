#include <gtest/gtest.h>

#include <iostream>
#include <span>
#include <string>
#include <vector>

#include "grpc/client/client_args.hpp"
#include "test_helpers.hpp"

using namespace microbatch_server;

namespace {
auto
parse(std::vector<const char*> args) -> ClientConfig
{
  return parse_client_args(std::span<const char*>(args));
}
}  // namespace

TEST(ClientArgs_Unit, DefaultsWithoutArguments)
{
  const auto cfg = parse({"client"});
  ASSERT_TRUE(cfg.valid);
  EXPECT_EQ(cfg.server_address, "localhost:50051");
  EXPECT_EQ(cfg.sentences, (std::vector<std::string>{"Hello"}));
  EXPECT_EQ(cfg.request_nb, 1);
  EXPECT_EQ(cfg.concurrency, 1);
  EXPECT_EQ(cfg.timeout_ms, kDefaultClientTimeoutMs);
  EXPECT_FALSE(cfg.pool_status);
  EXPECT_FALSE(cfg.show_help);
}

TEST(ClientArgs_Unit, ParsesAllOptions)
{
  const auto cfg = parse(
      {"client", "--server", "10.0.0.2:6000", "--sentence", "first one",
       "--sentence", "second", "--request-number", "5", "--concurrency", "3",
       "--timeout-ms", "250", "--verbose", "debug", "--status"});
  ASSERT_TRUE(cfg.valid);
  EXPECT_EQ(cfg.server_address, "10.0.0.2:6000");
  EXPECT_EQ(
      cfg.sentences, (std::vector<std::string>{"first one", "second"}));
  EXPECT_EQ(cfg.request_nb, 5);
  EXPECT_EQ(cfg.concurrency, 3);
  EXPECT_EQ(cfg.timeout_ms, 250);
  EXPECT_EQ(cfg.verbosity, VerbosityLevel::Debug);
  EXPECT_TRUE(cfg.pool_status);
}

TEST(ClientArgs_Unit, HelpStopsParsing)
{
  const auto cfg = parse({"client", "-h", "--bogus"});
  EXPECT_TRUE(cfg.valid);
  EXPECT_TRUE(cfg.show_help);
}

TEST(ClientArgs_Unit, UnknownArgumentIsRejected)
{
  CaptureStream err{std::cerr};
  const auto cfg = parse({"client", "--bogus"});
  EXPECT_FALSE(cfg.valid);
  EXPECT_NE(
      err.str().find("Unknown argument: --bogus. Use --help to see valid "
                     "options."),
      std::string::npos);
}

TEST(ClientArgs_Unit, MissingValueIsRejected)
{
  CaptureStream err{std::cerr};
  const auto cfg = parse({"client", "--request-number"});
  EXPECT_FALSE(cfg.valid);
  EXPECT_NE(err.str().find("Missing value for --request-number"), std::string::npos);
}

class ClientArgsInvalidValue
    : public ::testing::TestWithParam<std::vector<const char*>> {};

TEST_P(ClientArgsInvalidValue, IsRejected)
{
  CaptureStream err{std::cerr};
  EXPECT_FALSE(parse(GetParam()).valid);
}

INSTANTIATE_TEST_SUITE_P(
    ClientArgs_Unit, ClientArgsInvalidValue,
    ::testing::Values(
        std::vector<const char*>{"client", "--request-number", "0"},
        std::vector<const char*>{"client", "--concurrency", "-2"},
        std::vector<const char*>{"client", "--timeout-ms", "soon"},
        std::vector<const char*>{"client", "--sentence", ""},
        std::vector<const char*>{"client", "--verbose", "loud"},
        std::vector<const char*>{
            "client", "--request-number", "99999999999999"}));
