#include <gtest/gtest.h>

#include <stdexcept>

#include "speechly/grpc/channel_builder.hpp"
#include "test_config_utils.hpp"

using speechly::grpcutil::build_channel;
using speechly::grpcutil::ChannelOptions;

TEST(ChannelBuilderTest, RejectsEmptyTarget) {
  EXPECT_THROW(build_channel("", true), std::invalid_argument);
}

TEST(ChannelBuilderTest, BuildsPlaintextChannel) {
  EXPECT_NE(build_channel("localhost:50051", false), nullptr);
}

TEST(ChannelBuilderTest, BuildsSecureChannel) {
  EXPECT_NE(build_channel("api.speechly.com", true), nullptr);
}

TEST(ChannelBuilderTest, MissingRootCertsFileThrows) {
  testinfra::TempDir dir("speechly-channel");
  ChannelOptions options{"api.speechly.com", true, dir.path() / "missing.pem"};
  EXPECT_THROW(build_channel(options), std::runtime_error);
}

TEST(ChannelBuilderTest, RootCertsIgnoredForPlaintext) {
  testinfra::TempDir dir("speechly-channel");
  ChannelOptions options{"localhost:50051", false, dir.path() / "missing.pem"};
  EXPECT_NE(build_channel(options), nullptr);
}
