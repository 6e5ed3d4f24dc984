/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "utils/uri.hpp"

#include <gtest/gtest.h>

#include "qtils/test/outcome.hpp"

using attestor::Uri;
using attestor::UriError;

TEST(UriTest, ParsesFullUri) {
  ASSERT_OUTCOME_SUCCESS(
      uri, Uri::parse("HTTPS://rpc.example-node.io:8443/rpc/v0_8?key=abc#top"));
  EXPECT_EQ(uri.schema, "https");
  EXPECT_EQ(uri.host, "rpc.example-node.io");
  EXPECT_EQ(uri.port, "8443");
  EXPECT_EQ(uri.path, "/rpc/v0_8");
  EXPECT_EQ(uri.query, "key=abc");
  EXPECT_TRUE(uri.secure());
  EXPECT_EQ(uri.target(), "/rpc/v0_8?key=abc");
  EXPECT_EQ(uri.toString(), "https://rpc.example-node.io:8443/rpc/v0_8?key=abc");
}

TEST(UriTest, DefaultsPortAndPath) {
  ASSERT_OUTCOME_SUCCESS(http, Uri::parse("http://localhost"));
  EXPECT_EQ(http.port, "80");
  EXPECT_EQ(http.path, "/");
  EXPECT_FALSE(http.secure());

  ASSERT_OUTCOME_SUCCESS(wss, Uri::parse("wss://node.io?x=1"));
  EXPECT_EQ(wss.port, "443");
  EXPECT_EQ(wss.path, "/");
  EXPECT_EQ(wss.query, "x=1");
  EXPECT_TRUE(wss.secure());
}

TEST(UriTest, RejectsInvalid) {
  auto error_of = [](std::string_view str) {
    auto res = Uri::parse(str);
    EXPECT_FALSE(res.has_value()) << str;
    return res.has_value() ? std::error_code{} : res.error();
  };
  EXPECT_EQ(error_of("localhost:9545"), UriError::INVALID_SCHEMA);
  EXPECT_EQ(error_of("ftp://host"), UriError::INVALID_SCHEMA);
  EXPECT_EQ(error_of("http://"), UriError::INVALID_HOST);
  EXPECT_EQ(error_of("http://bad host/"), UriError::INVALID_HOST);
  EXPECT_EQ(error_of("http://host:"), UriError::INVALID_PORT);
  EXPECT_EQ(error_of("http://host:0"), UriError::INVALID_PORT);
  EXPECT_EQ(error_of("http://host:65536"), UriError::INVALID_PORT);
  EXPECT_EQ(error_of("http://host:12a"), UriError::INVALID_PORT);
}

TEST(UriTest, JoinAppendsToPath) {
  ASSERT_OUTCOME_SUCCESS(base, Uri::parse("http://signer:8080/api?token=1"));
  EXPECT_EQ(base.join("sign").target(), "/api/sign");
  EXPECT_EQ(base.join("/sign").target(), "/api/sign");

  ASSERT_OUTCOME_SUCCESS(root, Uri::parse("http://signer:8080/"));
  EXPECT_EQ(root.join("/sign_hash").target(), "/sign_hash");
  EXPECT_EQ(root.join("get_public_key").target(), "/get_public_key");
}
