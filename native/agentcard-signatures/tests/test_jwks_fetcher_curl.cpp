// Copyright (c) Microsoft Corporation.
// Licensed under the MIT License.

/**
 * @file test_jwks_fetcher_curl.cpp
 * @brief Scheme restrictions of the libcurl-backed JWKS fetcher. No network access is needed.
 */

#include <catch2/catch.hpp>

#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>

#include <curl/curl.h>

#include "agentcard/signatures/jwks_fetcher.h"
#include "test_fakes.h"
#include "test_utils.h"

using agentcard::signatures::GetDefaultJwksFetcher;
using agentcard::signatures::JwksFetchStatus;

namespace {

class TempJwksFile {
 public:
  TempJwksFile() : path_(std::filesystem::temp_directory_path() / "agentcard_fetcher_keys.json") {
    auto key = agentcard::tests::GenerateEcP256Key();
    std::ofstream out(path_, std::ios::binary | std::ios::trunc);
    out << agentcard::tests::MakeJwks({agentcard::tests::PublicJwkFromKey(key.get(), "k1")}).dump();
  }

  ~TempJwksFile() {
    std::error_code ec;
    std::filesystem::remove(path_, ec);
  }

  std::string Uri() const { return "file://" + path_.string(); }

 private:
  std::filesystem::path path_;
};

} // namespace

TEST_CASE("Default fetcher does not read file URIs") {
  TempJwksFile file;
  REQUIRE(std::filesystem::exists(std::filesystem::path(file.Uri().substr(7))));

  const auto response = GetDefaultJwksFetcher().FetchJwksJson(file.Uri(), 1000, 1 << 20);
  REQUIRE(response.status == JwksFetchStatus::kError);
  REQUIRE(response.body.empty());
  REQUIRE(response.error == curl_easy_strerror(CURLE_UNSUPPORTED_PROTOCOL));
}

TEST_CASE("Default fetcher refuses schemes other than http and https") {
  for (const char* uri : {"ftp://127.0.0.1/jwks.json", "gopher://127.0.0.1/jwks", "dict://127.0.0.1/jwks"}) {
    const auto response = GetDefaultJwksFetcher().FetchJwksJson(uri, 1000, 1 << 20);
    REQUIRE(response.status == JwksFetchStatus::kError);
    REQUIRE(response.error == curl_easy_strerror(CURLE_UNSUPPORTED_PROTOCOL));
  }
}
