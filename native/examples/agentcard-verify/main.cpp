#include <agentcard/common/agent_card.h>
#include <agentcard/common/jws_header.h>
#include <agentcard/common/logging.h>

#include <agentcard/signatures/agent_card_verifier.h>
#include <agentcard/signatures/result_format.h>
#include <agentcard/signatures/verification_options.h>

#include <charconv>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>

namespace {

std::string ReadAllText(const std::string& path) {
  std::ifstream f(path, std::ios::binary);
  if (!f) {
    throw std::runtime_error("failed to open file: " + path);
  }

  std::string out;
  f.seekg(0, std::ios::end);
  const std::streamoff size = f.tellg();
  if (size < 0) {
    throw std::runtime_error("failed to get file size: " + path);
  }
  out.resize(static_cast<std::size_t>(size));
  f.seekg(0, std::ios::beg);
  if (!out.empty()) {
    f.read(out.data(), size);
  }
  if (!f) {
    throw std::runtime_error("failed to read file: " + path);
  }

  return out;
}

std::string GetArgValue(int argc, char** argv, const std::string& name) {
  for (int i = 0; i < argc; ++i) {
    if (argv[i] == name) {
      if (i + 1 >= argc) {
        throw std::runtime_error("missing value for " + name);
      }
      return argv[i + 1];
    }
  }
  return {};
}

bool HasFlag(int argc, char** argv, const std::string& name) {
  for (int i = 0; i < argc; ++i) {
    if (argv[i] == name) {
      return true;
    }
  }
  return false;
}

[[noreturn]] void PrintUsageAndExit(const char* exe) {
  std::cerr
      << "Usage:\n"
      << "  " << exe << " --card <file> [--timeout <ms>] [--allow-insecure] [--sequential] [--json] [--verbose]\n"
      << "  " << exe << " --card <file> --inspect\n";
  std::exit(2);
}

bool ParseTimeout(std::string_view s, std::uint32_t& out) {
  const auto* end = s.data() + s.size();
  const auto [ptr, ec] = std::from_chars(s.data(), end, out);
  return ec == std::errc() && ptr == end && out > 0;
}

void PrintHeaders(const agentcard::common::AgentCard& card) {
  const auto entries = card.SignatureEntries();
  if (entries.empty()) {
    std::cout << "no signatures\n";
    return;
  }

  for (std::size_t i = 0; i < entries.size(); ++i) {
    std::cout << "signature " << (i + 1) << ":\n";
    if (!entries[i].signature) {
      std::cout << "  malformed: " << entries[i].problem << "\n";
      continue;
    }

    const auto header = agentcard::common::InspectSignatureHeader(*entries[i].signature);
    if (!header) {
      std::cout << "  protected header could not be decoded\n";
      continue;
    }
    std::cout << "  alg: " << (header->alg.empty() ? "(missing)" : header->alg) << "\n";
    if (header->typ) std::cout << "  typ: " << *header->typ << "\n";
    if (header->kid) std::cout << "  kid: " << *header->kid << "\n";
    if (header->jku) std::cout << "  jku: " << *header->jku << "\n";
    if (header->jwks_uri) std::cout << "  jwks_uri: " << *header->jwks_uri << "\n";
  }
}

} // namespace

int main(int argc, char** argv) {
  try {
    const std::string cardPath = GetArgValue(argc, argv, "--card");
    if (cardPath.empty()) {
      PrintUsageAndExit(argv[0]);
    }

    agentcard::signatures::VerificationOptions options;
    const std::string timeout = GetArgValue(argc, argv, "--timeout");
    if (!timeout.empty() && !ParseTimeout(timeout, options.timeout_ms)) {
      std::cerr << "invalid --timeout value: " << timeout << "\n";
      return 2;
    }
    options.allow_insecure = HasFlag(argc, argv, "--allow-insecure");
    options.parallel = !HasFlag(argc, argv, "--sequential");

    if (HasFlag(argc, argv, "--verbose")) {
      agentcard::common::Logging::SetLevel(spdlog::level::debug);
    }

    std::string parseErr;
    const auto card = agentcard::common::AgentCard::FromString(ReadAllText(cardPath), &parseErr);
    if (!card) {
      std::cerr << "failed to load Agent Card: " << parseErr << "\n";
      return 1;
    }

    if (HasFlag(argc, argv, "--inspect")) {
      PrintHeaders(*card);
      return 0;
    }

    if (options.allow_insecure) {
      std::cerr << "warning: key sets may be fetched over insecure transport\n";
    }

    const auto result = agentcard::signatures::VerifyAgentCardSignatures(*card, options);

    if (HasFlag(argc, argv, "--json")) {
      std::cout << agentcard::signatures::ToJson(result).dump(2) << "\n";
    } else {
      for (const auto& line : agentcard::signatures::FormatVerificationResults(result)) {
        std::cout << line << "\n";
      }
    }

    return result.valid ? 0 : 3;
  } catch (const std::exception& ex) {
    std::cerr << "fatal: " << ex.what() << "\n";
    return 1;
  }
}
