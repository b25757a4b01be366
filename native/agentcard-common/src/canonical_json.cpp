// Copyright (c) Microsoft Corporation.
// Licensed under the MIT License.

#include "agentcard/common/canonical_json.h"

#include <algorithm>
#include <charconv>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <string>
#include <utility>
#include <vector>

namespace agentcard::common {

namespace {

// Integers beyond 2^53 lose precision in an IEEE double, exactly as they would for an ECMAScript signer.
constexpr std::uint64_t kMaxSafeInteger = 9007199254740991ULL;

// Decodes UTF-8 into UTF-16 code units. Ill-formed sequences become U+FFFD.
std::u16string ToUtf16(std::string_view s) {
  std::u16string out;
  out.reserve(s.size());

  std::size_t i = 0;
  while (i < s.size()) {
    const auto b0 = static_cast<unsigned char>(s[i]);
    std::uint32_t cp = 0xFFFD;
    std::size_t len = 1;

    if (b0 < 0x80) {
      cp = b0;
    } else if ((b0 & 0xE0) == 0xC0) {
      len = 2;
    } else if ((b0 & 0xF0) == 0xE0) {
      len = 3;
    } else if ((b0 & 0xF8) == 0xF0) {
      len = 4;
    }

    if (len > 1) {
      if (i + len > s.size()) {
        len = 1;
      } else {
        cp = b0 & (0xFF >> (len + 1));
        for (std::size_t k = 1; k < len; ++k) {
          const auto bk = static_cast<unsigned char>(s[i + k]);
          if ((bk & 0xC0) != 0x80) {
            cp = 0xFFFD;
            len = 1;
            break;
          }
          cp = (cp << 6) | (bk & 0x3F);
        }
      }
    }

    if (cp >= 0x10000) {
      cp -= 0x10000;
      out.push_back(static_cast<char16_t>(0xD800 + (cp >> 10)));
      out.push_back(static_cast<char16_t>(0xDC00 + (cp & 0x3FF)));
    } else {
      out.push_back(static_cast<char16_t>(cp));
    }
    i += len;
  }

  return out;
}

void AppendString(const std::string& s, std::string& out) {
  // nlohmann escapes exactly the set JSON.stringify escapes: quote, backslash and C0 controls.
  out += nlohmann::json(s).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

void AppendCanonical(const nlohmann::json& value, std::string& out) {
  switch (value.type()) {
    case nlohmann::json::value_t::null:
      out += "null";
      return;
    case nlohmann::json::value_t::boolean:
      out += value.get<bool>() ? "true" : "false";
      return;
    case nlohmann::json::value_t::number_integer: {
      const auto v = value.get<std::int64_t>();
      const auto magnitude = v < 0 ? static_cast<std::uint64_t>(-(v + 1)) + 1 : static_cast<std::uint64_t>(v);
      if (magnitude > kMaxSafeInteger) {
        out += FormatEcmaScriptNumber(static_cast<double>(v));
      } else {
        out += std::to_string(v);
      }
      return;
    }
    case nlohmann::json::value_t::number_unsigned: {
      const auto v = value.get<std::uint64_t>();
      if (v > kMaxSafeInteger) {
        out += FormatEcmaScriptNumber(static_cast<double>(v));
      } else {
        out += std::to_string(v);
      }
      return;
    }
    case nlohmann::json::value_t::number_float:
      out += FormatEcmaScriptNumber(value.get<double>());
      return;
    case nlohmann::json::value_t::string:
      AppendString(value.get_ref<const std::string&>(), out);
      return;
    case nlohmann::json::value_t::array: {
      out.push_back('[');
      bool first = true;
      for (const auto& element : value) {
        if (!first) {
          out.push_back(',');
        }
        first = false;
        AppendCanonical(element, out);
      }
      out.push_back(']');
      return;
    }
    case nlohmann::json::value_t::object: {
      std::vector<std::pair<std::u16string, const std::string*>> keys;
      keys.reserve(value.size());
      for (auto it = value.begin(); it != value.end(); ++it) {
        keys.emplace_back(ToUtf16(it.key()), &it.key());
      }
      std::sort(keys.begin(), keys.end(), [](const auto& a, const auto& b) { return a.first < b.first; });

      out.push_back('{');
      bool first = true;
      for (const auto& [sort_key, key] : keys) {
        if (!first) {
          out.push_back(',');
        }
        first = false;
        AppendString(*key, out);
        out.push_back(':');
        AppendCanonical(value.at(*key), out);
      }
      out.push_back('}');
      return;
    }
    case nlohmann::json::value_t::binary:
    case nlohmann::json::value_t::discarded:
      break;
  }

  out += value.dump();
}

} // namespace

std::string FormatEcmaScriptNumber(double value) {
  if (!std::isfinite(value)) {
    return "null";
  }
  if (value == 0.0) {
    return "0";
  }

  // Shortest round-trip digits in the form [-]d[.ddd]e(+|-)xx.
  char buf[64];
  const auto res = std::to_chars(buf, buf + sizeof(buf), value, std::chars_format::scientific);
  const std::string_view sci(buf, static_cast<std::size_t>(res.ptr - buf));

  std::string out;
  std::size_t pos = 0;
  if (sci[pos] == '-') {
    out.push_back('-');
    ++pos;
  }

  const std::size_t e_pos = sci.find('e');
  std::string digits;
  for (std::size_t i = pos; i < e_pos; ++i) {
    if (sci[i] != '.') {
      digits.push_back(sci[i]);
    }
  }
  while (digits.size() > 1 && digits.back() == '0') {
    digits.pop_back();
  }
  const int exponent = std::atoi(std::string(sci.substr(e_pos + 1)).c_str());

  // ECMA-262 Number::toString: value = digits * 10^(n - k).
  const int k = static_cast<int>(digits.size());
  const int n = exponent + 1;

  if (k <= n && n <= 21) {
    out += digits;
    out.append(static_cast<std::size_t>(n - k), '0');
  } else if (0 < n && n <= 21) {
    out += digits.substr(0, static_cast<std::size_t>(n));
    out.push_back('.');
    out += digits.substr(static_cast<std::size_t>(n));
  } else if (-6 < n && n <= 0) {
    out += "0.";
    out.append(static_cast<std::size_t>(-n), '0');
    out += digits;
  } else {
    out.push_back(digits[0]);
    if (k > 1) {
      out.push_back('.');
      out += digits.substr(1);
    }
    out.push_back('e');
    out.push_back(n - 1 >= 0 ? '+' : '-');
    out += std::to_string(std::abs(n - 1));
  }

  return out;
}

nlohmann::json CloneWithoutMember(const nlohmann::json& object, std::string_view name) {
  if (!object.is_object()) {
    return object;
  }

  nlohmann::json copy = nlohmann::json::object();
  for (auto it = object.begin(); it != object.end(); ++it) {
    if (it.key() != name) {
      copy[it.key()] = it.value();
    }
  }
  return copy;
}

std::string CanonicalizeJson(const nlohmann::json& value) {
  std::string out;
  AppendCanonical(value, out);
  return out;
}

std::string CanonicalizeAgentCard(const nlohmann::json& card) {
  return CanonicalizeJson(CloneWithoutMember(card, "signatures"));
}

} // namespace agentcard::common
