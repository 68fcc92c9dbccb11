#include "fingerprint.hpp"

#include <openssl/evp.h>

#include <cmath>
#include <memory>
#include <stdexcept>

#include <spdlog/fmt/fmt.h>

#include "internal/util/errors.hpp"

namespace scd::core {

namespace {

constexpr char kSeparator = '|';
constexpr char kEscape    = '\\';

std::string Sha256Hex(const std::string& input) {
  std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), EVP_MD_CTX_free);
  if (!ctx) {
    throw std::runtime_error("Failed to create EVP_MD_CTX");
  }

  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int  digest_len = 0;
  if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1 || EVP_DigestUpdate(ctx.get(), input.data(), input.size()) != 1 ||
      EVP_DigestFinal_ex(ctx.get(), digest, &digest_len) != 1) {
    throw std::runtime_error("SHA-256 digest failed");
  }

  static constexpr char kHex[] = "0123456789abcdef";
  std::string           out;
  out.reserve(digest_len * 2);
  for (unsigned int i = 0; i < digest_len; ++i) {
    out.push_back(kHex[(digest[i] >> 4) & 0x0F]);
    out.push_back(kHex[digest[i] & 0x0F]);
  }
  return out;
}

std::string RealText(double v) {
  if (v == 0.0) {
    return "0";
  }
  if (std::isnan(v)) {
    return "nan";
  }
  // fmt's default presentation is the shortest string that round-trips
  // and ignores the global locale.
  return fmt::format("{}", v);
}

} // namespace

std::string CanonicalToken(const model::Value& value) {
  switch (value.index()) {
    case 0:
      return "\\N";
    case 1:
      return "i:" + std::to_string(std::get<int64_t>(value));
    case 2:
      return "r:" + RealText(std::get<double>(value));
    default: {
      const auto& text = std::get<std::string>(value);
      std::string out  = "t:";
      out.reserve(text.size() + 2);
      for (char c : text) {
        if (c == kEscape || c == kSeparator) out.push_back(kEscape);
        out.push_back(c);
      }
      return out;
    }
  }
}

std::string CanonicalForm(const model::Record& record, const std::vector<std::string>& monitored_attributes) {
  std::string out;
  bool        first = true;
  for (const auto& name : monitored_attributes) {
    const auto* value = record.Find(name);
    if (!value) {
      throw util::MissingAttribute("monitored attribute '" + name + "' is missing from record");
    }
    if (!first) out.push_back(kSeparator);
    first = false;
    out += CanonicalToken(*value);
  }
  return out;
}

Fingerprint ComputeFingerprint(const model::Record& record, const std::vector<std::string>& monitored_attributes) {
  return Sha256Hex(CanonicalForm(record, monitored_attributes));
}

} // namespace scd::core
