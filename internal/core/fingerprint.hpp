#pragma once

#include <string>
#include <vector>

#include "internal/model/value.hpp"

namespace scd::core {

// 64 lowercase hex characters (SHA-256).
using Fingerprint = std::string;

/*
  Canonical text of one value, as hashed:

    null     \N
    integer  i:<decimal>
    real     r:<shortest round-trip decimal>   (-0 folds to 0)
    text     t:<text with '\' and '|' backslash-escaped>

  Tokens are joined with '|'. Escaping guarantees the separator never
  appears unescaped inside a token, and "\N" cannot be produced by any
  escaped text token since every text token starts with "t:".
*/
std::string CanonicalToken(const model::Value& value);

// Joined canonical tokens of the monitored attributes, in the given order.
// Throws util::MissingAttribute if the record lacks one of them.
std::string CanonicalForm(const model::Record& record, const std::vector<std::string>& monitored_attributes);

/*
  Pure: identical inputs give identical output on every platform.

  The order of monitored_attributes is significant. Reordering the
  configured list changes every fingerprint, so every row reports
  Changed on the next pass.
*/
Fingerprint ComputeFingerprint(const model::Record& record, const std::vector<std::string>& monitored_attributes);

} // namespace scd::core
