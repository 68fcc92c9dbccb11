#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "internal/core/fingerprint.hpp"
#include "internal/model/value.hpp"
#include "internal/model/version_row.hpp"

namespace scd::core {

enum class Outcome : std::uint8_t {
  kNew,
  kChanged,
  kUnchanged,
  kRemoved,
};

std::string_view OutcomeName(Outcome outcome);

struct ClassifiedItem {
  model::Value key;
  Outcome      outcome = Outcome::kUnchanged;

  // Set for New / Changed / Unchanged.
  std::optional<model::Record> source;
  Fingerprint                  fingerprint;

  // Set for Changed / Unchanged / Removed.
  std::optional<model::VersionRow> prior;
};

struct Classification {
  std::vector<ClassifiedItem> items;

  std::size_t Count(Outcome outcome) const;
};

/*
  Compares a source snapshot with the current slice of history.

  Pure function of its inputs. Items follow source order; Removed items
  (only produced when detect_removed is set) come last, ordered by key.

  Throws:
    util::MissingAttribute    a record lacks the key or a monitored attribute,
                              or its key is NULL
    util::DuplicateKey        two source records share a key
    util::InvariantViolation  the slice holds two current rows for one key,
                              or a non-current row
*/
Classification Classify(const std::vector<model::Record>& source_records, const std::vector<model::VersionRow>& current_slice,
                        const std::string& business_key, const std::vector<std::string>& monitored_attributes, bool detect_removed);

// Canonical identity used to match keys across source and history.
std::string KeyIdentity(const model::Value& key);

} // namespace scd::core
