#include "delta_classifier.hpp"

#include <algorithm>
#include <cmath>
#include <unordered_map>
#include <unordered_set>

#include "internal/util/errors.hpp"

namespace scd::core {

namespace {

/*
  SQLite hands back 1 and 1.0 with different storage classes depending on
  column affinity; integral reals are matched as integers so the same key
  cannot be seen as two entities.
*/
model::Value NormalizeKey(const model::Value& key) {
  if (const auto* real = std::get_if<double>(&key)) {
    // Only reals inside the exactly representable integer range are folded.
    if (std::isfinite(*real) && *real >= -9.0e15 && *real <= 9.0e15 && std::trunc(*real) == *real) {
      return static_cast<int64_t>(*real);
    }
  }
  return key;
}

} // namespace

std::string_view OutcomeName(Outcome outcome) {
  switch (outcome) {
    case Outcome::kNew:
      return "new";
    case Outcome::kChanged:
      return "changed";
    case Outcome::kUnchanged:
      return "unchanged";
    case Outcome::kRemoved:
      return "removed";
  }
  return "unknown";
}

std::size_t Classification::Count(Outcome outcome) const {
  return static_cast<std::size_t>(
      std::count_if(items.begin(), items.end(), [outcome](const ClassifiedItem& item) { return item.outcome == outcome; }));
}

std::string KeyIdentity(const model::Value& key) {
  return CanonicalToken(NormalizeKey(key));
}

Classification Classify(const std::vector<model::Record>& source_records, const std::vector<model::VersionRow>& current_slice,
                        const std::string& business_key, const std::vector<std::string>& monitored_attributes, bool detect_removed) {
  // Index the current slice; it must hold at most one row per key.
  std::unordered_map<std::string, const model::VersionRow*> current;
  current.reserve(current_slice.size());
  for (const auto& row : current_slice) {
    const auto identity = KeyIdentity(row.key);
    if (!row.is_current) {
      throw util::InvariantViolation("current slice contains a superseded row for key " + model::DisplayText(row.key),
                                     {model::DisplayText(row.key)});
    }
    if (!current.emplace(identity, &row).second) {
      throw util::InvariantViolation("history holds more than one current row for key " + model::DisplayText(row.key),
                                     {model::DisplayText(row.key)});
    }
  }

  Classification result;
  result.items.reserve(source_records.size());

  std::unordered_set<std::string> seen;
  seen.reserve(source_records.size());

  for (const auto& record : source_records) {
    const auto* key = record.Find(business_key);
    if (!key) {
      throw util::MissingAttribute("source record has no business key column '" + business_key + "'");
    }
    if (model::IsNull(*key)) {
      throw util::MissingAttribute("source record has a NULL business key '" + business_key + "'");
    }

    const auto identity = KeyIdentity(*key);
    if (!seen.insert(identity).second) {
      throw util::DuplicateKey("source contains business key " + model::DisplayText(*key) + " more than once", {model::DisplayText(*key)});
    }

    ClassifiedItem item;
    item.key         = *key;
    item.source      = record;
    item.fingerprint = ComputeFingerprint(record, monitored_attributes);

    const auto it = current.find(identity);
    if (it == current.end()) {
      item.outcome = Outcome::kNew;
    } else {
      item.prior   = *it->second;
      item.outcome = it->second->row_hash == item.fingerprint ? Outcome::kUnchanged : Outcome::kChanged;
    }
    result.items.push_back(std::move(item));
  }

  if (detect_removed) {
    std::vector<ClassifiedItem> removed;
    for (const auto& [identity, row] : current) {
      if (seen.contains(identity)) continue;
      ClassifiedItem item;
      item.key     = row->key;
      item.outcome = Outcome::kRemoved;
      item.prior   = *row;
      removed.push_back(std::move(item));
    }
    // Variant order: by storage type first, then by value.
    std::sort(removed.begin(), removed.end(), [](const ClassifiedItem& a, const ClassifiedItem& b) { return a.key < b.key; });
    for (auto& item : removed) {
      result.items.push_back(std::move(item));
    }
  }

  return result;
}

} // namespace scd::core
