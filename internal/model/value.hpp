#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace scd::model {

/*
  Tagged scalar as delivered by the storage connector.

  std::monostate is SQL NULL. Integer and real are kept apart so that the
  fingerprint can tell a storage-type change from a value change.
*/
using Value = std::variant<std::monostate, int64_t, double, std::string>;

inline bool IsNull(const Value& v) {
  return std::holds_alternative<std::monostate>(v);
}

// Human-readable rendering used in logs, summaries and error messages.
std::string DisplayText(const Value& v);

/*
  One entity's state: attribute name -> Value, in column order.

  Records are small (a table row), so lookups are linear scans over the
  column list; this keeps column order exactly as the connector reported it.
*/
class Record {
 public:
  Record() = default;
  Record(std::initializer_list<std::pair<std::string, Value>> fields);

  // Adds the attribute or replaces its value in place.
  void Set(const std::string& name, Value value);

  const Value* Find(const std::string& name) const;

  // Throws util::MissingAttribute if the attribute does not exist.
  const Value& At(const std::string& name) const;

  const std::vector<std::string>& Names() const {
    return names_;
  }
  const std::vector<Value>& Values() const {
    return values_;
  }
  std::size_t Size() const {
    return names_.size();
  }

  bool operator==(const Record& other) const = default;

 private:
  std::optional<std::size_t> IndexOf(const std::string& name) const;

  std::vector<std::string> names_;
  std::vector<Value>       values_;
};

} // namespace scd::model
