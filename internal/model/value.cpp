#include "value.hpp"

#include <spdlog/fmt/fmt.h>

#include "internal/util/errors.hpp"

namespace scd::model {

std::string DisplayText(const Value& v) {
  switch (v.index()) {
    case 0:
      return "NULL";
    case 1:
      return std::to_string(std::get<int64_t>(v));
    case 2:
      return fmt::format("{}", std::get<double>(v));
    default:
      return std::get<std::string>(v);
  }
}

Record::Record(std::initializer_list<std::pair<std::string, Value>> fields) {
  for (const auto& [name, value] : fields) {
    Set(name, value);
  }
}

std::optional<std::size_t> Record::IndexOf(const std::string& name) const {
  for (std::size_t i = 0; i < names_.size(); ++i) {
    if (names_[i] == name) return i;
  }
  return std::nullopt;
}

void Record::Set(const std::string& name, Value value) {
  if (auto idx = IndexOf(name)) {
    values_[*idx] = std::move(value);
    return;
  }
  names_.push_back(name);
  values_.push_back(std::move(value));
}

const Value* Record::Find(const std::string& name) const {
  auto idx = IndexOf(name);
  return idx ? &values_[*idx] : nullptr;
}

const Value& Record::At(const std::string& name) const {
  if (const auto* value = Find(name)) {
    return *value;
  }
  throw util::MissingAttribute("record has no attribute '" + name + "'");
}

} // namespace scd::model
