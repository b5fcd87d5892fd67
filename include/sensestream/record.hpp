#pragma once
#include <cstdint>
#include <initializer_list>
#include <map>
#include <nlohmann/json_fwd.hpp>
#include <string>
#include <variant>
#include <vector>

namespace sensestream {

using FieldValue = std::variant<std::int64_t, double, bool, std::string>;

// One sensor sample: flat field -> scalar map. Created once per reading and
// never mutated after it has been handed to the batch.
class Record {
public:
  Record() = default;
  Record(std::initializer_list<std::pair<const std::string, FieldValue>> init)
      : fields_(init) {}

  void set(const std::string &name, FieldValue value) {
    fields_[name] = std::move(value);
  }
  // иначе литерал уйдёт в bool
  void set(const std::string &name, const char *value) {
    fields_[name] = std::string(value);
  }
  bool has(const std::string &name) const { return fields_.count(name) != 0; }
  // Throws std::out_of_range if absent.
  const FieldValue &get(const std::string &name) const { return fields_.at(name); }

  std::size_t size() const noexcept { return fields_.size(); }
  bool empty() const noexcept { return fields_.empty(); }
  const std::map<std::string, FieldValue> &fields() const noexcept { return fields_; }

  nlohmann::json to_json() const;
  // Throws std::invalid_argument for non-objects and non-scalar members.
  static Record from_json(const nlohmann::json &j);

  bool operator==(const Record &o) const { return fields_ == o.fields_; }
  bool operator!=(const Record &o) const { return !(*this == o); }

private:
  std::map<std::string, FieldValue> fields_;
};

// Throws std::invalid_argument naming the first missing field.
void validate(const Record &r, const std::vector<std::string> &required);

// One compact JSON object per line, '\n' separated, no trailing newline.
std::string to_ndjson(const std::vector<Record> &records);
std::vector<Record> from_ndjson(const std::string &text);

} // namespace sensestream
