#include "sensestream/record.hpp"

#include <nlohmann/json.hpp>
#include <sstream>
#include <stdexcept>

using json = nlohmann::json;

namespace sensestream {

json Record::to_json() const {
  json j = json::object();
  for (const auto &[name, value] : fields_) {
    std::visit([&j, &name = name](const auto &v) { j[name] = v; }, value);
  }
  return j;
}

Record Record::from_json(const json &j) {
  if (!j.is_object())
    throw std::invalid_argument("record must be a JSON object");

  Record r;
  for (auto &[k, v] : j.items()) {
    if (v.is_boolean())
      r.set(k, v.get<bool>());
    else if (v.is_number_integer())
      r.set(k, v.get<std::int64_t>());
    else if (v.is_number_float())
      r.set(k, v.get<double>());
    else if (v.is_string())
      r.set(k, v.get<std::string>());
    else
      throw std::invalid_argument("field '" + k + "' is not a scalar");
  }
  return r;
}

void validate(const Record &r, const std::vector<std::string> &required) {
  for (const auto &name : required) {
    if (!r.has(name))
      throw std::invalid_argument("record is missing required field '" + name + "'");
  }
}

std::string to_ndjson(const std::vector<Record> &records) {
  std::string out;
  for (std::size_t i = 0; i < records.size(); ++i) {
    if (i)
      out.push_back('\n');
    out += records[i].to_json().dump();
  }
  return out;
}

std::vector<Record> from_ndjson(const std::string &text) {
  std::vector<Record> out;
  std::istringstream in(text);
  std::string line;
  while (std::getline(in, line)) {
    if (line.empty())
      continue;
    out.push_back(Record::from_json(json::parse(line)));
  }
  return out;
}

} // namespace sensestream
