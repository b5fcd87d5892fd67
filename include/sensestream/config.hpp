#pragma once
#include "types.hpp"
#include <nlohmann/json_fwd.hpp>
#include <string>

namespace sensestream {

// Throws ConfigurationError if the file is missing or the contents are
// invalid (see parse_config).
StreamConfig load_config(const std::string &path);

// Required: account, user, database, schema, pipe.
// Exactly one of private_key_file (+ private_key_passphrase) or pat_token.
StreamConfig parse_config(const nlohmann::json &j);

} // namespace sensestream
