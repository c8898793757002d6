#pragma once

#include "config_parser.hpp"

#include <string>

namespace patchy {

// Serialize a root table. Keys holding tables are written as [section]
// headers, the other root keys before the first section. Comments are kept.
std::string
cfg_serialize(const Value& root);

// Serialize a single non-table value, e.g. `'on-edit'` or `8192`.
std::string
cfg_serialize_obj(const Value& value);

}  // namespace patchy
