#pragma once

#include "geometrytools/armor.h"

#include <nlohmann/json.hpp>

#include <istream>
#include <ostream>

namespace geometrytools::armorjson {

using json = nlohmann::ordered_json;

// Armor document layout:
//   { "source": { "<piece id>": [ [[x,y,z],[x,y,z],[x,y,z]], ... ], ... } }
// Object key order is piece order.

// from_json converts a parsed armor document. Throws std::runtime_error on
// shape errors and armor::Error{IdOverflow} for ids above 2^32-1.
armor::ArmorRecord from_json(const json& doc);

json to_json(const armor::ArmorRecord& r);

// read_armor parses an armor document from a stream.
armor::ArmorRecord read_armor(std::istream& in);

void write_armor(std::ostream& out, const armor::ArmorRecord& r, bool pretty = false);

// metadata_to_json produces {"armorContentLength": N, "armorContentHash": "<hex>"}.
json metadata_to_json(const armor::ArmorContentMetadata& m);

} // namespace geometrytools::armorjson
