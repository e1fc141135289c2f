#include "BlockStorage.h"

namespace hc {

nlohmann::json BlockStorage::ChainMeta::ltsToJson() const {
  nlohmann::json j;
  j["name"] = name;
  j["height"] = height;
  return j;
}

BlockStorage::Roe<void>
BlockStorage::ChainMeta::ltsFromJson(const nlohmann::json &jd) {
  if (!jd.is_object()) {
    return Error(E_STORAGE_FAILURE, "Chain metadata must be a JSON object");
  }
  if (!jd.contains("name") || !jd["name"].is_string()) {
    return Error(E_STORAGE_FAILURE, "Field 'name' must be a string");
  }
  if (!jd.contains("height") || !jd["height"].is_number_unsigned()) {
    return Error(E_STORAGE_FAILURE,
                 "Field 'height' must be a non-negative integer");
  }
  name = jd["name"].get<std::string>();
  height = jd["height"].get<uint64_t>();
  return {};
}

} // namespace hc
