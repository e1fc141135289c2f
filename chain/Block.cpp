#include "Block.h"
#include "Utilities.h"

#include <stdexcept>

namespace hc {

static HashFunction orDefault(HashFunction hashFunction) {
  if (!hashFunction) {
    return makeHashFunction(HashAlgorithm::SHA256);
  }
  return hashFunction;
}

Block::MiningOptions::MiningOptions() = default;

Block::Roe<std::string> Block::generateSalt(size_t byteCount) {
  auto result = utl::randomHex(byteCount);
  if (!result) {
    return Error(E_ENTROPY,
                 "Failed to generate salt: " + result.error().message);
  }
  return result.value();
}

std::string Block::canonicalEncoding(const nlohmann::json &payload,
                                     uint64_t nonce,
                                     const std::string &previous,
                                     const std::string &salt) {
  nlohmann::json j;
  j["data"] = payload;
  j["nonce"] = nonce;
  j["previous"] = previous;
  j["salt"] = salt;
  return j.dump();
}

Block::Roe<Block::MiningResult>
Block::mine(const HashFunction &hashFunction, const nlohmann::json &payload,
            const std::string &previous, const std::string &salt,
            const MiningOptions &options) {
  // Keys of a json object serialize sorted, so the canonical encoding is
  // prefix + nonce + suffix
  const std::string prefix = "{\"data\":" + payload.dump() + ",\"nonce\":";
  const std::string suffix = ",\"previous\":" + nlohmann::json(previous).dump() +
                             ",\"salt\":" + nlohmann::json(salt).dump() + "}";

  MiningResult result;
  for (uint64_t nonce = 0;; ++nonce) {
    if (nonce > options.maxNonce) {
      return Error(E_MINING_EXHAUSTED,
                   "No nonce up to " + std::to_string(options.maxNonce) +
                       " satisfies the difficulty");
    }
    if (options.cancel && (nonce & 0x3FF) == 0 && options.cancel->load()) {
      return Error(E_MINING_CANCELLED,
                   "Mining cancelled at nonce " + std::to_string(nonce));
    }

    std::string hash = hashFunction(prefix + std::to_string(nonce) + suffix);
    if (hasDifficultySuffix(hash)) {
      result.nonce = nonce;
      result.hash = std::move(hash);
      return result;
    }

    if (nonce == std::numeric_limits<uint64_t>::max()) {
      return Error(E_MINING_EXHAUSTED, "Nonce space exhausted");
    }
  }
}

Block::Roe<Block> Block::create(nlohmann::json payload,
                                const std::string &previous,
                                const std::string &salt,
                                HashFunction hashFunction,
                                const MiningOptions &options) {
  if (previous.empty()) {
    return Error(E_INVALID_ARGUMENT,
                 "A previous hash (or the genesis sentinel) is required");
  }

  Block block;
  block.hashFunction_ = orDefault(std::move(hashFunction));
  block.payload_ = std::move(payload);
  block.previous_ = previous;

  if (salt.empty()) {
    auto saltResult = generateSalt();
    if (!saltResult) {
      return saltResult.error();
    }
    block.salt_ = saltResult.value();
  } else {
    block.salt_ = salt;
  }

  try {
    auto mined = mine(block.hashFunction_, block.payload_, block.previous_,
                      block.salt_, options);
    if (!mined) {
      return mined.error();
    }
    block.nonce_ = mined->nonce;
    block.hash_ = mined->hash;
  } catch (const std::exception &e) {
    return Error(E_INVALID_ARGUMENT, std::string("Hashing failed: ") + e.what());
  }
  return block;
}

Block::Roe<void> Block::setPayload(nlohmann::json payload,
                                   const MiningOptions &options) {
  try {
    auto mined = mine(hashFunction_, payload, previous_, salt_, options);
    if (!mined) {
      return mined.error();
    }
    payload_ = std::move(payload);
    nonce_ = mined->nonce;
    hash_ = mined->hash;
  } catch (const std::exception &e) {
    return Error(E_INVALID_ARGUMENT, std::string("Hashing failed: ") + e.what());
  }
  return {};
}

Block::Roe<void> Block::setPrevious(const std::string &previous,
                                    const MiningOptions &options) {
  if (previous.empty()) {
    return Error(E_INVALID_ARGUMENT, "Previous hash cannot be empty");
  }
  if (previous == previous_) {
    return {};
  }

  try {
    auto mined = mine(hashFunction_, payload_, previous, salt_, options);
    if (!mined) {
      return mined.error();
    }
    previous_ = previous;
    nonce_ = mined->nonce;
    hash_ = mined->hash;
  } catch (const std::exception &e) {
    return Error(E_INVALID_ARGUMENT, std::string("Hashing failed: ") + e.what());
  }
  return {};
}

std::string Block::calculateHash() const {
  return hashFunction_(canonicalEncoding(payload_, nonce_, previous_, salt_));
}

bool Block::verify(bool quick) const {
  if (quick) {
    return hasDifficultySuffix(hash_);
  }
  try {
    return calculateHash() == hash_;
  } catch (const std::exception &) {
    return false;
  }
}

bool Block::equals(const Block &other, bool quick,
                   const Comparator &comparator) const {
  if (comparator) {
    return comparator(*this, other, quick);
  }
  if (quick) {
    return hash_ == other.hash_;
  }
  return ltsToString() == other.ltsToString();
}

nlohmann::json Block::ltsToJson() const {
  nlohmann::json j;
  j["data"] = payload_;
  j["hash"] = hash_;
  j["nonce"] = nonce_;
  j["previous"] = previous_;
  j["salt"] = salt_;
  return j;
}

std::string Block::ltsToString() const { return ltsToJson().dump(); }

Block::Roe<Block> Block::ltsFromJson(const nlohmann::json &jd,
                                     HashFunction hashFunction) {
  if (!jd.is_object()) {
    return Error(E_MALFORMED_BLOCK, "Block must be a JSON object");
  }
  if (!jd.contains("data")) {
    return Error(E_MALFORMED_BLOCK, "Missing field 'data'");
  }
  if (!jd.contains("hash") || !jd["hash"].is_string() ||
      !utl::isHexString(jd["hash"].get<std::string>())) {
    return Error(E_MALFORMED_BLOCK, "Field 'hash' must be a hex string");
  }
  if (!jd.contains("nonce") || !jd["nonce"].is_number_unsigned()) {
    return Error(E_MALFORMED_BLOCK,
                 "Field 'nonce' must be a non-negative integer");
  }
  if (!jd.contains("previous") || !jd["previous"].is_string()) {
    return Error(E_MALFORMED_BLOCK, "Field 'previous' must be a string");
  }
  if (!jd.contains("salt") || !jd["salt"].is_string()) {
    return Error(E_MALFORMED_BLOCK, "Field 'salt' must be a string");
  }

  Block block;
  block.hashFunction_ = orDefault(std::move(hashFunction));
  block.payload_ = jd["data"];
  block.hash_ = jd["hash"].get<std::string>();
  block.nonce_ = jd["nonce"].get<uint64_t>();
  block.previous_ = jd["previous"].get<std::string>();
  block.salt_ = jd["salt"].get<std::string>();
  return block;
}

Block::Roe<Block> Block::ltsFromString(const std::string &str,
                                       HashFunction hashFunction) {
  nlohmann::json jd;
  try {
    jd = nlohmann::json::parse(str);
  } catch (const nlohmann::json::parse_error &e) {
    return Error(E_MALFORMED_BLOCK,
                 std::string("Failed to parse block: ") + e.what());
  }
  return ltsFromJson(jd, std::move(hashFunction));
}

} // namespace hc
