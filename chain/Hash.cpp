#include "Hash.h"

#include <iomanip>
#include <openssl/evp.h>
#include <sstream>
#include <stdexcept>

namespace hc {

static const EVP_MD *getDigest(HashAlgorithm algorithm) {
  switch (algorithm) {
  case HashAlgorithm::SHA1:
    return EVP_sha1();
  case HashAlgorithm::SHA224:
    return EVP_sha224();
  case HashAlgorithm::SHA384:
    return EVP_sha384();
  case HashAlgorithm::SHA512:
    return EVP_sha512();
  case HashAlgorithm::SHA256:
  default:
    return EVP_sha256();
  }
}

std::string digestHex(HashAlgorithm algorithm, const std::string &input) {
  EVP_MD_CTX *mdctx = EVP_MD_CTX_new();
  if (!mdctx) {
    throw std::runtime_error("Failed to create EVP_MD_CTX");
  }

  unsigned char hash[EVP_MAX_MD_SIZE];
  unsigned int hashLen = 0;

  if (EVP_DigestInit_ex(mdctx, getDigest(algorithm), nullptr) != 1) {
    EVP_MD_CTX_free(mdctx);
    throw std::runtime_error("EVP_DigestInit_ex failed");
  }

  if (EVP_DigestUpdate(mdctx, input.data(), input.size()) != 1) {
    EVP_MD_CTX_free(mdctx);
    throw std::runtime_error("EVP_DigestUpdate failed");
  }

  if (EVP_DigestFinal_ex(mdctx, hash, &hashLen) != 1) {
    EVP_MD_CTX_free(mdctx);
    throw std::runtime_error("EVP_DigestFinal_ex failed");
  }

  EVP_MD_CTX_free(mdctx);

  std::stringstream ss;
  for (unsigned int i = 0; i < hashLen; i++) {
    ss << std::hex << std::setw(2) << std::setfill('0')
       << static_cast<int>(hash[i]);
  }
  return ss.str();
}

HashFunction makeHashFunction(HashAlgorithm algorithm) {
  return [algorithm](const std::string &input) {
    return digestHex(algorithm, input);
  };
}

std::string toString(HashAlgorithm algorithm) {
  switch (algorithm) {
  case HashAlgorithm::SHA1:
    return "sha1";
  case HashAlgorithm::SHA224:
    return "sha224";
  case HashAlgorithm::SHA256:
    return "sha256";
  case HashAlgorithm::SHA384:
    return "sha384";
  case HashAlgorithm::SHA512:
    return "sha512";
  default:
    return "unknown";
  }
}

ResultOrError<HashAlgorithm, ChainError>
parseHashAlgorithm(const std::string &name) {
  if (name == "sha1") {
    return HashAlgorithm::SHA1;
  }
  if (name == "sha224") {
    return HashAlgorithm::SHA224;
  }
  if (name == "sha256") {
    return HashAlgorithm::SHA256;
  }
  if (name == "sha384") {
    return HashAlgorithm::SHA384;
  }
  if (name == "sha512") {
    return HashAlgorithm::SHA512;
  }
  return ChainError(E_INVALID_ARGUMENT, "Unknown hash algorithm: " + name);
}

std::string genesisHash(const HashFunction &hashFunction) {
  if (!hashFunction) {
    return std::string(64, '0');
  }
  return std::string(hashFunction("").size(), '0');
}

} // namespace hc
