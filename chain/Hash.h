#ifndef HASHCHAIN_HASH_H
#define HASHCHAIN_HASH_H

#include "Types.hpp"
#include <functional>
#include <string>

namespace hc {

/**
 * Maps the canonical encoding of a block to a lowercase hex digest.
 */
using HashFunction = std::function<std::string(const std::string &)>;

enum class HashAlgorithm { SHA1, SHA224, SHA256, SHA384, SHA512 };

/**
 * Compute a digest with OpenSSL EVP
 * @throws std::runtime_error if the EVP context cannot be created or fails
 */
std::string digestHex(HashAlgorithm algorithm, const std::string &input);

HashFunction makeHashFunction(HashAlgorithm algorithm);

std::string toString(HashAlgorithm algorithm);

ResultOrError<HashAlgorithm, ChainError>
parseHashAlgorithm(const std::string &name);

/**
 * All-zero sentinel used as `previous` of a genesis block. Its length is the
 * hex length of the digest produced by the given function.
 */
std::string genesisHash(const HashFunction &hashFunction);

} // namespace hc

#endif // HASHCHAIN_HASH_H
