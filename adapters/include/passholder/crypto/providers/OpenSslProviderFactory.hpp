#ifndef INCLUDE_PASSHOLDER_CRYPTO_PROVIDERS_OPENSSLPROVIDERFACTORY_HPP
#define INCLUDE_PASSHOLDER_CRYPTO_PROVIDERS_OPENSSLPROVIDERFACTORY_HPP

#include "passholder/crypto/ICryptoProvider.hpp"
#include <memory>

namespace passholder::crypto::providers
{

// Argon2id needs an OpenSSL runtime with the ARGON2ID KDF (3.2+); derivation throws otherwise.
[[nodiscard]] std::unique_ptr<passholder::crypto::ICryptoProvider> makeOpenSslCryptoProvider();

} // namespace passholder::crypto::providers

#endif // INCLUDE_PASSHOLDER_CRYPTO_PROVIDERS_OPENSSLPROVIDERFACTORY_HPP
