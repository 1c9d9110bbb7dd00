#ifndef INCLUDE_PASSHOLDER_CRYPTO_PROVIDERS_NATIVEPROVIDERFACTORY_HPP
#define INCLUDE_PASSHOLDER_CRYPTO_PROVIDERS_NATIVEPROVIDERFACTORY_HPP

#include "passholder/crypto/ICryptoProvider.hpp"
#include <memory>

namespace passholder::crypto::providers
{

[[nodiscard]] std::unique_ptr<passholder::crypto::ICryptoProvider> makeNativeCryptoProvider();

} // namespace passholder::crypto::providers

#endif // INCLUDE_PASSHOLDER_CRYPTO_PROVIDERS_NATIVEPROVIDERFACTORY_HPP
