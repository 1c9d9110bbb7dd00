#ifndef INCLUDE_PASSHOLDER_STORAGE_FILE_FILEVAULTREPOSITORYFACTORY_HPP
#define INCLUDE_PASSHOLDER_STORAGE_FILE_FILEVAULTREPOSITORYFACTORY_HPP

#include "passholder/storage/IVaultRepository.hpp"
#include <memory>

namespace passholder::storage::file
{

[[nodiscard]] std::unique_ptr<passholder::storage::IVaultRepository> makeFileVaultRepository();

} // namespace passholder::storage::file

#endif // INCLUDE_PASSHOLDER_STORAGE_FILE_FILEVAULTREPOSITORYFACTORY_HPP
