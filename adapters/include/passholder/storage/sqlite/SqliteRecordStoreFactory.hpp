#ifndef INCLUDE_PASSHOLDER_STORAGE_SQLITE_SQLITERECORDSTOREFACTORY_HPP
#define INCLUDE_PASSHOLDER_STORAGE_SQLITE_SQLITERECORDSTOREFACTORY_HPP

#include "passholder/storage/IRecordStore.hpp"
#include <filesystem>
#include <memory>

namespace passholder::storage::sqlite
{

// Opens (or initializes, if empty) the SQLite working copy at `dbFile`.
// Throws StorageError, including for a schema newer than this build understands.
[[nodiscard]] std::unique_ptr<passholder::storage::IRecordStore> openSqliteRecordStore(const std::filesystem::path& dbFile);

} // namespace passholder::storage::sqlite

#endif // INCLUDE_PASSHOLDER_STORAGE_SQLITE_SQLITERECORDSTOREFACTORY_HPP
