#ifndef INCLUDE_PASSHOLDER_STORAGE_STORAGEERRORS_HPP
#define INCLUDE_PASSHOLDER_STORAGE_STORAGEERRORS_HPP

#include <stdexcept>

namespace passholder::storage
{

class VaultNotFound final : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

// A vault-file exists but its salt-file is absent or has the wrong size.
class MissingSalt final : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

class ValidationError final : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

class RecordNotFound final : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

// I/O or SQLite failure.
class StorageError final : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

} // namespace passholder::storage

#endif // INCLUDE_PASSHOLDER_STORAGE_STORAGEERRORS_HPP
