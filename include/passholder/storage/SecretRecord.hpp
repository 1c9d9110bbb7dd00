#ifndef INCLUDE_PASSHOLDER_STORAGE_SECRETRECORD_HPP
#define INCLUDE_PASSHOLDER_STORAGE_SECRETRECORD_HPP

#include "passholder/security/SecureMemory.hpp"
#include <cstdint>
#include <string>

namespace passholder::storage
{

using RecordId = std::int64_t;

// Input of RecordStore::insert. Username and notes may be empty.
struct NewRecord final
{
    std::string service;
    passholder::security::SecureString password;
    std::string username{};
    std::string notes{};
};

struct SecretRecord final
{
    RecordId id{};
    std::string service;
    std::string username;
    passholder::security::SecureString password;
    std::string notes;
    std::int64_t createdAtUnixSeconds{};
};

// Everything but the password.
struct RecordSummary final
{
    RecordId id{};
    std::string service;
    std::string username;
    std::string notes;
};

[[nodiscard]] inline RecordSummary summarize(const SecretRecord& record)
{
    return RecordSummary{ .id = record.id, .service = record.service, .username = record.username, .notes = record.notes };
}

} // namespace passholder::storage

#endif // INCLUDE_PASSHOLDER_STORAGE_SECRETRECORD_HPP
