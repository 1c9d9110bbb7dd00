#ifndef INCLUDE_PASSHOLDER_STORAGE_IRECORDSTORE_HPP
#define INCLUDE_PASSHOLDER_STORAGE_IRECORDSTORE_HPP

#include "passholder/security/SecureMemory.hpp"
#include "passholder/storage/SecretRecord.hpp"
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace passholder::storage
{

constexpr std::int32_t g_kRecordSchemaVersion{ 1 };

// Relational view of the plaintext working copy. Every call commits immediately.
// Failures of the underlying engine throw StorageError.
class IRecordStore
{
public:
    IRecordStore() = default;
    IRecordStore(const IRecordStore&) = delete;
    IRecordStore& operator=(const IRecordStore&) = delete;
    IRecordStore(IRecordStore&&) = delete;
    IRecordStore& operator=(IRecordStore&&) = delete;
    virtual ~IRecordStore() = default;

    // Throws ValidationError when service or password is empty.
    [[nodiscard]] virtual RecordId insert(const NewRecord& record) = 0;

    [[nodiscard]] virtual std::vector<SecretRecord> queryAll() const = 0;
    [[nodiscard]] virtual std::vector<SecretRecord> queryByService(std::string_view service) const = 0;
    [[nodiscard]] virtual std::vector<SecretRecord> queryByServiceAndUsername(std::string_view service,
                                                                              std::string_view username) const = 0;
    [[nodiscard]] virtual std::optional<SecretRecord> queryById(RecordId id) const = 0;

    // Throws RecordNotFound if no record has this id.
    virtual RecordSummary deleteById(RecordId id) = 0;

    [[nodiscard]] virtual std::optional<std::string> loadVerifier() const = 0;
    virtual void storeVerifier(std::string_view verifier) = 0;

    // Serialized image of the whole working copy.
    [[nodiscard]] virtual passholder::security::SecureBuffer snapshot() const = 0;

    [[nodiscard]] virtual std::int32_t schemaVersion() const = 0;
};

using RecordStoreOpener = std::function<std::unique_ptr<IRecordStore>(const std::filesystem::path& workingCopy)>;

} // namespace passholder::storage

#endif // INCLUDE_PASSHOLDER_STORAGE_IRECORDSTORE_HPP
