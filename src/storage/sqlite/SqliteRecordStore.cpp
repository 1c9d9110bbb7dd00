#include "passholder/storage/sqlite/SqliteRecordStoreFactory.hpp"

#include "passholder/security/SecureMemory.hpp"
#include "passholder/storage/IRecordStore.hpp"
#include "passholder/storage/StorageErrors.hpp"
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <filesystem>
#include <limits>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <sqlite3.h>

namespace passholder::storage::sqlite
{
namespace
{

struct SqliteDbDeleter final
{
    void operator()(sqlite3* db) const noexcept
    {
        if (db != nullptr)
        {
            (void)sqlite3_close_v2(db);
        }
    }
};

struct SqliteStmtDeleter final
{
    void operator()(sqlite3_stmt* stmt) const noexcept
    {
        if (stmt != nullptr)
        {
            (void)sqlite3_finalize(stmt);
        }
    }
};

using SqliteDbPtr = std::unique_ptr<sqlite3, SqliteDbDeleter>;
using SqliteStmtPtr = std::unique_ptr<sqlite3_stmt, SqliteStmtDeleter>;

[[nodiscard]] std::string sqliteErr(sqlite3* db, const char* prefix)
{
    const char* msg = (db != nullptr) ? sqlite3_errmsg(db) : "no-db";
    std::string out{ prefix };
    out.append(": ");
    out.append(msg);
    return out;
}

void exec(sqlite3* db, const char* sql)
{
    char* errMsg = nullptr;
    const int rc = sqlite3_exec(db, sql, nullptr, nullptr, &errMsg);
    if (rc != SQLITE_OK)
    {
        std::string msg = sqliteErr(db, "storage: sqlite3_exec failed");
        if (errMsg != nullptr)
        {
            msg.append(" (");
            msg.append(errMsg);
            msg.append(")");
            sqlite3_free(errMsg);
        }
        throw passholder::storage::StorageError(msg);
    }
}

[[nodiscard]] SqliteDbPtr openDb(const std::filesystem::path& path, int flags)
{
    sqlite3* raw = nullptr;
    const std::string filename = path.string();
    const int rc = sqlite3_open_v2(filename.c_str(), &raw, flags, nullptr);
    SqliteDbPtr db{ raw };
    if (rc != SQLITE_OK || !db)
    {
        throw passholder::storage::StorageError(sqliteErr(raw, "storage: sqlite3_open_v2 failed"));
    }
    return db;
}

[[nodiscard]] SqliteStmtPtr prepare(sqlite3* db, const char* sql)
{
    sqlite3_stmt* rawStmt = nullptr;
    const int prepRc = sqlite3_prepare_v2(db, sql, -1, &rawStmt, nullptr);
    SqliteStmtPtr stmt{ rawStmt };
    if (prepRc != SQLITE_OK || !stmt)
    {
        throw passholder::storage::StorageError(sqliteErr(db, "storage: sqlite3_prepare_v2 failed"));
    }
    return stmt;
}

void bindText(sqlite3* db, sqlite3_stmt* stmt, int index, std::string_view text)
{
    if (text.size() > static_cast<std::size_t>(std::numeric_limits<int>::max()))
    {
        throw passholder::storage::ValidationError("storage: text value too large");
    }
    // SQLite rejects a null pointer for a zero-length text value as NULL.
    const char* data = text.empty() ? "" : text.data();
    if (sqlite3_bind_text(stmt, index, data, static_cast<int>(text.size()), SQLITE_STATIC) != SQLITE_OK)
    {
        throw passholder::storage::StorageError(sqliteErr(db, "storage: bind text failed"));
    }
}

void bindId(sqlite3* db, sqlite3_stmt* stmt, int index, passholder::storage::RecordId id)
{
    if (sqlite3_bind_int64(stmt, index, id) != SQLITE_OK)
    {
        throw passholder::storage::StorageError(sqliteErr(db, "storage: bind id failed"));
    }
}

[[nodiscard]] std::string_view columnText(sqlite3_stmt* stmt, int col) noexcept
{
    const unsigned char* ptr = sqlite3_column_text(stmt, col);
    const int bytes = sqlite3_column_bytes(stmt, col);
    if (ptr == nullptr || bytes <= 0)
    {
        return {};
    }
    return std::string_view{ reinterpret_cast<const char*>(ptr), static_cast<std::size_t>(bytes) };
}

[[nodiscard]] passholder::storage::SecretRecord readRecord(sqlite3_stmt* stmt)
{
    passholder::storage::SecretRecord out{};
    out.id = sqlite3_column_int64(stmt, 0);
    out.service = std::string{ columnText(stmt, 1) };
    out.username = std::string{ columnText(stmt, 2) };
    out.password = passholder::security::secureStringFrom(columnText(stmt, 3));
    out.notes = std::string{ columnText(stmt, 4) };
    out.createdAtUnixSeconds = sqlite3_column_int64(stmt, 5);
    return out;
}

[[nodiscard]] std::vector<passholder::storage::SecretRecord> collectRecords(sqlite3* db, sqlite3_stmt* stmt)
{
    std::vector<passholder::storage::SecretRecord> out{};
    for (;;)
    {
        const int rc = sqlite3_step(stmt);
        if (rc == SQLITE_DONE)
        {
            return out;
        }
        if (rc != SQLITE_ROW)
        {
            throw passholder::storage::StorageError(sqliteErr(db, "storage: select records failed"));
        }
        out.push_back(readRecord(stmt));
    }
}

[[nodiscard]] std::int64_t unixSecondsNow() noexcept
{
    using Clock = std::chrono::system_clock;
    const auto secs{ std::chrono::duration_cast<std::chrono::seconds>(Clock::now().time_since_epoch()) };
    return secs.count() < 0 ? 0 : static_cast<std::int64_t>(secs.count());
}

[[nodiscard]] std::int32_t readUserVersion(sqlite3* db)
{
    auto stmt = prepare(db, "PRAGMA user_version;");
    if (sqlite3_step(stmt.get()) != SQLITE_ROW)
    {
        throw passholder::storage::StorageError(sqliteErr(db, "storage: read user_version failed"));
    }
    return sqlite3_column_int(stmt.get(), 0);
}

void ensureSchema(sqlite3* db)
{
    const std::int32_t version = readUserVersion(db);
    if (version > passholder::storage::g_kRecordSchemaVersion)
    {
        throw passholder::storage::StorageError("storage: unsupported working copy schema version");
    }
    if (version == passholder::storage::g_kRecordSchemaVersion)
    {
        return;
    }

    exec(db, "CREATE TABLE IF NOT EXISTS secrets ("
             " id INTEGER PRIMARY KEY AUTOINCREMENT,"
             " service TEXT NOT NULL,"
             " username TEXT NOT NULL DEFAULT '',"
             " password TEXT NOT NULL,"
             " notes TEXT NOT NULL DEFAULT '',"
             " created_at INTEGER NOT NULL"
             ");"
             "CREATE INDEX IF NOT EXISTS secrets_service ON secrets(service);"
             "CREATE TABLE IF NOT EXISTS master_auth ("
             " id INTEGER PRIMARY KEY CHECK(id = 1),"
             " password_hash TEXT NOT NULL"
             ");"
             "PRAGMA user_version = 1;");
}

constexpr const char* g_kSelectColumns{ "SELECT id, service, username, password, notes, created_at FROM secrets" };

class SqliteRecordStore final : public passholder::storage::IRecordStore
{
public:
    explicit SqliteRecordStore(SqliteDbPtr db) : m_db{ std::move(db) }
    {
    }

    [[nodiscard]] passholder::storage::RecordId insert(const passholder::storage::NewRecord& record) override
    {
        if (record.service.empty())
        {
            throw passholder::storage::ValidationError("service must not be empty");
        }
        if (record.password.empty())
        {
            throw passholder::storage::ValidationError("password must not be empty");
        }

        auto stmt = prepare(m_db.get(), "INSERT INTO secrets(service, username, password, notes, created_at)"
                                        " VALUES (?, ?, ?, ?, ?);");
        bindText(m_db.get(), stmt.get(), 1, record.service);
        bindText(m_db.get(), stmt.get(), 2, record.username);
        bindText(m_db.get(), stmt.get(), 3, passholder::security::asStringView(record.password));
        bindText(m_db.get(), stmt.get(), 4, record.notes);
        if (sqlite3_bind_int64(stmt.get(), 5, unixSecondsNow()) != SQLITE_OK)
        {
            throw passholder::storage::StorageError(sqliteErr(m_db.get(), "storage: bind created_at failed"));
        }

        if (sqlite3_step(stmt.get()) != SQLITE_DONE)
        {
            throw passholder::storage::StorageError(sqliteErr(m_db.get(), "storage: insert record failed"));
        }
        return sqlite3_last_insert_rowid(m_db.get());
    }

    [[nodiscard]] std::vector<passholder::storage::SecretRecord> queryAll() const override
    {
        const std::string sql = std::string{ g_kSelectColumns } + " ORDER BY id;";
        auto stmt = prepare(m_db.get(), sql.c_str());
        return collectRecords(m_db.get(), stmt.get());
    }

    [[nodiscard]] std::vector<passholder::storage::SecretRecord> queryByService(std::string_view service) const override
    {
        const std::string sql = std::string{ g_kSelectColumns } + " WHERE service = ? ORDER BY id;";
        auto stmt = prepare(m_db.get(), sql.c_str());
        bindText(m_db.get(), stmt.get(), 1, service);
        return collectRecords(m_db.get(), stmt.get());
    }

    [[nodiscard]] std::vector<passholder::storage::SecretRecord>
    queryByServiceAndUsername(std::string_view service, std::string_view username) const override
    {
        const std::string sql = std::string{ g_kSelectColumns } + " WHERE service = ? AND username = ? ORDER BY id;";
        auto stmt = prepare(m_db.get(), sql.c_str());
        bindText(m_db.get(), stmt.get(), 1, service);
        bindText(m_db.get(), stmt.get(), 2, username);
        return collectRecords(m_db.get(), stmt.get());
    }

    [[nodiscard]] std::optional<passholder::storage::SecretRecord>
    queryById(passholder::storage::RecordId id) const override
    {
        const std::string sql = std::string{ g_kSelectColumns } + " WHERE id = ?;";
        auto stmt = prepare(m_db.get(), sql.c_str());
        bindId(m_db.get(), stmt.get(), 1, id);
        auto rows = collectRecords(m_db.get(), stmt.get());
        if (rows.empty())
        {
            return std::nullopt;
        }
        return std::move(rows.front());
    }

    passholder::storage::RecordSummary deleteById(passholder::storage::RecordId id) override
    {
        const auto existing = queryById(id);
        if (!existing)
        {
            throw passholder::storage::RecordNotFound("no record with id " + std::to_string(id));
        }

        auto stmt = prepare(m_db.get(), "DELETE FROM secrets WHERE id = ?;");
        bindId(m_db.get(), stmt.get(), 1, id);
        if (sqlite3_step(stmt.get()) != SQLITE_DONE)
        {
            throw passholder::storage::StorageError(sqliteErr(m_db.get(), "storage: delete record failed"));
        }
        return passholder::storage::summarize(*existing);
    }

    [[nodiscard]] std::optional<std::string> loadVerifier() const override
    {
        auto stmt = prepare(m_db.get(), "SELECT password_hash FROM master_auth WHERE id = 1;");
        const int rc = sqlite3_step(stmt.get());
        if (rc == SQLITE_ROW)
        {
            return std::string{ columnText(stmt.get(), 0) };
        }
        if (rc == SQLITE_DONE)
        {
            return std::nullopt;
        }
        throw passholder::storage::StorageError(sqliteErr(m_db.get(), "storage: select verifier failed"));
    }

    void storeVerifier(std::string_view verifier) override
    {
        auto stmt = prepare(m_db.get(), "INSERT INTO master_auth(id, password_hash) VALUES (1, ?)"
                                        " ON CONFLICT(id) DO UPDATE SET password_hash=excluded.password_hash;");
        bindText(m_db.get(), stmt.get(), 1, verifier);
        if (sqlite3_step(stmt.get()) != SQLITE_DONE)
        {
            throw passholder::storage::StorageError(sqliteErr(m_db.get(), "storage: store verifier failed"));
        }
    }

    [[nodiscard]] passholder::security::SecureBuffer snapshot() const override
    {
        sqlite3_int64 size{ 0 };
        unsigned char* raw = sqlite3_serialize(m_db.get(), "main", &size, 0U);
        if (raw == nullptr || size < 0)
        {
            sqlite3_free(raw);
            throw passholder::storage::StorageError(sqliteErr(m_db.get(), "storage: sqlite3_serialize failed"));
        }

        const std::span<unsigned char> image{ raw, static_cast<std::size_t>(size) };
        passholder::security::SecureBuffer out(image.begin(), image.end());
        passholder::security::secureWipe(image);
        sqlite3_free(raw);
        return out;
    }

    [[nodiscard]] std::int32_t schemaVersion() const override
    {
        return readUserVersion(m_db.get());
    }

private:
    SqliteDbPtr m_db;
};

} // namespace

[[nodiscard]] std::unique_ptr<passholder::storage::IRecordStore> openSqliteRecordStore(const std::filesystem::path& dbFile)
{
    auto db = openDb(dbFile, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE);
    exec(db.get(), "PRAGMA journal_mode = MEMORY;"
                   "PRAGMA secure_delete = ON;"
                   "PRAGMA temp_store = MEMORY;");
    ensureSchema(db.get());
    return std::make_unique<SqliteRecordStore>(std::move(db));
}

} // namespace passholder::storage::sqlite
