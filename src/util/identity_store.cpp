#include <pkgid/identity_store.hpp>
#include <pkgid/log.hpp>
#include <sqlite3.h>

#include <chrono>
#include <cstdlib>
#include <filesystem>

namespace fs = std::filesystem;

namespace pkgid {

static const std::string SCHEMA_VERSION = "1";

static int64_t now_epoch_sec() {
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

static std::string column_text(sqlite3_stmt* stmt, int col) {
    const unsigned char* text = sqlite3_column_text(stmt, col);
    return text ? reinterpret_cast<const char*>(text) : "";
}

// ---------------------------------------------------------------------------
// pImpl
// ---------------------------------------------------------------------------

struct IdentityStore::Impl {
    sqlite3* db = nullptr;

    // Prepared statements (lazily initialized, cached)
    sqlite3_stmt* stmt_upsert = nullptr;
    sqlite3_stmt* stmt_del_settings = nullptr;
    sqlite3_stmt* stmt_insert_setting = nullptr;
    sqlite3_stmt* stmt_lookup = nullptr;
    sqlite3_stmt* stmt_list = nullptr;
    sqlite3_stmt* stmt_remove = nullptr;

    ~Impl() {
        finalize_all();
        if (db) sqlite3_close(db);
    }

    void finalize_all() {
        auto fin = [](sqlite3_stmt*& s) {
            if (s) { sqlite3_finalize(s); s = nullptr; }
        };
        fin(stmt_upsert);
        fin(stmt_del_settings);
        fin(stmt_insert_setting);
        fin(stmt_lookup);
        fin(stmt_list);
        fin(stmt_remove);
    }

    Status require_open() const {
        if (!db) {
            return PkgidError(PkgidError::IO, "identity store is not open");
        }
        return ok_status();
    }

    Status prepare(const char* sql, sqlite3_stmt*& out) {
        if (out) {
            sqlite3_reset(out);
            sqlite3_clear_bindings(out);
            return ok_status();
        }
        int rc = sqlite3_prepare_v2(db, sql, -1, &out, nullptr);
        if (rc != SQLITE_OK) {
            return PkgidError(PkgidError::IO,
                std::string("SQLite prepare failed: ") + sqlite3_errmsg(db));
        }
        return ok_status();
    }

    Status exec(const char* sql) {
        char* errmsg = nullptr;
        int rc = sqlite3_exec(db, sql, nullptr, nullptr, &errmsg);
        if (rc != SQLITE_OK) {
            std::string msg = errmsg ? errmsg : "unknown error";
            sqlite3_free(errmsg);
            return PkgidError(PkgidError::IO, "SQLite exec failed: " + msg);
        }
        return ok_status();
    }

    Status step_done(sqlite3_stmt* stmt, const char* what) {
        int rc = sqlite3_step(stmt);
        if (rc != SQLITE_DONE) {
            std::string msg = sqlite3_errmsg(db);
            sqlite3_reset(stmt);
            return PkgidError(PkgidError::IO,
                std::string("Failed to ") + what + ": " + msg);
        }
        sqlite3_reset(stmt);
        return ok_status();
    }

    // Runs `body` inside a transaction; any failure, COMMIT included, rolls back
    template<typename F>
    Status transaction(F&& body) {
        PKGID_TRY(exec("BEGIN TRANSACTION;"));
        Status status = body();
        if (status.is_ok()) {
            status = exec("COMMIT;");
        }
        if (status.is_err()) {
            auto rollback = exec("ROLLBACK;");
            if (rollback.is_err()) {
                log::warn("%s", rollback.error().message.c_str());
            }
        }
        return status;
    }

    Status init_schema() {
        PKGID_TRY(exec(
            "CREATE TABLE IF NOT EXISTS schema_info ("
            "  key TEXT PRIMARY KEY,"
            "  value TEXT"
            ");"
            "CREATE TABLE IF NOT EXISTS identity ("
            "  reference TEXT,"
            "  package_id TEXT,"
            "  info TEXT,"
            "  created_at INTEGER,"
            "  PRIMARY KEY (reference, package_id)"
            ");"
            "CREATE TABLE IF NOT EXISTS identity_setting ("
            "  reference TEXT,"
            "  package_id TEXT,"
            "  name TEXT,"
            "  value TEXT,"
            "  PRIMARY KEY (reference, package_id, name)"
            ");"
        ));

        std::string stored;
        sqlite3_stmt* stmt = nullptr;
        int rc = sqlite3_prepare_v2(db,
            "SELECT value FROM schema_info WHERE key='version'", -1, &stmt, nullptr);
        if (rc != SQLITE_OK) {
            if (stmt) sqlite3_finalize(stmt);
            return PkgidError(PkgidError::IO,
                std::string("Failed to read schema version: ") + sqlite3_errmsg(db));
        }
        if (sqlite3_step(stmt) == SQLITE_ROW) {
            stored = column_text(stmt, 0);
        }
        sqlite3_finalize(stmt);

        if (stored == SCHEMA_VERSION) return ok_status();
        if (!stored.empty()) {
            // Version mismatch: stored rows follow an older layout
            log::warn("identity store schema %s is stale, clearing", stored.c_str());
            PKGID_TRY(exec(
                "DELETE FROM identity;"
                "DELETE FROM identity_setting;"
            ));
        }
        std::string ver_sql = "INSERT OR REPLACE INTO schema_info (key, value) "
            "VALUES ('version', '" + SCHEMA_VERSION + "');";
        return exec(ver_sql.c_str());
    }
};

// ---------------------------------------------------------------------------
// IdentityStore public interface
// ---------------------------------------------------------------------------

IdentityStore::IdentityStore() : impl_(std::make_unique<Impl>()) {}
IdentityStore::~IdentityStore() = default;
IdentityStore::IdentityStore(IdentityStore&&) noexcept = default;
IdentityStore& IdentityStore::operator=(IdentityStore&&) noexcept = default;

std::string IdentityStore::default_store_path() {
    const char* home = std::getenv("HOME");
    if (!home) home = "/tmp";
    return std::string(home) + "/.pkgid/identities.db";
}

Status IdentityStore::open(const std::string& db_path) {
    close();

    fs::path parent = fs::path(db_path).parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        fs::create_directories(parent, ec);
        if (ec) {
            return PkgidError(PkgidError::IO,
                "Failed to create identity store directory: " + parent.string());
        }
    }

    int rc = sqlite3_open(db_path.c_str(), &impl_->db);
    if (rc != SQLITE_OK) {
        std::string err_msg = impl_->db ? sqlite3_errmsg(impl_->db) : "unknown";
        if (impl_->db) { sqlite3_close(impl_->db); impl_->db = nullptr; }
        return PkgidError(PkgidError::IO,
            "Failed to open identity store: " + err_msg, "", db_path, 0);
    }

    auto setup = [&]() -> Status {
        PKGID_TRY(impl_->exec(
            "PRAGMA journal_mode=WAL;"
            "PRAGMA synchronous=NORMAL;"
        ));
        PKGID_TRY(impl_->init_schema());
        return ok_status();
    };

    auto status = setup();
    if (status.is_err()) {
        close();
        return std::move(status).with_file(db_path);
    }

    log::debug("opened identity store %s", db_path.c_str());
    return ok_status();
}

void IdentityStore::close() {
    if (impl_->db) {
        impl_->finalize_all();
        sqlite3_close(impl_->db);
        impl_->db = nullptr;
    }
}

bool IdentityStore::is_open() const {
    return impl_->db != nullptr;
}

Status IdentityStore::record(const ComponentRef& ref, const BuildIdentity& identity) {
    PKGID_TRY(impl_->require_open());

    std::string reference = ref.short_string();
    const std::string& package_id = identity.package_identity();

    PKGID_TRY(impl_->prepare(
        "INSERT OR REPLACE INTO identity (reference, package_id, info, created_at) "
        "VALUES (?, ?, ?, ?)", impl_->stmt_upsert));
    PKGID_TRY(impl_->prepare(
        "DELETE FROM identity_setting WHERE reference = ? AND package_id = ?",
        impl_->stmt_del_settings));
    PKGID_TRY(impl_->prepare(
        "INSERT INTO identity_setting (reference, package_id, name, value) "
        "VALUES (?, ?, ?, ?)", impl_->stmt_insert_setting));

    auto write = [&]() -> Status {
        std::string info = identity.canonical_dump();
        sqlite3_bind_text(impl_->stmt_upsert, 1, reference.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(impl_->stmt_upsert, 2, package_id.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(impl_->stmt_upsert, 3, info.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_int64(impl_->stmt_upsert, 4, now_epoch_sec());
        PKGID_TRY(impl_->step_done(impl_->stmt_upsert, "record identity"));

        sqlite3_bind_text(impl_->stmt_del_settings, 1, reference.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(impl_->stmt_del_settings, 2, package_id.c_str(), -1, SQLITE_TRANSIENT);
        PKGID_TRY(impl_->step_done(impl_->stmt_del_settings, "clear identity settings"));

        for (const auto& [name, value] : identity.full_settings.to_structured()) {
            sqlite3_reset(impl_->stmt_insert_setting);
            sqlite3_bind_text(impl_->stmt_insert_setting, 1, reference.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_text(impl_->stmt_insert_setting, 2, package_id.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_text(impl_->stmt_insert_setting, 3, name.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_text(impl_->stmt_insert_setting, 4, value.c_str(), -1, SQLITE_TRANSIENT);
            PKGID_TRY(impl_->step_done(impl_->stmt_insert_setting, "record identity setting"));
        }
        return ok_status();
    };
    PKGID_TRY(impl_->transaction(write));

    log::debug("recorded %s:%s", reference.c_str(), package_id.c_str());
    return ok_status();
}

Result<BuildIdentity> IdentityStore::lookup(const ComponentRef& ref,
                                            const std::string& package_id) {
    PKGID_TRY(impl_->require_open());
    PKGID_TRY(impl_->prepare(
        "SELECT info FROM identity WHERE reference = ? AND package_id = ?",
        impl_->stmt_lookup));

    std::string reference = ref.short_string();
    sqlite3_bind_text(impl_->stmt_lookup, 1, reference.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(impl_->stmt_lookup, 2, package_id.c_str(), -1, SQLITE_TRANSIENT);

    int rc = sqlite3_step(impl_->stmt_lookup);
    if (rc == SQLITE_DONE) {
        return PkgidError(PkgidError::NotFound,
            "no identity recorded for " + reference + ":" + package_id);
    }
    if (rc != SQLITE_ROW) {
        std::string msg = sqlite3_errmsg(impl_->db);
        sqlite3_reset(impl_->stmt_lookup);
        return PkgidError(PkgidError::IO, "Failed to look up identity: " + msg);
    }
    std::string info = column_text(impl_->stmt_lookup, 0);
    sqlite3_reset(impl_->stmt_lookup);
    return BuildIdentity::parse(info);
}

Result<std::vector<StoredIdentity>> IdentityStore::list(const ComponentRef& ref) {
    PKGID_TRY(impl_->require_open());
    PKGID_TRY(impl_->prepare(
        "SELECT reference, package_id, created_at FROM identity "
        "WHERE reference = ? ORDER BY package_id", impl_->stmt_list));

    std::string reference = ref.short_string();
    sqlite3_bind_text(impl_->stmt_list, 1, reference.c_str(), -1, SQLITE_TRANSIENT);

    std::vector<StoredIdentity> out;
    int rc;
    while ((rc = sqlite3_step(impl_->stmt_list)) == SQLITE_ROW) {
        StoredIdentity entry;
        entry.reference = column_text(impl_->stmt_list, 0);
        entry.package_id = column_text(impl_->stmt_list, 1);
        entry.created_at = sqlite3_column_int64(impl_->stmt_list, 2);
        out.push_back(std::move(entry));
    }
    if (rc != SQLITE_DONE) {
        return PkgidError(PkgidError::IO,
            std::string("Failed to list identities: ") + sqlite3_errmsg(impl_->db));
    }
    return Result<std::vector<StoredIdentity>>::ok(std::move(out));
}

Result<std::vector<std::string>> IdentityStore::search(
    const ComponentRef& ref, const std::map<std::string, std::string>& query)
{
    PKGID_TRY(impl_->require_open());

    std::string sql;
    if (query.empty()) {
        sql = "SELECT package_id FROM identity WHERE reference = ? ORDER BY package_id";
    } else {
        sql = "SELECT package_id FROM identity_setting WHERE reference = ? AND (";
        for (size_t i = 0; i < query.size(); ++i) {
            if (i > 0) sql += " OR ";
            sql += "(name = ? AND value = ?)";
        }
        sql += ") GROUP BY package_id HAVING COUNT(*) = ? ORDER BY package_id";
    }

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(impl_->db, sql.c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        if (stmt) sqlite3_finalize(stmt);
        return PkgidError(PkgidError::IO,
            std::string("SQLite prepare failed: ") + sqlite3_errmsg(impl_->db));
    }

    std::string reference = ref.short_string();
    int idx = 1;
    sqlite3_bind_text(stmt, idx++, reference.c_str(), -1, SQLITE_TRANSIENT);
    for (const auto& [name, value] : query) {
        sqlite3_bind_text(stmt, idx++, name.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, idx++, value.c_str(), -1, SQLITE_TRANSIENT);
    }
    if (!query.empty()) {
        sqlite3_bind_int64(stmt, idx, static_cast<int64_t>(query.size()));
    }

    std::vector<std::string> ids;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        ids.push_back(column_text(stmt, 0));
    }
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        return PkgidError(PkgidError::IO, "Failed to search identities");
    }
    return Result<std::vector<std::string>>::ok(std::move(ids));
}

Status IdentityStore::remove(const ComponentRef& ref, const std::string& package_id) {
    PKGID_TRY(impl_->require_open());
    PKGID_TRY(impl_->prepare(
        "DELETE FROM identity WHERE reference = ? AND package_id = ?",
        impl_->stmt_remove));
    PKGID_TRY(impl_->prepare(
        "DELETE FROM identity_setting WHERE reference = ? AND package_id = ?",
        impl_->stmt_del_settings));

    std::string reference = ref.short_string();
    return impl_->transaction([&]() -> Status {
        sqlite3_bind_text(impl_->stmt_remove, 1, reference.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(impl_->stmt_remove, 2, package_id.c_str(), -1, SQLITE_TRANSIENT);
        PKGID_TRY(impl_->step_done(impl_->stmt_remove, "remove identity"));

        sqlite3_bind_text(impl_->stmt_del_settings, 1, reference.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(impl_->stmt_del_settings, 2, package_id.c_str(), -1, SQLITE_TRANSIENT);
        return impl_->step_done(impl_->stmt_del_settings, "remove identity settings");
    });
}

Result<int64_t> IdentityStore::count() {
    PKGID_TRY(impl_->require_open());
    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(impl_->db, "SELECT COUNT(*) FROM identity", -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        if (stmt) sqlite3_finalize(stmt);
        return PkgidError(PkgidError::IO, "Failed to count identities");
    }
    int64_t n = 0;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        n = sqlite3_column_int64(stmt, 0);
    }
    sqlite3_finalize(stmt);
    return Result<int64_t>::ok(n);
}

} // namespace pkgid
