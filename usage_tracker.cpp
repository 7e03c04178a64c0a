/*
 * Copyright (C) 2025 James C. Owens
 *
 * This code is licensed under the MIT license. See LICENSE.md in the repository.
 */

#include <sqlite3.h>

#include <usage_tracker.h>

using namespace AppLauncher;

namespace {

struct DatabaseCloser
{
    void operator()(sqlite3* db) const
    {
        if (db != nullptr && sqlite3_close(db) != SQLITE_OK) {
            error_log("%s: sqlite3_close failed: %s",
                      __func__,
                      sqlite3_errmsg(db));
        }
    }
};

struct StatementFinalizer
{
    void operator()(sqlite3_stmt* stmt) const
    {
        sqlite3_finalize(stmt);
    }
};

typedef std::unique_ptr<sqlite3_stmt, StatementFinalizer> StatementPtr;

StatementPtr Prepare(sqlite3* db, const std::string& sql)
{
    sqlite3_stmt* stmt = nullptr;

    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        sqlite3_finalize(stmt);
        throw StoreException("Unable to prepare \"" + sql + "\": " + sqlite3_errmsg(db));
    }

    return StatementPtr(stmt);
}

void Exec(sqlite3* db, const std::string& sql)
{
    char* errmsg = nullptr;

    if (sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &errmsg) != SQLITE_OK) {
        std::string message = (errmsg != nullptr) ? errmsg : sqlite3_errmsg(db);
        sqlite3_free(errmsg);

        throw StoreException("Statement \"" + sql + "\" failed: " + message);
    }
}

void BindText(sqlite3* db, sqlite3_stmt* stmt, int index, const std::string& value)
{
    if (sqlite3_bind_text(stmt, index, value.c_str(), static_cast<int>(value.size()), SQLITE_TRANSIENT) != SQLITE_OK) {
        throw StoreException(std::string("Unable to bind parameter: ") + sqlite3_errmsg(db));
    }
}

} // anonymous namespace

//!
//! \brief Holds everything that must live for the duration of one store operation. The database is declared after
//! the lock so it is closed before the lock is released.
//!
class UsageTracker::Session
{
public:
    std::unique_ptr<FileLock> m_lock;
    std::unique_ptr<sqlite3, DatabaseCloser> m_db;
    int m_version = 0;
};

// Class LaunchLookup

std::string LaunchLookup::StatusToString(const Status& status)
{
    std::string out;

    switch (status) {
    case FOUND:
        out = "FOUND";
        break;
    case ABSENT:
        out = "ABSENT";
        break;
    case STORE_ERROR:
        out = "STORE_ERROR";
        break;
    }

    return out;
}

// Class UsageTracker

UsageTracker::UsageTracker(const RunContext& context)
    : m_context(context)
{}

const std::vector<MigrationStep>& UsageTracker::GetMigrationSteps()
{
    // New steps are appended here with the next version number. Existing steps are never edited.
    static const std::vector<MigrationStep> steps = {
        {1, {
                "CREATE TABLE IF NOT EXISTS launches ("
                "app_name TEXT PRIMARY KEY, "
                "last_launch_iso TEXT NOT NULL)",
                "CREATE TABLE IF NOT EXISTS schema_version ("
                "version INTEGER PRIMARY KEY, "
                "migrated_at TEXT NOT NULL)"
            }}
    };

    return steps;
}

int UsageTracker::ReadSchemaVersion(sqlite3* db)
{
    StatementPtr table_stmt = Prepare(db, "SELECT COUNT(*) FROM sqlite_master WHERE type = 'table' AND name = 'schema_version'");

    if (sqlite3_step(table_stmt.get()) != SQLITE_ROW) {
        throw StoreException(std::string("Unable to inspect store schema: ") + sqlite3_errmsg(db));
    }

    if (sqlite3_column_int(table_stmt.get(), 0) == 0) {
        return 0;
    }

    StatementPtr version_stmt = Prepare(db, "SELECT MAX(version) FROM schema_version");

    if (sqlite3_step(version_stmt.get()) != SQLITE_ROW) {
        throw StoreException(std::string("Unable to read schema version: ") + sqlite3_errmsg(db));
    }

    if (sqlite3_column_type(version_stmt.get(), 0) == SQLITE_NULL) {
        return 0;
    }

    return sqlite3_column_int(version_stmt.get(), 0);
}

int UsageTracker::Migrate(sqlite3* db, const fs::path& store_path, int64_t migrated_at)
{
    int version = ReadSchemaVersion(db);

    if (version > CURRENT_SCHEMA_VERSION) {
        log("WARNING: %s: Store %s is at schema version %i, newer than the supported version %i. The store will not "
            "be migrated and will not be written. Please update app_launcher.",
            __func__,
            store_path,
            version,
            CURRENT_SCHEMA_VERSION);

        return version;
    }

    for (const auto& step : GetMigrationSteps()) {
        if (step.m_version <= version) {
            continue;
        }

        log("INFO: %s: Migrating store %s from schema version %i to %i",
            __func__,
            store_path,
            version,
            step.m_version);

        try {
            Exec(db, "BEGIN IMMEDIATE");
        } catch (StoreException& e) {
            throw MigrationException(e.what(), step.m_version);
        }

        try {
            // Another writer may have migrated between the read above and taking the write lock.
            int current = ReadSchemaVersion(db);

            if (current >= step.m_version) {
                Exec(db, "COMMIT");
                version = current;
                continue;
            }

            for (const auto& statement : step.m_statements) {
                Exec(db, statement);
            }

            StatementPtr insert_stmt = Prepare(db, "INSERT INTO schema_version (version, migrated_at) VALUES (?, ?)");

            if (sqlite3_bind_int(insert_stmt.get(), 1, step.m_version) != SQLITE_OK) {
                throw StoreException(std::string("Unable to bind schema version: ") + sqlite3_errmsg(db));
            }

            BindText(db, insert_stmt.get(), 2, FormatISO8601DateTime(migrated_at));

            if (sqlite3_step(insert_stmt.get()) != SQLITE_DONE) {
                throw StoreException(std::string("Unable to record schema version: ") + sqlite3_errmsg(db));
            }

            insert_stmt.reset();

            Exec(db, "COMMIT");
        } catch (StoreException& e) {
            char* errmsg = nullptr;

            if (sqlite3_exec(db, "ROLLBACK", nullptr, nullptr, &errmsg) != SQLITE_OK) {
                error_log("%s: Rollback of failed migration to version %i failed: %s",
                          __func__,
                          step.m_version,
                          errmsg != nullptr ? errmsg : "unknown error");
            }

            sqlite3_free(errmsg);

            throw MigrationException(e.what(), step.m_version);
        }

        version = step.m_version;

        log("INFO: %s: Store migrated to schema version %i",
            __func__,
            version);
    }

    return version;
}

std::unique_ptr<UsageTracker::Session> UsageTracker::OpenSession() const
{
    if (!m_context.m_clock || !m_context.m_platform || m_context.m_store_path.empty()) {
        throw StoreException("Run context is incomplete: store path, clock and platform are required.");
    }

    const fs::path& store_path = m_context.m_store_path;
    fs::path state_dir = store_path.parent_path();
    std::error_code ec;

    if (!state_dir.empty() && !fs::exists(state_dir, ec)) {
        fs::create_directories(state_dir, ec);

        if (ec) {
            throw StoreException("Unable to create state directory " + state_dir.string() + ": " + ec.message());
        }

        fs::permissions(state_dir, fs::perms::owner_all, fs::perm_options::replace, ec);

        if (ec) {
            log("WARNING: %s: Unable to set permissions on state directory %s: %s",
                __func__,
                state_dir,
                ec.message());
        }
    }

    auto session = std::make_unique<Session>();

    if (!m_context.m_lock_path.empty()) {
        session->m_lock = m_context.m_platform->AcquireLock(m_context.m_lock_path, m_context.m_lock_timeout);
    }

    sqlite3* db = nullptr;
    int rc = sqlite3_open_v2(store_path.c_str(), &db, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE, nullptr);

    // The handle must be released even when the open failed.
    session->m_db.reset(db);

    if (rc != SQLITE_OK) {
        throw StoreException("Unable to open store " + store_path.string() + ": "
                             + (db != nullptr ? sqlite3_errmsg(db) : sqlite3_errstr(rc)));
    }

    sqlite3_busy_timeout(db, static_cast<int>(m_context.m_lock_timeout.count()));

    session->m_version = Migrate(db, store_path, m_context.m_clock->Now());

    return session;
}

bool UsageTracker::RecordLaunch(const std::string& app_id) const
{
    try {
        std::unique_ptr<Session> session = OpenSession();

        if (session->m_version > CURRENT_SCHEMA_VERSION) {
            log("WARNING: %s: Not recording launch of '%s': store schema version %i is newer than supported.",
                __func__,
                app_id,
                session->m_version);

            return false;
        }

        sqlite3* db = session->m_db.get();
        std::string now_iso = FormatISO8601DateTime(m_context.m_clock->Now());

        StatementPtr stmt = Prepare(db, "INSERT INTO launches (app_name, last_launch_iso) VALUES (?, ?) "
                                        "ON CONFLICT(app_name) DO UPDATE SET last_launch_iso = excluded.last_launch_iso");

        BindText(db, stmt.get(), 1, app_id);
        BindText(db, stmt.get(), 2, now_iso);

        if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
            throw StoreException(std::string("Unable to write launch record: ") + sqlite3_errmsg(db));
        }

        debug_log("INFO: %s: Recorded launch of '%s' at %s",
                  __func__,
                  app_id,
                  now_iso);

        return true;
    } catch (MigrationException& e) {
        error_log("%s: Store migration failed while recording launch of '%s': %s",
                  __func__,
                  app_id,
                  e.what());
    } catch (StoreException& e) {
        log("WARNING: %s: Failed to record launch of '%s': %s",
            __func__,
            app_id,
            e.what());
    }

    return false;
}

LaunchLookup UsageTracker::LookupLastLaunch(const std::string& app_id) const
{
    LaunchLookup lookup;

    try {
        std::unique_ptr<Session> session = OpenSession();
        sqlite3* db = session->m_db.get();

        StatementPtr stmt = Prepare(db, "SELECT last_launch_iso FROM launches WHERE app_name = ?");

        BindText(db, stmt.get(), 1, app_id);

        int rc = sqlite3_step(stmt.get());

        if (rc == SQLITE_DONE) {
            lookup.m_status = LaunchLookup::ABSENT;
            return lookup;
        }

        if (rc != SQLITE_ROW) {
            throw StoreException(std::string("Unable to read launch record: ") + sqlite3_errmsg(db));
        }

        const unsigned char* text = sqlite3_column_text(stmt.get(), 0);
        std::string last_launch_iso = (text != nullptr) ? reinterpret_cast<const char*>(text) : std::string {};

        std::optional<int64_t> last_launch = ParseISO8601DateTime(last_launch_iso);

        if (!last_launch) {
            log("WARNING: %s: Stored launch time for '%s' is not a valid timestamp (\"%s\"). Treating as absent.",
                __func__,
                app_id,
                last_launch_iso);

            lookup.m_status = LaunchLookup::ABSENT;
            return lookup;
        }

        lookup.m_status = LaunchLookup::FOUND;
        lookup.m_last_launch = *last_launch;
    } catch (MigrationException& e) {
        error_log("%s: Store migration failed while reading launch of '%s': %s",
                  __func__,
                  app_id,
                  e.what());

        lookup.m_status = LaunchLookup::STORE_ERROR;
    } catch (StoreException& e) {
        log("WARNING: %s: Failed to read launch time of '%s': %s",
            __func__,
            app_id,
            e.what());

        lookup.m_status = LaunchLookup::STORE_ERROR;
    }

    return lookup;
}

std::optional<int64_t> UsageTracker::GetLastLaunch(const std::string& app_id) const
{
    LaunchLookup lookup = LookupLastLaunch(app_id);

    if (lookup.m_status != LaunchLookup::FOUND) {
        return std::nullopt;
    }

    return lookup.m_last_launch;
}

int UsageTracker::GetSchemaVersion() const
{
    try {
        return OpenSession()->m_version;
    } catch (StoreException& e) {
        error_log("%s: Unable to open store: %s",
                  __func__,
                  e.what());
    }

    return -1;
}
