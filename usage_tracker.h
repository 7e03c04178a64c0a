/*
 * Copyright (C) 2025 James C. Owens
 *
 * This code is licensed under the MIT license. See LICENSE.md in the repository.
 */

#ifndef USAGE_TRACKER_H
#define USAGE_TRACKER_H

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <context.h>

struct sqlite3;

namespace AppLauncher {

//!
//! \brief One forward migration of the store schema. The statements are executed in one transaction together with
//! recording m_version in the schema_version table.
//!
struct MigrationStep
{
    int m_version;
    std::vector<std::string> m_statements;
};

//!
//! \brief The LaunchLookup class is the result of a last launch lookup. STORE_ERROR is kept distinct from ABSENT so
//! callers can report it, but both must be treated as "no evidence of use".
//!
class LaunchLookup
{
public:
    enum Status {
        FOUND,
        ABSENT,
        STORE_ERROR
    };

    Status m_status = ABSENT;

    //! Unix Epoch seconds (UTC). Only meaningful when m_status is FOUND.
    int64_t m_last_launch = 0;

    static std::string StatusToString(const Status& status);
};

//!
//! \brief The UsageTracker class is the persistent store of the last launch instant of each application.
//!
//! Every operation opens the store, takes the advisory lock, migrates the schema forward if needed, performs its read
//! or write and closes everything again. No connection is held between calls. The public operations never throw:
//! store failures are logged and reported through the return value.
//!
//! A store written by newer code (stored schema version above CURRENT_SCHEMA_VERSION) is never migrated. Reads are
//! still attempted; writes are refused with a warning.
//!
class UsageTracker
{
public:
    static constexpr int CURRENT_SCHEMA_VERSION = 1;

    explicit UsageTracker(const RunContext& context);

    //!
    //! \brief Sets the application's last launch instant to the context clock's current time (insert or update).
    //! \param app_id
    //! \return true if the record was written.
    //!
    bool RecordLaunch(const std::string& app_id) const;

    //!
    //! \brief Looks up the application's last launch instant.
    //! \param app_id
    //! \return Unix Epoch seconds (UTC), or std::nullopt if never recorded or the store could not be read.
    //!
    std::optional<int64_t> GetLastLaunch(const std::string& app_id) const;

    //!
    //! \brief Same as GetLastLaunch() but distinguishes a store failure from an absent record.
    //!
    LaunchLookup LookupLastLaunch(const std::string& app_id) const;

    //!
    //! \brief Opens (and if needed migrates) the store and reports the schema version it is at.
    //! \return schema version, or -1 if the store could not be opened or migrated.
    //!
    int GetSchemaVersion() const;

    //!
    //! \brief The ordered list of migrations from an empty store to CURRENT_SCHEMA_VERSION.
    //!
    static const std::vector<MigrationStep>& GetMigrationSteps();

private:
    class Session;

    //!
    //! \brief Creates the state directory if needed, acquires the lock, opens the database and migrates it. Throws
    //! StoreException or MigrationException.
    //!
    std::unique_ptr<Session> OpenSession() const;

    //!
    //! \brief Reads the stored schema version. 0 if the version table does not exist or is empty.
    //!
    static int ReadSchemaVersion(sqlite3* db);

    //!
    //! \brief Applies every step above the stored version, in order, stamping each with migrated_at. Returns the
    //! resulting stored version. Throws MigrationException if a step fails; that step is rolled back.
    //!
    static int Migrate(sqlite3* db, const fs::path& store_path, int64_t migrated_at);

    RunContext m_context;
};

} // namespace AppLauncher

#endif // USAGE_TRACKER_H
