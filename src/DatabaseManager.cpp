// src/DatabaseManager.cpp
#include "DatabaseManager.hpp"

#include <sqlite3.h>
#include <stdexcept>
#include <string>
#include <vector>
#include <memory>     // std::unique_ptr
#include <optional>   // std::optional
#include <chrono>
#include <iomanip>
#include <limits>
#include <sstream>
#include <cstdint>

// Helper: RAII closer for sqlite3_stmt* + small helpers
namespace {
    struct StmtCloser {
        void operator()(sqlite3_stmt* stmt) const {
            if (stmt) sqlite3_finalize(stmt);
        }
    };
    using Stmt = std::unique_ptr<sqlite3_stmt, StmtCloser>;

    // UTC now in ISO-8601 "YYYY-MM-DDTHH:MM:SSZ"
    std::string now_utc_iso8601() {
        using namespace std::chrono;
        auto now  = system_clock::now();
        auto secs = time_point_cast<seconds>(now);
        std::time_t t = system_clock::to_time_t(secs);
        std::tm tm{};
    #if defined(_WIN32)
        gmtime_s(&tm, &t);
    #else
        gmtime_r(&t, &tm);
    #endif
        std::ostringstream oss;
        oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
        return oss.str();
    }

    // Escape %, _ and \ for use in a LIKE ... ESCAPE '\' clause
    std::string escape_like(const std::string& in) {
        std::string out;
        out.reserve(in.size() * 2);
        for (char ch : in) {
            if (ch == '%' || ch == '_' || ch == '\\') out.push_back('\\');
            out.push_back(ch);
        }
        return out;
    }

    // Null-safe read of TEXT columns
    inline std::string read_text_nullable(sqlite3_stmt* st, int col) {
        const unsigned char* p = sqlite3_column_text(st, col);
        return p ? reinterpret_cast<const char*>(p) : std::string{};
    }

    std::vector<std::uint8_t> read_blob(sqlite3_stmt* st, int col) {
        const void* p = sqlite3_column_blob(st, col);
        int n = sqlite3_column_bytes(st, col);
        std::vector<std::uint8_t> out;
        if (p && n > 0) {
            const auto* b = static_cast<const std::uint8_t*>(p);
            out.assign(b, b + n);
        }
        return out;
    }

    Stmt prepare(sqlite3* db, const char* sql, const char* what) {
        sqlite3_stmt* raw = nullptr;
        if (sqlite3_prepare_v2(db, sql, -1, &raw, nullptr) != SQLITE_OK) {
            throw std::runtime_error(std::string("sqlite3_prepare_v2(") + what + "): "
                                     + sqlite3_errmsg(db));
        }
        return Stmt(raw);
    }

    void check_bind(sqlite3* db, int rc, const char* what) {
        if (rc != SQLITE_OK) throw std::runtime_error(std::string("bind ") + what + ": " + sqlite3_errmsg(db));
    }

    void step_done(sqlite3* db, sqlite3_stmt* st, const char* what) {
        if (sqlite3_step(st) != SQLITE_DONE) {
            throw std::runtime_error(std::string("step ") + what + ": " + sqlite3_errmsg(db));
        }
    }

    // Binds site_label, length, classes, counter, algorithm at 1..5
    void bind_profile(sqlite3* db, sqlite3_stmt* st, const Profile& p) {
        check_bind(db, sqlite3_bind_text(st, 1, p.siteLabel.c_str(), -1, SQLITE_TRANSIENT), "site_label");
        check_bind(db, sqlite3_bind_int64(st, 2, p.length), "length");
        check_bind(db, sqlite3_bind_int(st, 3, p.classes.mask()), "classes");
        check_bind(db, sqlite3_bind_int64(st, 4, p.counter), "counter");
        check_bind(db, sqlite3_bind_int(st, 5, static_cast<int>(p.version)), "algorithm");
    }

    // Column order: id, site_label, length, classes, counter, algorithm, created_at
    StoredProfile read_profile(sqlite3_stmt* st) {
        StoredProfile r;
        r.id                 = sqlite3_column_int(st, 0);
        r.profile.siteLabel  = read_text_nullable(st, 1);
        r.profile.length     = static_cast<std::uint32_t>(sqlite3_column_int64(st, 2));
        r.profile.classes    = CharClassSet(static_cast<std::uint8_t>(sqlite3_column_int(st, 3)));
        r.profile.counter    = static_cast<std::uint32_t>(sqlite3_column_int64(st, 4));
        r.profile.version    = static_cast<AlgorithmVersion>(sqlite3_column_int(st, 5));
        r.created_at         = read_text_nullable(st, 6);
        return r;
    }

    const char* PROFILE_COLUMNS =
        "SELECT id, site_label, length, classes, counter, algorithm, created_at FROM profiles ";
}

// ---- Persistent-connection ctor/dtor ----
DatabaseManager::DatabaseManager(const std::string& dbPath)
    : m_dbPath(dbPath), m_db(nullptr)
{
    int rc = sqlite3_open_v2(
        m_dbPath.c_str(),
        &m_db,
        SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE,
        nullptr
    );
    if (rc != SQLITE_OK || !m_db) {
        std::string msg = m_db ? sqlite3_errmsg(m_db) : "unknown";
        if (m_db) sqlite3_close(m_db);
        m_db = nullptr;
        throw std::runtime_error("sqlite3_open_v2 failed: " + msg);
    }
}

DatabaseManager::~DatabaseManager() {
    if (m_db) {
        sqlite3_close(m_db);
        m_db = nullptr;
    }
}

// Run raw SQL (no parameters) on the same connection
void DatabaseManager::exec(const std::string& sql) const {
    char* errMsg = nullptr;
    int rc = sqlite3_exec(m_db, sql.c_str(), nullptr, nullptr, &errMsg);
    if (rc != SQLITE_OK) {
        std::string msg = errMsg ? errMsg : "unknown";
        sqlite3_free(errMsg);
        throw std::runtime_error("sqlite3_exec failed: " + msg);
    }
}

void DatabaseManager::init() {
    static const char* kSchema = R"SQL(
CREATE TABLE IF NOT EXISTS installation (
  id         INTEGER PRIMARY KEY CHECK (id = 1),
  salt       BLOB NOT NULL,
  verifier   BLOB NOT NULL,
  algorithm  INTEGER NOT NULL,
  created_at TEXT NOT NULL
);

CREATE TABLE IF NOT EXISTS profiles (
  id         INTEGER PRIMARY KEY AUTOINCREMENT,
  site_label TEXT NOT NULL UNIQUE,
  length     INTEGER NOT NULL,
  classes    INTEGER NOT NULL,
  counter    INTEGER NOT NULL DEFAULT 0 CHECK (counter >= 0),
  algorithm  INTEGER NOT NULL,
  created_at TEXT NOT NULL
);
)SQL";

    exec(kSchema);
}

// ---- Installation (id=1)

void DatabaseManager::storeInstallation(const Installation& installation) {
    if (installation.salt.empty() || installation.verifier.empty()) {
        throw std::invalid_argument("storeInstallation: salt and verifier must not be empty");
    }

    const char* sql =
        "INSERT INTO installation (id, salt, verifier, algorithm, created_at) VALUES (1, ?, ?, ?, ?) "
        "ON CONFLICT(id) DO UPDATE SET salt=excluded.salt, verifier=excluded.verifier, "
        "algorithm=excluded.algorithm;";
    Stmt stmt = prepare(m_db, sql, "storeInstallation");

    const std::string now = now_utc_iso8601();
    check_bind(m_db, sqlite3_bind_blob(stmt.get(), 1, installation.salt.data(),
                                       static_cast<int>(installation.salt.size()), SQLITE_TRANSIENT), "salt");
    check_bind(m_db, sqlite3_bind_blob(stmt.get(), 2, installation.verifier.data(),
                                       static_cast<int>(installation.verifier.size()), SQLITE_TRANSIENT), "verifier");
    check_bind(m_db, sqlite3_bind_int(stmt.get(), 3, static_cast<int>(installation.algorithm)), "algorithm");
    check_bind(m_db, sqlite3_bind_text(stmt.get(), 4, now.c_str(), -1, SQLITE_TRANSIENT), "created_at");

    step_done(m_db, stmt.get(), "storeInstallation");
}

std::optional<Installation> DatabaseManager::loadInstallation() const {
    Stmt stmt = prepare(m_db, "SELECT salt, verifier, algorithm FROM installation WHERE id = 1;",
                        "loadInstallation");

    int rc = sqlite3_step(stmt.get());
    if (rc == SQLITE_ROW) {
        Installation inst;
        inst.salt      = read_blob(stmt.get(), 0);
        inst.verifier  = read_blob(stmt.get(), 1);
        inst.algorithm = static_cast<AlgorithmVersion>(sqlite3_column_int(stmt.get(), 2));
        return inst;
    } else if (rc == SQLITE_DONE) {
        return std::nullopt;
    } else {
        throw std::runtime_error(std::string("sqlite3_step(loadInstallation): ") + sqlite3_errmsg(m_db));
    }
}

// ---- Profiles

int DatabaseManager::addProfile(const Profile& profile) {
    validateProfile(profile);

    const char* sql =
        "INSERT INTO profiles (site_label, length, classes, counter, algorithm, created_at) "
        "VALUES (?, ?, ?, ?, ?, ?);";
    Stmt stmt = prepare(m_db, sql, "addProfile");

    const std::string now = now_utc_iso8601();
    bind_profile(m_db, stmt.get(), profile);
    check_bind(m_db, sqlite3_bind_text(stmt.get(), 6, now.c_str(), -1, SQLITE_TRANSIENT), "created_at");

    step_done(m_db, stmt.get(), "addProfile");
    return static_cast<int>(sqlite3_last_insert_rowid(m_db));
}

std::optional<StoredProfile> DatabaseManager::getProfileById(int id) const {
    const std::string sql = std::string(PROFILE_COLUMNS) + "WHERE id = ?;";
    Stmt stmt = prepare(m_db, sql.c_str(), "getProfileById");
    check_bind(m_db, sqlite3_bind_int(stmt.get(), 1, id), "id");

    int rc = sqlite3_step(stmt.get());
    if (rc == SQLITE_ROW) return read_profile(stmt.get());
    if (rc == SQLITE_DONE) return std::nullopt;
    throw std::runtime_error(std::string("sqlite3_step(getProfileById): ") + sqlite3_errmsg(m_db));
}

std::optional<StoredProfile> DatabaseManager::findProfileBySite(const std::string& siteLabel) const {
    const std::string sql = std::string(PROFILE_COLUMNS) + "WHERE site_label = ?;";
    Stmt stmt = prepare(m_db, sql.c_str(), "findProfileBySite");
    check_bind(m_db, sqlite3_bind_text(stmt.get(), 1, siteLabel.c_str(), -1, SQLITE_TRANSIENT), "site_label");

    int rc = sqlite3_step(stmt.get());
    if (rc == SQLITE_ROW) return read_profile(stmt.get());
    if (rc == SQLITE_DONE) return std::nullopt;
    throw std::runtime_error(std::string("sqlite3_step(findProfileBySite): ") + sqlite3_errmsg(m_db));
}

std::vector<StoredProfile> DatabaseManager::searchBySite(const std::string& query) const {
    const std::string sql = std::string(PROFILE_COLUMNS)
        + "WHERE site_label LIKE ? ESCAPE '\\' ORDER BY site_label;";
    Stmt stmt = prepare(m_db, sql.c_str(), "searchBySite");

    const std::string pattern = "%" + escape_like(query) + "%";
    check_bind(m_db, sqlite3_bind_text(stmt.get(), 1, pattern.c_str(), -1, SQLITE_TRANSIENT), "pattern");

    std::vector<StoredProfile> out;
    int rc;
    while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
        out.push_back(read_profile(stmt.get()));
    }
    if (rc != SQLITE_DONE) {
        throw std::runtime_error(std::string("sqlite3_step(searchBySite): ") + sqlite3_errmsg(m_db));
    }
    return out;
}

std::vector<StoredProfile> DatabaseManager::listProfiles() const {
    const std::string sql = std::string(PROFILE_COLUMNS) + "ORDER BY site_label;";
    Stmt stmt = prepare(m_db, sql.c_str(), "listProfiles");

    std::vector<StoredProfile> out;
    int rc;
    while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
        out.push_back(read_profile(stmt.get()));
    }
    if (rc != SQLITE_DONE) {
        throw std::runtime_error(std::string("sqlite3_step(listProfiles): ") + sqlite3_errmsg(m_db));
    }
    return out;
}

void DatabaseManager::updateProfile(int id, const Profile& profile) {
    validateProfile(profile);

    const char* sql =
        "UPDATE profiles SET site_label = ?, length = ?, classes = ?, counter = ?, algorithm = ? "
        "WHERE id = ?;";
    Stmt stmt = prepare(m_db, sql, "updateProfile");

    bind_profile(m_db, stmt.get(), profile);
    check_bind(m_db, sqlite3_bind_int(stmt.get(), 6, id), "id");

    step_done(m_db, stmt.get(), "updateProfile");
    if (sqlite3_changes(m_db) == 0) {
        throw std::runtime_error("updateProfile: no profile with id " + std::to_string(id));
    }
}

std::uint32_t DatabaseManager::bumpCounter(int id) {
    auto row = getProfileById(id);
    if (!row) {
        throw std::runtime_error("bumpCounter: no profile with id " + std::to_string(id));
    }
    if (row->profile.counter == std::numeric_limits<std::uint32_t>::max()) {
        throw std::overflow_error("bumpCounter: counter is at its maximum");
    }
    row->profile.counter += 1;
    updateProfile(id, row->profile);
    return row->profile.counter;
}

void DatabaseManager::deleteProfile(int id) {
    Stmt stmt = prepare(m_db, "DELETE FROM profiles WHERE id = ?;", "deleteProfile");
    check_bind(m_db, sqlite3_bind_int(stmt.get(), 1, id), "id");
    step_done(m_db, stmt.get(), "deleteProfile");
}
