#pragma once
#include "AuthManager.hpp"
#include "Profile.hpp"

#include <string>
#include <vector>
#include <optional>
#include <cstdint>

// Forward-declare sqlite3 so consumers of this header don't need sqlite3.h
struct sqlite3;

// Profile row as persisted
struct StoredProfile {
    int id;
    Profile profile;
    std::string created_at; // ISO-8601 (UTC)
};

// Storage collaborator: persists the installation record and the profile
// table. The derivation engine never touches it.
class DatabaseManager {
public:
    explicit DatabaseManager(const std::string& dbPath);
    ~DatabaseManager();

    DatabaseManager(const DatabaseManager&) = delete;
    DatabaseManager& operator=(const DatabaseManager&) = delete;

    // Create tables if not present
    void init();

    // ---- Installation (id=1): salt + verifier + algorithm version
    void storeInstallation(const Installation& installation);
    std::optional<Installation> loadInstallation() const;

    // ---- Profiles CRUD. site_label is unique.
    int addProfile(const Profile& profile);
    std::optional<StoredProfile> getProfileById(int id) const;
    std::optional<StoredProfile> findProfileBySite(const std::string& siteLabel) const;
    std::vector<StoredProfile>   searchBySite(const std::string& query) const;
    std::vector<StoredProfile>   listProfiles() const;
    void updateProfile(int id, const Profile& profile);
    // Rotate: counter += 1. Returns the new counter.
    std::uint32_t bumpCounter(int id);
    void deleteProfile(int id);

private:
    std::string m_dbPath;
    sqlite3*    m_db = nullptr; // persistent DB connection

    // helper to run raw SQL without parameters on m_db
    void exec(const std::string& sql) const;
};
