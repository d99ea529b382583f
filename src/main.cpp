// src/main.cpp
#include "AppConfig.hpp"
#include "AuthManager.hpp"
#include "DatabaseManager.hpp"
#include "PasswordDeriver.hpp"
#include "RandomSource.hpp"
#include "Session.hpp"
#include "console_io.hpp"
#include "errors.hpp"
#include "secure_wipe.hpp"

#include <filesystem>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

// ----- Small helpers -----

static void print_profile(const StoredProfile& r) {
    std::cout << "  [" << r.id << "] " << r.profile.siteLabel
              << "  len=" << r.profile.length
              << "  classes=" << r.profile.classes.toString()
              << "  counter=" << r.profile.counter
              << "  alg=v" << static_cast<unsigned>(r.profile.version)
              << "  created=" << r.created_at << "\n";
}

static std::optional<int> prompt_id(const std::string& message) {
    try { return std::stoi(prompt_line(message)); }
    catch (const std::invalid_argument&) {}
    catch (const std::out_of_range&) {}
    std::cout << "Invalid id.\n";
    return std::nullopt;
}

// Blank keeps `current`
static std::uint32_t prompt_length(const std::string& message, std::uint32_t current) {
    std::string s = prompt_line(message);
    if (s.empty()) return current;
    return parseLength(s);
}

static CharClassSet prompt_classes(const std::string& message, CharClassSet current) {
    std::string s = prompt_line(message);
    if (s.empty()) return current;
    return CharClassSet::parse(s);
}

static void show_secret(std::string& value, const std::string& label, const AppConfig& cfg) {
    if (cfg.showPasswords || prompt_yes_no("Reveal " + label + "? (y/N): ")) {
        std::cout << label << ": " << value << "\n";
    } else {
        std::cout << label << ": " << std::string(value.size(), '*') << "\n";
    }
    secure_wipe(value);
}

// ----- Menu actions -----

static void action_derive(DatabaseManager& db, const UnlockedSession& session, const AppConfig& cfg) {
    std::string site = prompt_line("Site: ");
    auto row = db.findProfileBySite(site);
    if (!row) { std::cout << "No profile for '" << site << "'.\n"; return; }

    std::cout << "Deriving...\n";
    std::string pw = session.derivePassword(row->profile);
    show_secret(pw, "Password", cfg);
}

static void action_derive_key(DatabaseManager& db, const UnlockedSession& session, const AppConfig& cfg) {
    std::string site = prompt_line("Site: ");
    auto row = db.findProfileBySite(site);
    if (!row) { std::cout << "No profile for '" << site << "'.\n"; return; }

    std::string bits = prompt_line("Key size, 256 or 512 (default 256): ");
    KeySize size = KeySize::Bits256;
    if (bits == "512") size = KeySize::Bits512;
    else if (!bits.empty() && bits != "256") { std::cout << "Unsupported key size.\n"; return; }

    std::string key = session.deriveRawKey(row->profile, size);
    show_secret(key, "Key (base64)", cfg);
}

static void action_add(DatabaseManager& db) {
    Profile p;
    p.siteLabel = prompt_line("Site: ");
    p.length    = prompt_length("Length " + std::to_string(Profile::MIN_LENGTH) + "-"
                                + std::to_string(Profile::MAX_LENGTH) + " (default 16): ", 16);
    p.classes   = prompt_classes("Classes, any of l u d s (default luds): ", CharClassSet::all());
    p.counter   = 0;

    int id = db.addProfile(p);
    std::cout << "Added profile with id " << id << "\n";
}

static void action_list(DatabaseManager& db) {
    auto rows = db.listProfiles();
    if (rows.empty()) { std::cout << "No profiles stored.\n"; return; }
    for (const auto& r : rows) print_profile(r);
}

static void action_search(DatabaseManager& db) {
    auto rows = db.searchBySite(prompt_line("Search site (substring): "));
    if (rows.empty()) { std::cout << "No matches.\n"; return; }
    for (const auto& r : rows) print_profile(r);
}

static void action_edit(DatabaseManager& db) {
    auto id = prompt_id("Enter id to edit: ");
    if (!id) return;
    auto row = db.getProfileById(*id);
    if (!row) { std::cout << "Not found.\n"; return; }

    Profile p = row->profile;
    p.length  = prompt_length("New length (blank=keep " + std::to_string(p.length) + "): ", p.length);
    p.classes = prompt_classes("New classes (blank=keep " + p.classes.toString() + "): ", p.classes);

    db.updateProfile(*id, p);
    std::cout << "Updated. The derived password for this site has changed.\n";
}

static void action_rotate(DatabaseManager& db) {
    auto id = prompt_id("Enter id to rotate: ");
    if (!id) return;
    std::uint32_t counter = db.bumpCounter(*id);
    std::cout << "Counter is now " << counter << ".\n";
}

static void action_delete(DatabaseManager& db) {
    auto id = prompt_id("Enter id to delete: ");
    if (!id) return;

    if (prompt_line("Type 'YES' to confirm deletion: ") == "YES") {
        db.deleteProfile(*id);
        std::cout << "Deleted id " << *id << ".\n";
    } else {
        std::cout << "Aborted.\n";
    }
}

// ----- Setup / unlock -----

// Setup -> Unlocked. Returns nullopt when the two entries disagree.
static std::optional<UnlockedSession> run_setup(DatabaseManager& db, const AuthManager& auth) {
    std::cout << "No installation found (first run).\n";
    std::string pw1 = prompt_hidden("Enter new master secret: ");
    std::string pw2 = prompt_hidden("Confirm master secret: ");

    if (pw1.empty() || pw1 != pw2) {
        secure_wipe(pw1);
        secure_wipe(pw2);
        std::cerr << "[Error] Secrets are empty or do not match.\n";
        return std::nullopt;
    }
    secure_wipe(pw2);

    Installation inst = auth.createInstallation(pw1);
    db.storeInstallation(inst);
    std::cout << "Installation created.\n";
    return auth.unlock(std::move(pw1), inst);
}

// Locked -> Unlocked, three attempts.
static std::optional<UnlockedSession> run_unlock(const AuthManager& auth, const Installation& inst) {
    for (int attempt = 0; attempt < 3; ++attempt) {
        try {
            return auth.unlock(prompt_hidden("Master secret: "), inst);
        } catch (const AuthError& ex) {
            std::cerr << "[Error] " << ex.what() << "\n";
        }
    }
    return std::nullopt;
}

// ----- Main -----

int main(int argc, char** argv) {
    AppConfig cfg;
    try {
        cfg = loadConfig(std::vector<std::string>(argv + 1, argv + argc));
    } catch (const std::invalid_argument& ex) {
        std::cerr << "[Error] " << ex.what() << "\n" << usage();
        return 64;
    }
    if (cfg.showHelp) {
        std::cout << usage();
        return 0;
    }

    try {
        std::filesystem::path dbPath(cfg.dbPath);
        if (dbPath.has_parent_path()) std::filesystem::create_directories(dbPath.parent_path());
        DatabaseManager db(cfg.dbPath);
        db.init();

        OpenSslRandomSource rng;
        AuthManager auth(rng);
        std::optional<Installation> inst = db.loadInstallation();

        std::optional<UnlockedSession> session;
        if (initialState(inst) == SessionState::Setup) {
            session = run_setup(db, auth);
            if (!session) return 1;
            inst = db.loadInstallation();
        } else if (!isKnownAlgorithm(inst->algorithm)) {
            std::cerr << "[Fatal] Installation uses an unknown algorithm version.\n";
            return 3;
        }

        for (;;) {
            if (!session || session->locked()) {
                std::cout << "Locked.\n";
                session = run_unlock(auth, *inst);
                if (!session) {
                    std::cerr << "[Error] Too many failed attempts.\n";
                    return 2;
                }
                std::cout << "Unlocked.\n";
            }

            std::cout << "\n=== Menu ===\n"
                         "1) Derive password\n"
                         "2) Add profile\n"
                         "3) List profiles\n"
                         "4) Search profiles\n"
                         "5) Edit profile\n"
                         "6) Rotate password (bump counter)\n"
                         "7) Delete profile\n"
                         "8) Derive raw key (base64)\n"
                         "l) Lock\n"
                         "q) Quit\n";
            std::cout << "> " << std::flush;
            if (!wait_for_input(session->idleRemaining(UnlockedSession::Clock::now(), cfg.idleTimeout))) {
                session->lock();
                std::cout << "\nLocked after " << cfg.idleTimeout.count() << "s of inactivity.\n";
                continue;
            }
            std::string choice = prompt_line("");

            if (session->idleExpired(UnlockedSession::Clock::now(), cfg.idleTimeout)) {
                session->lock();
                std::cout << "Locked after " << cfg.idleTimeout.count() << "s of inactivity.\n";
                continue;
            }
            session->touch();

            try {
                if (choice == "1") action_derive(db, *session, cfg);
                else if (choice == "2") action_add(db);
                else if (choice == "3") action_list(db);
                else if (choice == "4") action_search(db);
                else if (choice == "5") action_edit(db);
                else if (choice == "6") action_rotate(db);
                else if (choice == "7") action_delete(db);
                else if (choice == "8") action_derive_key(db, *session, cfg);
                else if (choice == "l" || choice == "L") session->lock();
                else if (choice == "q" || choice == "Q") break;
                else std::cout << "Unknown option.\n";
            } catch (const FramingError& ex) {
                std::cerr << "[Error] Invalid profile: " << ex.what() << "\n";
            } catch (const std::invalid_argument& ex) {
                std::cerr << "[Error] Invalid input: " << ex.what() << "\n";
            } catch (const std::out_of_range& ex) {
                std::cerr << "[Error] Invalid input: " << ex.what() << "\n";
            } catch (const DerivationError&) {
                throw;
            } catch (const std::runtime_error& ex) {
                std::cerr << "[Error] " << ex.what() << "\n";
            }
        }

        return 0;
    } catch (const DerivationError& ex) {
        std::cerr << "[Fatal] Derivation failed: " << ex.what() << "\n";
        return 98;
    } catch (const std::exception& ex) {
        std::cerr << "[Fatal] " << ex.what() << "\n";
        return 99;
    }
}
