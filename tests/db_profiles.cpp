#include <catch2/catch_all.hpp>
#include "DatabaseManager.hpp"
#include "PasswordDeriver.hpp"
#include "errors.hpp"
#include "test_support.hpp"

#include <filesystem>
#include <stdexcept>
#include <string>

TEST_CASE("DB: profile CRUD", "[db][profile]") {
    const std::string testDb = "tmp_test_profiles.sqlite";
    std::filesystem::remove(testDb);

    {
        DatabaseManager db(testDb);
        db.init();
        REQUIRE(db.listProfiles().empty());

        int idA = db.addProfile(makeProfile("github.com", 20, CharClassSet::parse("lud"), 2));
        int idB = db.addProfile(makeProfile("gitlab.com"));
        int idC = db.addProfile(makeProfile("bank_example", 6, CharClassSet::parse("d")));
        REQUIRE(idA > 0);
        REQUIRE(idB != idA);

        auto a = db.getProfileById(idA);
        REQUIRE(a.has_value());
        REQUIRE(a->profile.siteLabel == "github.com");
        REQUIRE(a->profile.length == 20);
        REQUIRE(a->profile.classes == CharClassSet::parse("lud"));
        REQUIRE(a->profile.counter == 2);
        REQUIRE(a->profile.version == AlgorithmVersion::V1);
        REQUIRE_FALSE(a->created_at.empty());

        SECTION("lookup and search") {
            REQUIRE(db.findProfileBySite("gitlab.com")->id == idB);
            REQUIRE_FALSE(db.findProfileBySite("gitlab").has_value());
            REQUIRE(db.searchBySite("git").size() == 2);
            // '_' is matched literally, not as a wildcard
            REQUIRE(db.searchBySite("git_ab").empty());
            REQUIRE(db.searchBySite("nk_").front().id == idC);
            REQUIRE(db.searchBySite("zzz").empty());
            REQUIRE(db.listProfiles().size() == 3);
        }
        SECTION("update and rotate") {
            Profile p = a->profile;
            p.length = 32;
            db.updateProfile(idA, p);
            REQUIRE(db.getProfileById(idA)->profile.length == 32);

            REQUIRE(db.bumpCounter(idA) == 3);
            REQUIRE(db.getProfileById(idA)->profile.counter == 3);
            REQUIRE_THROWS_AS(db.updateProfile(9999, p), std::runtime_error);
            REQUIRE_THROWS_AS(db.bumpCounter(9999), std::runtime_error);
        }
        SECTION("invalid profiles and duplicates are refused") {
            REQUIRE_THROWS_AS(db.addProfile(makeProfile("x", 16, CharClassSet())), FramingError);
            REQUIRE_THROWS_AS(db.addProfile(makeProfile("github.com")), std::runtime_error);
        }
        SECTION("delete") {
            db.deleteProfile(idB);
            REQUIRE_FALSE(db.getProfileById(idB).has_value());
            REQUIRE(db.listProfiles().size() == 2);
        }
    }

    std::error_code ec;
    std::filesystem::remove(testDb, ec);
}

TEST_CASE("DB: stored profile derives the same password after reload", "[db][derive]") {
    const std::string testDb = "tmp_test_profile_derive.sqlite";
    std::filesystem::remove(testDb);

    const std::string secret = "correct horse battery staple";
    const Profile original = makeProfile("example.com");
    const std::string expected = derivePassword(secret, original, zeroSalt());

    {
        DatabaseManager db(testDb);
        db.init();
        db.addProfile(original);
    }
    {
        DatabaseManager db(testDb);
        db.init();
        auto row = db.findProfileBySite("example.com");
        REQUIRE(row.has_value());
        REQUIRE(derivePassword(secret, row->profile, zeroSalt()) == expected);

        int id = row->id;
        db.bumpCounter(id);
        REQUIRE(derivePassword(secret, db.getProfileById(id)->profile, zeroSalt()) != expected);
    }

    std::error_code ec;
    std::filesystem::remove(testDb, ec);
}

TEST_CASE("DB: counter at its maximum cannot be bumped", "[db][profile]") {
    const std::string testDb = "tmp_test_counter_max.sqlite";
    std::filesystem::remove(testDb);

    {
        DatabaseManager db(testDb);
        db.init();
        int id = db.addProfile(makeProfile("max.example", 16, CharClassSet::all(), 0xFFFFFFFFu));
        REQUIRE_THROWS_AS(db.bumpCounter(id), std::overflow_error);
        REQUIRE(db.getProfileById(id)->profile.counter == 0xFFFFFFFFu);
    }

    std::error_code ec;
    std::filesystem::remove(testDb, ec);
}
