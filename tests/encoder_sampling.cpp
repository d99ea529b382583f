#include <catch2/catch_all.hpp>
#include "AlphabetEncoder.hpp"
#include "errors.hpp"

#include <map>
#include <random>

namespace {
    CharClassSet classes(const char* spec) { return CharClassSet::parse(spec); }

    DerivationError::Kind errorKind(const std::vector<std::uint8_t>& buf, std::size_t len, CharClassSet cls) {
        try {
            encode(buf, len, cls);
        } catch (const DerivationError& ex) {
            return ex.kind();
        }
        throw std::logic_error("encode did not fail");
    }

    double chiSquare(const std::map<char, int>& counts, const std::string& alphabet) {
        double total = 0;
        for (char c : alphabet) {
            auto it = counts.find(c);
            total += it == counts.end() ? 0 : it->second;
        }
        const double expected = total / static_cast<double>(alphabet.size());
        double chi = 0;
        for (char c : alphabet) {
            auto it = counts.find(c);
            double observed = it == counts.end() ? 0 : it->second;
            chi += (observed - expected) * (observed - expected) / expected;
        }
        return chi;
    }
}

TEST_CASE("Alphabets: fixed v1 sets in class order", "[encoder]") {
    REQUIRE(classAlphabet(CharClass::Lower) == "abcdefghijklmnopqrstuvwxyz");
    REQUIRE(classAlphabet(CharClass::Upper) == "ABCDEFGHIJKLMNOPQRSTUVWXYZ");
    REQUIRE(classAlphabet(CharClass::Digit) == "0123456789");
    REQUIRE(classAlphabet(CharClass::Symbol) == "!@#$%^&*()-_=+[]{};:,.?/");
    REQUIRE(fullAlphabet(classes("sd")) == "0123456789!@#$%^&*()-_=+[]{};:,.?/");
    REQUIRE(fullAlphabet(CharClassSet::all()).size() == 86);
}

TEST_CASE("EntropyCursor: rejects the biased tail of the byte range", "[encoder]") {
    // 10 symbols: bytes >= 250 are out of range
    std::vector<std::uint8_t> buf = { 250, 255, 3, 251, 14 };
    EntropyCursor cur(buf);
    REQUIRE(cur.uniform(10) == 3);
    REQUIRE(cur.consumed() == 3);
    REQUIRE(cur.uniform(10) == 4);
    REQUIRE(cur.remaining() == 0);
    REQUIRE_THROWS_AS(cur.uniform(10), DerivationError);
}

TEST_CASE("EntropyCursor: bounds above 256 use 16-bit words", "[encoder]") {
    // 1000: limit = 65000, so 0xFDE8 (65000) is rejected, 0x03E9 (1001) -> 1
    std::vector<std::uint8_t> buf = { 0xFD, 0xE8, 0x03, 0xE9 };
    EntropyCursor cur(buf);
    REQUIRE(cur.uniform(1000) == 1);
    REQUIRE(cur.consumed() == 4);

    std::vector<std::uint8_t> odd = { 0x00 };
    EntropyCursor half(odd);
    REQUIRE_THROWS_AS(half.uniform(1000), DerivationError);
}

TEST_CASE("Encoder: rejected bytes are skipped, not folded", "[encoder]") {
    REQUIRE(encode({ 250, 255, 3, 251, 4, 5, 6 }, 4, classes("d")) == "3456");
}

TEST_CASE("Encoder: single missing class is repaired from the same buffer", "[encoder]") {
    // "abcd" from the 36-char alphabet, then digit repair:
    // position candidates {0,1,2,3} -> byte 2 picks 2, digit byte 7 -> '7'
    REQUIRE(encode({ 0, 1, 2, 3, 2, 7 }, 4, classes("ld")) == "ab7d");
}

TEST_CASE("Encoder: several missing classes are repaired in class order", "[encoder]") {
    // "abcd"; Upper -> pos 0 'A'; Digit -> candidates {1,2,3} pick 1, '9';
    // Symbol -> candidates {2,3} pick 3, '!'
    std::vector<std::uint8_t> buf = { 0, 1, 2, 3,  0, 0,  0, 9,  1, 0 };
    REQUIRE(encode(buf, 4, CharClassSet::all()) == "A9c!");
}

TEST_CASE("Encoder: buffer exhaustion boundary", "[encoder]") {
    SECTION("exactly enough bytes succeeds") {
        REQUIRE(encode({ 0, 1, 2, 3 }, 4, classes("d")) == "0123");
        REQUIRE(encode({ 0, 1, 2, 3, 2, 7 }, 4, classes("ld")) == "ab7d");
    }
    SECTION("one byte short fails in the main pass") {
        REQUIRE(errorKind({ 0, 1, 2 }, 4, classes("d")) == DerivationError::Kind::BufferExhausted);
    }
    SECTION("one byte short fails in the repair pass") {
        REQUIRE(errorKind({ 0, 1, 2, 3, 2 }, 4, classes("ld")) == DerivationError::Kind::BufferExhausted);
    }
    SECTION("only rejected bytes") {
        REQUIRE(errorKind(std::vector<std::uint8_t>(64, 0xFF), 4, classes("d"))
                == DerivationError::Kind::BufferExhausted);
    }
    SECTION("empty buffer") {
        REQUIRE(errorKind({}, 4, CharClassSet::all()) == DerivationError::Kind::BufferExhausted);
    }
}

TEST_CASE("Encoder: unsatisfiable requests are FramingErrors", "[encoder]") {
    REQUIRE_THROWS_AS(encode({ 1, 2, 3 }, 4, CharClassSet()), FramingError);
    REQUIRE_THROWS_AS(encode({ 1, 2, 3 }, 3, CharClassSet::all()), FramingError);
}

TEST_CASE("Encoder: length, membership and coverage over random buffers", "[encoder]") {
    std::mt19937 rng(20240611);
    std::uniform_int_distribution<int> byte(0, 255);
    const CharClassSet sets[] = { classes("l"), classes("ld"), classes("us"), classes("lud"), CharClassSet::all() };

    for (const CharClassSet& cls : sets) {
        const std::string allowed = fullAlphabet(cls);
        for (std::size_t length : { std::size_t(4), std::size_t(16), std::size_t(64) }) {
            for (int n = 0; n < 200; ++n) {
                std::vector<std::uint8_t> buf(512);
                for (auto& b : buf) b = static_cast<std::uint8_t>(byte(rng));

                std::string pw = encode(buf, length, cls);
                REQUIRE(pw.size() == length);
                REQUIRE(pw.find_first_not_of(allowed) == std::string::npos);
                for (std::size_t c = 0; c < CHAR_CLASS_COUNT; ++c) {
                    if (!cls.contains(static_cast<CharClass>(c))) continue;
                    REQUIRE(pw.find_first_of(classAlphabet(static_cast<CharClass>(c))) != std::string::npos);
                }
                REQUIRE(encode(buf, length, cls) == pw);
            }
        }
    }
}

TEST_CASE("Encoder: per-position frequencies within a class are uniform", "[encoder][stats]") {
    // 86-char alphabet: a naive byte % 86 makes the last two symbols ('?', '/')
    // only 2/3 as likely as the others. Chi-square over the 24 symbols,
    // df = 23; 70 is far beyond any plausible fair outcome.
    const double threshold = 70.0;
    const std::string full = fullAlphabet(CharClassSet::all());
    const std::string& symbols = classAlphabet(CharClass::Symbol);

    std::mt19937 rng(7);
    std::uniform_int_distribution<int> byte(0, 255);
    std::map<char, int> sampled, naive;

    for (int n = 0; n < 100000; ++n) {
        std::vector<std::uint8_t> buf(128);
        for (auto& b : buf) b = static_cast<std::uint8_t>(byte(rng));

        char c = encode(buf, 16, CharClassSet::all())[0];
        if (symbols.find(c) != std::string::npos) ++sampled[c];

        char d = full[buf[0] % full.size()];
        if (symbols.find(d) != std::string::npos) ++naive[d];
    }

    REQUIRE(chiSquare(sampled, symbols) < threshold);
    REQUIRE(chiSquare(naive, symbols) > threshold);
}
