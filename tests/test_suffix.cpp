#include <catch2/catch.hpp>
#include <tid/suffix.hpp>
#include <algorithm>
#include <set>
#include <unordered_set>
#include <vector>

using namespace tid;

TEST_CASE("default suffix is nil", "[suffix]") {
    Suffix s;
    REQUIRE(s.is_nil());
    REQUIRE(s.to_string() == "00000000000000000000000000");
    REQUIRE(s.to_uuid() == Uuid::nil());
}

TEST_CASE("parse valid suffix", "[suffix]") {
    auto r = Suffix::parse("01h455vb4pex5vsknk084sn02q");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().to_string() == "01h455vb4pex5vsknk084sn02q");
    REQUIRE(r.value().to_uuid().to_string() == "01890a5d-ac96-774b-bcce-b302099a8057");
    REQUIRE_FALSE(r.value().is_nil());
}

TEST_CASE("parse propagates decoder errors", "[suffix]") {
    REQUIRE(Suffix::parse("invalid_suffix").error().reason == TidError::InvalidLength);
    REQUIRE(Suffix::parse("01h455vb4pex5vsknk084sn0!q").error().reason == TidError::InvalidCharacter);
    REQUIRE(Suffix::parse("81h455vb4pex5vsknk084sn02q").error().reason == TidError::InvalidFirstCharacter);
    REQUIRE(Suffix::parse("").error().code == TidError::InvalidSuffix);
}

TEST_CASE("from_uuid / to_uuid roundtrip", "[suffix]") {
    for (int i = 0; i < 50; ++i) {
        auto u = Uuid::v4();
        auto s = Suffix::from_uuid(u);
        REQUIRE(s.to_uuid() == u);
        REQUIRE(s.bytes() == u.bytes);
    }
}

TEST_CASE("max uuid encodes to 7zzz...", "[suffix]") {
    auto s = Suffix::from_uuid(Uuid::max());
    REQUIRE(s.to_string() == "7zzzzzzzzzzzzzzzzzzzzzzzzz");
    auto back = Suffix::parse(s.to_string());
    REQUIRE(back.is_ok());
    REQUIRE(back.value() == s);
}

TEST_CASE("generate produces v7 payloads", "[suffix]") {
    auto s = Suffix::generate();
    auto u = s.to_uuid();
    REQUIRE(u.version() == 7);
    REQUIRE(u.variant() == Uuid::Variant::RFC4122);
    REQUIRE(s.to_uuid_checked(7).is_ok());
}

TEST_CASE("generated suffixes are unique", "[suffix]") {
    std::unordered_set<Suffix> seen;
    for (int i = 0; i < 200; ++i) {
        REQUIRE(seen.insert(Suffix::generate()).second);
    }
}

TEST_CASE("to_uuid_checked rejects wrong version", "[suffix]") {
    auto s = Suffix::from_uuid(Uuid::v4());
    auto r = s.to_uuid_checked(7);
    REQUIRE(r.is_err());
    REQUIRE(r.error().is(TidError::InvalidUuid, TidError::InvalidVersion));
    REQUIRE(r.error().hint.find("expected version 7, got 4") != std::string::npos);
}

TEST_CASE("to_uuid_checked rejects non-RFC4122 variant", "[suffix]") {
    auto u = Uuid::v7();
    u.bytes[8] = static_cast<uint8_t>(u.bytes[8] & 0x3F); // NCS variant
    auto r = Suffix::from_uuid(u).to_uuid_checked(7);
    REQUIRE(r.is_err());
    REQUIRE(r.error().is(TidError::InvalidUuid, TidError::InvalidVariant));
}

TEST_CASE("to_uuid does not inspect version bits", "[suffix]") {
    // The nil suffix has version 0 and NCS variant; plain conversion still works
    Suffix s;
    REQUIRE(s.to_uuid() == Uuid::nil());
    REQUIRE(s.to_uuid_checked(7).is_err());
}

TEST_CASE("equality and ordering follow the payload", "[suffix]") {
    Bytes128 lo{};
    Bytes128 hi{};
    lo[15] = 1;
    hi[0] = 1;
    Suffix a(lo);
    Suffix b(hi);

    REQUIRE(a == Suffix(lo));
    REQUIRE(a != b);
    REQUIRE(a < b);
    REQUIRE(a <= b);
    REQUIRE(b > a);
    REQUIRE(b >= a);
    REQUIRE(a <= a);
    REQUIRE(a >= a);
}

TEST_CASE("sorting suffixes matches sorting their strings", "[suffix]") {
    std::vector<Suffix> suffixes;
    for (int i = 0; i < 100; ++i) suffixes.push_back(Suffix::from_uuid(Uuid::v4()));
    suffixes.push_back(Suffix());
    suffixes.push_back(Suffix::from_uuid(Uuid::max()));

    std::vector<std::string> strings;
    for (const auto& s : suffixes) strings.push_back(s.to_string());

    std::sort(suffixes.begin(), suffixes.end());
    std::sort(strings.begin(), strings.end());

    for (std::size_t i = 0; i < suffixes.size(); ++i) {
        REQUIRE(suffixes[i].to_string() == strings[i]);
    }
    REQUIRE(suffixes.front().is_nil());
}

TEST_CASE("std::hash agrees with equality", "[suffix]") {
    auto a = Suffix::parse("01h455vb4pex5vsknk084sn02q").value();
    auto b = Suffix::parse("01h455vb4pex5vsknk084sn02q").value();
    REQUIRE(std::hash<Suffix>{}(a) == std::hash<Suffix>{}(b));

    std::set<std::size_t> hashes;
    for (int i = 0; i < 100; ++i) {
        hashes.insert(std::hash<Suffix>{}(Suffix::from_uuid(Uuid::v4())));
    }
    REQUIRE(hashes.size() > 95);
}
