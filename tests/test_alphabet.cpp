#include <catch2/catch.hpp>
#include <tid/alphabet.hpp>
#include <set>
#include <string>

using namespace tid;

TEST_CASE("alphabet has 32 distinct symbols", "[alphabet]") {
    std::set<char> seen(alphabet::symbols, alphabet::symbols + alphabet::size);
    REQUIRE(alphabet::size == 32);
    REQUIRE(seen.size() == 32);
    REQUIRE(std::string(alphabet::symbols) == "0123456789abcdefghjkmnpqrstvwxyz");
}

TEST_CASE("alphabet symbols are strictly ascending", "[alphabet]") {
    // Symbol order == value order is what keeps encoded strings sortable
    for (std::size_t i = 1; i < alphabet::size; ++i) {
        REQUIRE(alphabet::symbols[i - 1] < alphabet::symbols[i]);
    }
}

TEST_CASE("value_to_symbol / symbol_to_value are inverses", "[alphabet]") {
    for (uint8_t v = 0; v < 32; ++v) {
        char c = alphabet::value_to_symbol(v);
        auto back = alphabet::symbol_to_value(c);
        REQUIRE(back.has_value());
        REQUIRE(*back == v);
    }
}

TEST_CASE("symbol_to_value known digits", "[alphabet]") {
    REQUIRE(*alphabet::symbol_to_value('0') == 0);
    REQUIRE(*alphabet::symbol_to_value('9') == 9);
    REQUIRE(*alphabet::symbol_to_value('a') == 10);
    REQUIRE(*alphabet::symbol_to_value('h') == 17);
    REQUIRE(*alphabet::symbol_to_value('j') == 18);
    REQUIRE(*alphabet::symbol_to_value('z') == 31);
}

TEST_CASE("symbol_to_value rejects excluded and foreign characters", "[alphabet]") {
    for (char c : std::string("ilouILOU!_- ")) {
        INFO("char: " << c);
        REQUIRE_FALSE(alphabet::symbol_to_value(c).has_value());
    }
    // Upper case is not accepted
    REQUIRE_FALSE(alphabet::symbol_to_value('A').has_value());
    REQUIRE_FALSE(alphabet::symbol_to_value('Z').has_value());
    REQUIRE_FALSE(alphabet::symbol_to_value('\0').has_value());
}

TEST_CASE("symbol_to_value is total over every byte value", "[alphabet]") {
    int accepted = 0;
    for (int b = 0; b < 256; ++b) {
        if (alphabet::symbol_to_value(static_cast<char>(b))) ++accepted;
    }
    REQUIRE(accepted == 32);
}

TEST_CASE("value_to_symbol masks to 5 bits", "[alphabet]") {
    REQUIRE(alphabet::value_to_symbol(32) == '0');
    REQUIRE(alphabet::value_to_symbol(0xFF) == 'z');
}
