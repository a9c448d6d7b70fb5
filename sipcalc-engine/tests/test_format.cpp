#include <catch2/catch_test_macros.hpp>
#include "format.hpp"

using namespace sipcalc;

TEST_CASE("format_decimal rounds ties away from zero", "[format]") {
    REQUIRE(format_decimal(2.25, 1) == "2.3");
    REQUIRE(format_decimal(0.25, 1) == "0.3");
    REQUIRE(format_decimal(12.0, 0) == "12");
    REQUIRE(format_decimal(47.404, 1) == "47.4");
}

TEST_CASE("format_decimal drops negative zero", "[format][edge]") {
    REQUIRE(format_decimal(-0.01, 1) == "0.0");
    REQUIRE(format_decimal(-0.4, 0) == "0");
}

TEST_CASE("format_inr groups digits the Indian way", "[format]") {
    REQUIRE(format_inr(0.0) == "₹0");
    REQUIRE(format_inr(999.0) == "₹999");
    REQUIRE(format_inr(1000.0) == "₹1,000");
    REQUIRE(format_inr(100000.0) == "₹1,00,000");
    REQUIRE(format_inr(1914422.34) == "₹19,14,422");
    REQUIRE(format_inr(123456789.0) == "₹12,34,56,789");
}

TEST_CASE("format_inr rounds to whole rupees", "[format]") {
    REQUIRE(format_inr(22328.82) == "₹22,329");
    REQUIRE(format_inr(0.4) == "₹0");
}

TEST_CASE("format_inr marks negatives after the symbol", "[format]") {
    REQUIRE(format_inr(-1500.0) == "₹-1,500");
    REQUIRE(format_inr(-1006890.81) == "₹-10,06,891");
}
