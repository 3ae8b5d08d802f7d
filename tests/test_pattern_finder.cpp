#include <catch2/catch_test_macros.hpp>

#include "processing/PatternFinder.hpp"

using namespace processing;
using Strings = std::vector<std::string>;

TEST_CASE("PatternFinder dates", "[patterns]")
{
    REQUIRE(findDates("Nació el 3/4/1990 y se casó el 2015-06-21.") == Strings{ "3/4/1990", "2015-06-21" });
    REQUIRE(findDates("Vence el 12-05-23") == Strings{ "12-05-23" });
    REQUIRE(findDates("Versión 1.2.3 sin fechas").empty());
}

TEST_CASE("PatternFinder money", "[patterns]")
{
    SECTION("Amount followed by a currency")
    {
        REQUIRE(findMoney("Cuesta 1.200,50 € en total") == Strings{ "1.200,50 €" });
        REQUIRE(findMoney("Son 30 euros o 25 USD") == Strings{ "30 euros", "25 USD" });
    }

    SECTION("Dollar sign before the amount")
    {
        REQUIRE(findMoney("Precio: $15.99") == Strings{ "$15.99" });
    }

    SECTION("Euro sign before the amount is not a currency suffix")
    {
        REQUIRE(findMoney("Precio: € 20").empty());
        REQUIRE(findMoney("€15").empty());
        REQUIRE(findMoney("Cuesta €15 euros") == Strings{ "15 euros" });
    }

    SECTION("Plain numbers are not money")
    {
        REQUIRE(findMoney("Tengo 3 gatos y 12 perros").empty());
    }
}

TEST_CASE("PatternFinder emails", "[patterns]")
{
    REQUIRE(findEmails("Escribe a ana.lopez@correo.es o a info@empresa.com.")
            == Strings{ "ana.lopez@correo.es", "info@empresa.com" });
    REQUIRE(findEmails("sin arroba aquí").empty());
}

TEST_CASE("PatternFinder combined report keeps text order", "[patterns]")
{
    auto matches = findPatterns("Pagué 1.200,50 € el 12/05/2023, escribe a ana@correo.es");
    REQUIRE(matches.dates == Strings{ "12/05/2023" });
    REQUIRE(matches.money == Strings{ "1.200,50 €" });
    REQUIRE(matches.emails == Strings{ "ana@correo.es" });

    auto empty = findPatterns("");
    REQUIRE(empty.dates.empty());
    REQUIRE(empty.money.empty());
    REQUIRE(empty.emails.empty());
}
