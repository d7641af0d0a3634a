#include <catch2/catch.hpp>

#include "command.h"

TEST_CASE("Operator commands map to actions", "[command]")
{
    REQUIRE(parse_command("g") == Command::Record);
    REQUIRE(parse_command("w") == Command::Next);
    REQUIRE(parse_command("b") == Command::Previous);
    REQUIRE(parse_command("q") == Command::Quit);
}

TEST_CASE("Operator commands ignore case and surrounding space", "[command]")
{
    REQUIRE(parse_command("  G\n") == Command::Record);
    REQUIRE(parse_command("\tQ ") == Command::Quit);
}

TEST_CASE("Anything else is not a command", "[command]")
{
    REQUIRE_FALSE(parse_command("").has_value());
    REQUIRE_FALSE(parse_command("x").has_value());
    REQUIRE_FALSE(parse_command("go").has_value());
    REQUIRE_FALSE(parse_command("g w").has_value());
}

TEST_CASE("Commands have readable names", "[command]")
{
    REQUIRE(to_string(Command::Previous) == "previous");
    REQUIRE(to_string(Command::Record) == "record");
}
