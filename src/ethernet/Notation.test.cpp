// Copyright 2023-2025 hrzlgnm
// SPDX-License-Identifier: MIT-0

#include <sstream>
#include <tuple>

#include <doctest/doctest.h>
#include <ethernet/Notation.hpp>
#include <fmt/format.h>

namespace
{
// NOLINTBEGIN(*)
using namespace macaddr::ethernet;

TEST_SUITE("[ethernet::Notation]")
{
    TEST_CASE("detectNotation")
    {
        CHECK(detectNotation("a0b1c2d3e4f5") == Notation::Plain);
        CHECK(detectNotation("A0B1C2D3E4F5") == Notation::Plain);
        CHECK(detectNotation("a0-b1-c2-d3-e4-f5") == Notation::Hyphen);
        CHECK(detectNotation("A0-B1-C2-D3-E4-F5") == Notation::Hyphen);
        CHECK(detectNotation("a0:b1:c2:d3:e4:f5") == Notation::Colon);
        CHECK(detectNotation("A0:b1:C2:d3:E4:f5") == Notation::Colon);
        CHECK(detectNotation("a0b1.c2d3.e4f5") == Notation::Dot);
        CHECK(detectNotation("A0B1.C2D3.E4F5") == Notation::Dot);
    }

    TEST_CASE("rejected input")
    {
        const char* rejected[] = {
            "",
            "0a",
            "0a1b2c3d4e5f6",
            "0a1b2c3d4e5g",
            "-0a-1b-2c-3d-4e-5f",
            "0a-1b-2c-3d-4e-5f-",
            "0a-1b-2c-3d-4e5f",
            ":0a:1b:2c:3d:4e:5f",
            "0a:1b:2c:3d:4e:5f:",
            "0a:1b:2c:3d:4e5f",
            ".0a1b.2c3d.4e5f",
            "0a1b.2c3d.4e5f.",
            "0a1b.2c3d4e5f",
            "0a-1b:2c-3d-4e-5f",
            "0a1b-2c3d-4e5f",
            "0a.1b.2c.3d.4e.5f",
            "0a-1b-2c-3d-4e-5g",
            "0a1b2c3d4e5f ",
            " 0a1b2c3d4e5f",
            "0a-1b-2c-3d-4e--5",
        };
        for (const auto* text : rejected) {
            INFO("text: '", text, "'");
            CHECK_FALSE(detectNotation(text).has_value());
            CHECK_FALSE(isValid(text));
            CHECK_THROWS_AS(std::ignore = normalize(text), ValidationError);
        }
    }

    TEST_CASE("ValidationError")
    {
        CHECK_THROWS_WITH_AS(std::ignore = normalize("0a"), "Pass in 12 hexadecimal digits.", std::invalid_argument);
    }

    TEST_CASE("normalize")
    {
        CHECK(normalize("a0b1c2d3e4f5") == "a0b1c2d3e4f5");
        CHECK(normalize("A0B1C2D3E4F5") == "a0b1c2d3e4f5");
        CHECK(normalize("A0-B1-C2-D3-E4-F5") == "a0b1c2d3e4f5");
        CHECK(normalize("a0:b1:c2:d3:e4:f5") == "a0b1c2d3e4f5");
        CHECK(normalize("A0B1.c2d3.E4F5") == "a0b1c2d3e4f5");
        CHECK(normalize("a0b1.c2d3.e4f5").size() == HEX_DIGITS);
    }

    TEST_CASE("render")
    {
        CHECK(render("0180c2000000", Notation::Plain) == "0180c2000000");
        CHECK(render("0180c2000000", Notation::Hyphen) == "01-80-c2-00-00-00");
        CHECK(render("0180c2000000", Notation::Colon) == "01:80:c2:00:00:00");
        CHECK(render("0180c2000000", Notation::Dot) == "0180.c200.0000");
    }

    TEST_CASE("rendered notation is detected as itself")
    {
        for (const auto& grammar : GRAMMARS) {
            const auto text = render("a0b1c2d3e4f5", grammar.notation);
            CHECK(text.size() == grammar.length());
            CHECK(detectNotation(text) == grammar.notation);
        }
    }

    TEST_CASE("operator <<")
    {
        std::ostringstream oss;
        oss << Notation::Plain << " " << Notation::Hyphen << " " << Notation::Colon << " " << Notation::Dot;
        CHECK(oss.str() == "plain hyphen colon dot");
        CHECK(fmt::format("{}", Notation::Dot) == "dot");
    }
}

// NOLINTEND(*)
}  // namespace
