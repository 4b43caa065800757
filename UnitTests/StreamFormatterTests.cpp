// Copyright 2015 XLGAMES Inc.
//
// Distributed under the MIT License (See
// accompanying file "LICENSE" or the website
// http://www.opensource.org/licenses/mit-license.php)

#include "../Utility/Streams/StreamFormatter.h"
#include <string>
#include <catch2/catch_test_macros.hpp>

namespace UnitTests
{
	static std::string RequireKey(InputStreamFormatter<utf8>& formatter)
	{
		StringSection<utf8> name;
		REQUIRE(formatter.TryKeyedItem(name));
		return name.AsString();
	}

	static std::string RequireValueString(InputStreamFormatter<utf8>& formatter)
	{
		return RequireValue(formatter).AsString();
	}

    const std::basic_string<utf8> testString = (const utf8*)R"~~(~~!Format=2; Tab=4
Precision = float
~~ comments are skipped, even when they are = full ~ of formatting characters
Outer =~
    Inner = 1
    Nested =~
        = a; = b
    After = <:(x = ~y;):>
Last = 3
)~~";

    TEST_CASE( "StreamFormatter-Structure", "[utility]" )
    {
		InputStreamFormatter<utf8> formatter(MakeStringSection(testString));

		REQUIRE(formatter.PeekNext() == FormatterBlob::KeyedItem);
		REQUIRE(RequireKey(formatter) == "Precision");
		REQUIRE(formatter.PeekNext() == FormatterBlob::Value);
		REQUIRE(RequireValueString(formatter) == "float");

		REQUIRE(RequireKey(formatter) == "Outer");
		REQUIRE(formatter.PeekNext() == FormatterBlob::BeginElement);
		RequireBeginElement(formatter);
			REQUIRE(RequireKey(formatter) == "Inner");
			REQUIRE(RequireValueString(formatter) == "1");
			REQUIRE(RequireKey(formatter) == "Nested");
			RequireBeginElement(formatter);
				REQUIRE(RequireValueString(formatter) == "a");
				REQUIRE(RequireValueString(formatter) == "b");
			REQUIRE(formatter.PeekNext() == FormatterBlob::EndElement);
			RequireEndElement(formatter);
			REQUIRE(RequireKey(formatter) == "After");
			REQUIRE(RequireValueString(formatter) == "x = ~y;");
		RequireEndElement(formatter);

		REQUIRE(RequireKey(formatter) == "Last");
		REQUIRE(RequireValueString(formatter) == "3");
		REQUIRE(formatter.PeekNext() == FormatterBlob::None);
	}

	TEST_CASE( "StreamFormatter-SkipElement", "[utility]" )
	{
		const std::basic_string<utf8> input = (const utf8*)"Skipped =~\n\tA = 1\n\tB =~\n\t\t= c\nKept = 2\n";
		InputStreamFormatter<utf8> formatter(MakeStringSection(input));

		REQUIRE(RequireKey(formatter) == "Skipped");
		SkipValueOrElement(formatter);
		REQUIRE(RequireKey(formatter) == "Kept");
		REQUIRE(RequireValueString(formatter) == "2");
		REQUIRE(formatter.PeekNext() == FormatterBlob::None);
	}

	TEST_CASE( "StreamFormatter-Errors", "[utility]" )
	{
		SECTION("Unsupported format version")
		{
			const std::basic_string<utf8> input = (const utf8*)"~~!Format=1\nA = 1\n";
			InputStreamFormatter<utf8> formatter(MakeStringSection(input));
			REQUIRE_THROWS_AS(formatter.PeekNext(), FormatException);
		}

		SECTION("Key without value")
		{
			const std::basic_string<utf8> input = (const utf8*)"A = 1\nB\n";
			InputStreamFormatter<utf8> formatter(MakeStringSection(input));
			REQUIRE(RequireKey(formatter) == "A");
			REQUIRE(RequireValueString(formatter) == "1");
			StringSection<utf8> name;
			try {
				formatter.TryKeyedItem(name);
				FAIL("Expected a format exception");
			} catch (const FormatException& e) {
				REQUIRE(std::string(e.what()).find("at line (2)") != std::string::npos);
			}
		}

		SECTION("Unterminated protected string")
		{
			const std::basic_string<utf8> input = (const utf8*)"A = <:(never closed\n";
			InputStreamFormatter<utf8> formatter(MakeStringSection(input));
			REQUIRE(RequireKey(formatter) == "A");
			StringSection<utf8> value;
			REQUIRE_THROWS_AS(formatter.TryValue(value), FormatException);
		}
	}
}
