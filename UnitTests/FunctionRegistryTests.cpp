// Copyright 2015 XLGAMES Inc.
//
// Distributed under the MIT License (See
// accompanying file "LICENSE" or the website
// http://www.opensource.org/licenses/mit-license.php)

#include "../NodeCodegen/FunctionRegistry.h"
#include <thread>
#include <atomic>
#include <vector>
#include <string>
#include <catch2/catch_test_macros.hpp>

using namespace NodeCodegen;

namespace UnitTests
{
	TEST_CASE( "FunctionRegistry-SourceBuilder", "[nodecodegen]" )
	{
		SECTION("Nested blocks")
		{
			SourceBuilder builder;
			builder.AppendLine("a");
			{
				auto outer = builder.Block();
				builder.AppendLine("b");
				{
					auto inner = builder.Block();
					builder.AppendLine("c");
				}
			}
			REQUIRE(builder.GetText() == "a\n{\n\tb\n\t{\n\t\tc\n\t}\n}\n");
		}

		SECTION("Multiple lines")
		{
			SourceBuilder builder;
			auto block = builder.Block();
			builder.AppendLines("x = 1;\r\n\r\ny = 2;");
			REQUIRE(builder.GetText() == "{\n\tx = 1;\n\n\ty = 2;\n");
		}
	}

	TEST_CASE( "FunctionRegistry-ProvideFunction", "[nodecodegen]" )
	{
		FunctionRegistry registry;
		unsigned writeCount = 0;
		auto writer = [&writeCount](SourceBuilder& builder) { ++writeCount; builder.AppendLine("#include \"a.hlsl\""); };

		REQUIRE(registry.ProvideFunction("a.hlsl", writer) == FunctionRegistry::ProvideResult::Inserted);
		REQUIRE(registry.ProvideFunction("a.hlsl", writer) == FunctionRegistry::ProvideResult::AlreadyPresent);
		REQUIRE(writeCount == 1);
		REQUIRE(registry.GetEntries().size() == 1);
		REQUIRE(registry.FindEntry("a.hlsl").has_value());
		REQUIRE(registry.FindEntry("a.hlsl")->_content == "#include \"a.hlsl\"\n");
		REQUIRE(!registry.FindEntry("A.hlsl").has_value());

		SECTION("Fingerprints")
		{
			auto bodyWriter = [&writeCount](SourceBuilder& builder) { ++writeCount; builder.AppendLine("void F() {}"); };
			REQUIRE(registry.ProvideFunction("F", bodyWriter, "void F()\n") == FunctionRegistry::ProvideResult::Inserted);
			REQUIRE(registry.ProvideFunction("F", bodyWriter, "void F()\n") == FunctionRegistry::ProvideResult::AlreadyPresent);
			REQUIRE(registry.ProvideFunction("F", bodyWriter, "void F(float a)\n") == FunctionRegistry::ProvideResult::Conflict);
			REQUIRE(registry.ProvideFunction("F", bodyWriter) == FunctionRegistry::ProvideResult::AlreadyPresent);
			REQUIRE(writeCount == 2);
			REQUIRE(registry.FindEntry("F")->_content == "void F() {}\n");
		}

		SECTION("Entries stay in provision order")
		{
			registry.ProvideFunction("c", [](SourceBuilder& builder) { builder.AppendLine("c"); });
			registry.ProvideFunction("b", [](SourceBuilder& builder) { builder.AppendLine("b"); });
			registry.ProvideFunction("c", [](SourceBuilder& builder) { builder.AppendLine("c2"); });
			REQUIRE(registry.GetEntries().size() == 3);
			REQUIRE(registry.GetEntries()[1]._identity == "c");
			REQUIRE(registry.GetEntries()[2]._identity == "b");
			REQUIRE(registry.BuildSource() == "#include \"a.hlsl\"\nc\nb\n");
		}
	}

	TEST_CASE( "FunctionRegistry-ConcurrentProviders", "[nodecodegen]" )
	{
		FunctionRegistry registry;
		std::atomic<unsigned> writeCount(0);
		std::atomic<unsigned> insertedCount(0);

		std::vector<std::thread> threads;
		for (unsigned t=0; t<8; ++t) {
			threads.emplace_back(
				[&registry, &writeCount, &insertedCount]() {
					for (unsigned c=0; c<100; ++c) {
						auto result = registry.ProvideFunction(
							"Shared", 
							[&writeCount](SourceBuilder& builder) { ++writeCount; builder.AppendLine("shared"); });
						if (result == FunctionRegistry::ProvideResult::Inserted)
							++insertedCount;
					}
				});
		}
		for (auto& t:threads) t.join();

		REQUIRE(writeCount.load() == 1);
		REQUIRE(insertedCount.load() == 1);
		REQUIRE(registry.GetEntries().size() == 1);
	}

	TEST_CASE( "FunctionRegistry-LookupWhileProviding", "[nodecodegen]" )
	{
		FunctionRegistry registry;
		registry.ProvideFunction("First", [](SourceBuilder& builder) { builder.AppendLine("first"); });

		std::atomic<bool> lookupsMatched(true);
		std::thread reader(
			[&registry, &lookupsMatched]() {
				for (unsigned c=0; c<1000; ++c) {
					auto entry = registry.FindEntry("First");
					if (!entry || entry->_content != "first\n")
						lookupsMatched = false;
				}
			});

		// growing the entry list while the reader holds its copies
		for (unsigned c=0; c<1000; ++c) {
			auto identity = "Fn" + std::to_string(c);
			registry.ProvideFunction(MakeStringSection(identity), [](SourceBuilder& builder) { builder.AppendLine("fn"); });
		}
		reader.join();

		REQUIRE(lookupsMatched.load());
		REQUIRE(registry.GetEntries().size() == 1001);
		auto entry = registry.FindEntry("Fn999");
		REQUIRE(entry.has_value());
		REQUIRE(entry->_content == "fn\n");
	}
}
