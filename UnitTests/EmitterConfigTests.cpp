// Copyright 2015 XLGAMES Inc.
//
// Distributed under the MIT License (See
// accompanying file "LICENSE" or the website
// http://www.opensource.org/licenses/mit-license.php)

#include "../NodeCodegen/EmitterConfig.h"
#include "../NodeCodegen/FunctionCallEmitter.h"
#include "../NodeCodegen/AssetPathResolver.h"
#include <catch2/catch_test_macros.hpp>

using namespace NodeCodegen;

namespace UnitTests
{
	static const char s_emitterConfig[] = R"~~(~~!Format=2; Tab=4
Precision = half
GenerationMode = Preview
AcceptedExtensions =~
    = .hlsl; = .cginc
    = .hlsli
Sentinels =~
    FunctionName = <:(Type a name; then press enter):>
    ShowTooltips = true
OptimizationLevel = 3
Plugins =~
    Path = Plugins/Extra
)~~";

	TEST_CASE( "EmitterConfig-Load", "[nodecodegen]" )
	{
		SECTION("Defaults")
		{
			auto cfg = LoadEmitterConfig("");
			REQUIRE(cfg._precision == GraphLanguage::Precision::Float);
			REQUIRE(cfg._generationMode == GraphLanguage::GenerationMode::ForReals);
			REQUIRE(cfg._acceptedExtensions == std::vector<std::string>{".hlsl", ".cginc"});
			REQUIRE(cfg._sentinels._functionName == "Enter function name here...");
			REQUIRE(cfg._sentinels._functionBody == "Enter function body here...");
			REQUIRE(cfg._sentinels._functionSource == "Enter function source file path here...");
		}

		SECTION("Full document")
		{
			auto cfg = LoadEmitterConfig(s_emitterConfig);
			REQUIRE(cfg._precision == GraphLanguage::Precision::Half);
			REQUIRE(cfg._generationMode == GraphLanguage::GenerationMode::Preview);
			REQUIRE(cfg._acceptedExtensions == std::vector<std::string>{".hlsl", ".cginc", ".hlsli"});
			REQUIRE(cfg._sentinels._functionName == "Type a name; then press enter");
			REQUIRE(cfg._sentinels._functionBody == "Enter function body here...");

			// the loaded sentinel is what marks a function name as unset
			FunctionCallEmitter emitter(cfg, std::make_shared<BasicAssetPathResolver>());
			REQUIRE(!emitter.IsValid(GraphLanguage::MakeInlineFunction("Type a name; then press enter", "Out = In;")));
			REQUIRE(emitter.IsValid(GraphLanguage::MakeInlineFunction("Enter function name here...", "Out = In;")));
			REQUIRE(emitter.IsValid(GraphLanguage::MakeFileFunction("Foo", "Shaders/Common.hlsli")));
		}

		SECTION("Bad values")
		{
			REQUIRE_THROWS_AS(LoadEmitterConfig("Precision = double"), Utility::FormatException);
			REQUIRE_THROWS_AS(LoadEmitterConfig("GenerationMode = Sometimes"), Utility::FormatException);
			REQUIRE_THROWS_AS(LoadEmitterConfig("~~!Format=1; Tab=4\nPrecision = half"), Utility::FormatException);
			REQUIRE_THROWS_AS(LoadEmitterConfig("Precision = half\n= stray"), Utility::FormatException);
		}
	}
}
