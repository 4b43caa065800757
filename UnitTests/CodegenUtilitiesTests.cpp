// Copyright 2015 XLGAMES Inc.
//
// Distributed under the MIT License (See
// accompanying file "LICENSE" or the website
// http://www.opensource.org/licenses/mit-license.php)

#include "UnitTestHelper.h"
#include "../NodeCodegen/Identifiers.h"
#include "../NodeCodegen/ExpressionAdapter.h"
#include "../NodeCodegen/AssetPathResolver.h"
#include <catch2/catch_test_macros.hpp>

using namespace NodeCodegen;

namespace UnitTests
{
	TEST_CASE( "Codegen-Identifiers", "[nodecodegen]" )
	{
		REQUIRE(SanitizeIdentifier("Base Color") == "Base_Color");
		REQUIRE(SanitizeIdentifier("UV(0).x") == "UV_0__x");
		REQUIRE(SanitizeIdentifier("already_fine_2") == "already_fine_2");

		REQUIRE(!ValidateSlotName("Base Color").has_value());
		REQUIRE(!ValidateSlotName("_uv2").has_value());
		REQUIRE(ValidateSlotName("").value() == "Slot names can not be empty.");
		REQUIRE(ValidateSlotName("a-b").value() == "Slot name (a-b) contains invalid characters. Only letters, digits, spaces and underscores are allowed.");
		REQUIRE(ValidateSlotName("2D").value() == "Slot name (2D) can not start with a digit.");
		REQUIRE(ValidateSlotName("float").value() == "Slot name (float) is a reserved shader language keyword.");
		REQUIRE(ValidateSlotName("Texture2D").has_value());
		REQUIRE(!ValidateSlotName("Float").has_value());		// keywords are case sensitive

		REQUIRE(IsReservedWord("discard"));
		REQUIRE(!IsReservedWord("Discard"));

		auto node = MakeConstantNode(12, "Sample Texture 2D", {});
		REQUIRE(VariableNameForSlot(node, 3) == "_Sample_Texture_2D_12_3");
		REQUIRE(VariableNameForSlot(node, 4) != VariableNameForSlot(node, 3));
	}

	TEST_CASE( "Codegen-TypeStrings", "[nodecodegen]" )
	{
		REQUIRE(ToTypeString(ValueType::Vector1, Precision::Float) == "float");
		REQUIRE(ToTypeString(ValueType::Vector1, Precision::Half) == "half");
		REQUIRE(ToTypeString(ValueType::Vector3, Precision::Half) == "half3");
		REQUIRE(ToTypeString(ValueType::Matrix3, Precision::Float) == "float3x3");
		REQUIRE(ToTypeString(ValueType::Boolean, Precision::Half) == "bool");
		REQUIRE(ToTypeString(ValueType::Cubemap, Precision::Half) == "TextureCube");
		REQUIRE(ToTypeString(ValueType::SamplerState, Precision::Float) == "SamplerState");

		REQUIRE(AsPrecision("HALF") == Precision::Half);
		REQUIRE(!AsPrecision("double").has_value());
		REQUIRE(AsGenerationMode("forreals") == GenerationMode::ForReals);
		REQUIRE(AsValueType("Texture2DArray") == ValueType::Texture2DArray);
		REQUIRE(std::string(AsString(ValueType::Matrix4)) == "Matrix4");
	}

	TEST_CASE( "Codegen-ExpressionAdapter", "[nodecodegen]" )
	{
		SECTION("Vector conversions")
		{
			REQUIRE(AdaptExpression("v", ValueType::Vector4, ValueType::Vector2, Precision::Float) == "v.xy");
			REQUIRE(AdaptExpression("v", ValueType::Vector4, ValueType::Vector1, Precision::Float) == "v.x");
			REQUIRE(AdaptExpression("s", ValueType::Vector1, ValueType::Vector3, Precision::Float) == "s.xxx");
			REQUIRE(AdaptExpression("v", ValueType::Vector2, ValueType::Vector4, Precision::Float) == "float4(v, 0, 0)");
			REQUIRE(AdaptExpression("v", ValueType::Vector3, ValueType::Vector3, Precision::Half) == "v");
		}

		SECTION("Matrix and other conversions")
		{
			REQUIRE(AdaptExpression("m", ValueType::Matrix4, ValueType::Matrix3, Precision::Float) == "(float3x3)m");
			REQUIRE(AdaptExpression("m", ValueType::Matrix3, ValueType::Matrix4, Precision::Half) == "Cast_half3x3_to_half4x4(m)");
			REQUIRE(AdaptExpression("b", ValueType::Boolean, ValueType::Vector1, Precision::Float) == "Cast_bool_to_float(b)");
		}

		SECTION("Empty expressions stay empty")
		{
			REQUIRE(AdaptExpression("", ValueType::Vector4, ValueType::Vector2, Precision::Float).empty());
		}

		SECTION("Adapting a node output")
		{
			auto node = MakeConstantNode(2, "Color", { MakeOutput(0, ValueType::Vector4, "Out") });
			BasicExpressionAdapter adapter;
			REQUIRE(adapter.Adapt(node, 0, ValueType::Vector3, Precision::Float) == "_Color_2_0.xyz");
			REQUIRE(adapter.Adapt(node, 0, ValueType::Vector4, Precision::Float) == "_Color_2_0");
			REQUIRE(adapter.Adapt(node, 1, ValueType::Vector4, Precision::Float).empty());
		}
	}

	TEST_CASE( "Codegen-AssetPathResolver", "[nodecodegen]" )
	{
		BasicAssetPathResolver resolver;
		resolver.Add("guid-a", "Shaders/A.hlsl");
		REQUIRE(resolver.Resolve("guid-a") == "Shaders/A.hlsl");
		REQUIRE(resolver.Resolve("guid-b").empty());

		resolver.Add("guid-a", "Shaders/Moved/A.hlsl");
		REQUIRE(resolver.Resolve("guid-a") == "Shaders/Moved/A.hlsl");
	}
}
