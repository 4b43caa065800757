// Copyright 2015 XLGAMES Inc.
//
// Distributed under the MIT License (See
// accompanying file "LICENSE" or the website
// http://www.opensource.org/licenses/mit-license.php)

#include "SlotTypes.h"

namespace GraphLanguage
{
	static const std::pair<ValueType, const char*> s_valueTypeNames[] = 
	{
		{ ValueType::Vector1, "Vector1" },
		{ ValueType::Vector2, "Vector2" },
		{ ValueType::Vector3, "Vector3" },
		{ ValueType::Vector4, "Vector4" },
		{ ValueType::Matrix2, "Matrix2" },
		{ ValueType::Matrix3, "Matrix3" },
		{ ValueType::Matrix4, "Matrix4" },
		{ ValueType::Boolean, "Boolean" },
		{ ValueType::Texture2D, "Texture2D" },
		{ ValueType::Texture2DArray, "Texture2DArray" },
		{ ValueType::Texture3D, "Texture3D" },
		{ ValueType::Cubemap, "Cubemap" },
		{ ValueType::SamplerState, "SamplerState" },
		{ ValueType::Gradient, "Gradient" }
	};

	const char* AsString(ValueType type)
	{
		for (const auto& n:s_valueTypeNames)
			if (n.first == type) return n.second;
		return "<<unknown>>";
	}

	const char* AsString(Precision precision)
	{
		switch (precision) {
		case Precision::Half: return "half";
		case Precision::Float: return "float";
		}
		return "<<unknown>>";
	}

	const char* AsString(GenerationMode mode)
	{
		switch (mode) {
		case GenerationMode::Preview: return "Preview";
		case GenerationMode::ForReals: return "ForReals";
		}
		return "<<unknown>>";
	}

	std::optional<ValueType> AsValueType(StringSection<> str)
	{
		for (const auto& n:s_valueTypeNames)
			if (XlEqStringI(str, n.second)) return n.first;
		return {};
	}

	std::optional<Precision> AsPrecision(StringSection<> str)
	{
		if (XlEqStringI(str, "half")) return Precision::Half;
		if (XlEqStringI(str, "float")) return Precision::Float;
		return {};
	}

	std::optional<GenerationMode> AsGenerationMode(StringSection<> str)
	{
		if (XlEqStringI(str, "Preview")) return GenerationMode::Preview;
		if (XlEqStringI(str, "ForReals")) return GenerationMode::ForReals;
		return {};
	}

	unsigned GetComponentCount(ValueType type)
	{
		switch (type) {
		case ValueType::Vector1: return 1;
		case ValueType::Vector2: return 2;
		case ValueType::Vector3: return 3;
		case ValueType::Vector4: return 4;
		case ValueType::Matrix2: return 4;
		case ValueType::Matrix3: return 9;
		case ValueType::Matrix4: return 16;
		case ValueType::Boolean: return 1;
		default: return 0;
		}
	}

	unsigned GetMatrixDimension(ValueType type)
	{
		switch (type) {
		case ValueType::Matrix2: return 2;
		case ValueType::Matrix3: return 3;
		case ValueType::Matrix4: return 4;
		default: return 0;
		}
	}

	std::string ToTypeString(ValueType type, Precision precision)
	{
		std::string scalar = AsString(precision);
		switch (type) {
		case ValueType::Vector1:		return scalar;
		case ValueType::Vector2:		return scalar + "2";
		case ValueType::Vector3:		return scalar + "3";
		case ValueType::Vector4:		return scalar + "4";
		case ValueType::Matrix2:		return scalar + "2x2";
		case ValueType::Matrix3:		return scalar + "3x3";
		case ValueType::Matrix4:		return scalar + "4x4";
		case ValueType::Boolean:		return "bool";
		case ValueType::Texture2D:		return "Texture2D";
		case ValueType::Texture2DArray:	return "Texture2DArray";
		case ValueType::Texture3D:		return "Texture3D";
		case ValueType::Cubemap:		return "TextureCube";
		case ValueType::SamplerState:	return "SamplerState";
		case ValueType::Gradient:		return "Gradient";
		}
		return std::string();
	}
}
