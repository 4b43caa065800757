// Distributed under the MIT License (See
// accompanying file "LICENSE" or the website
// http://www.opensource.org/licenses/mit-license.php)

#pragma once

#include "../Utility/StringUtils.h"
#include <string>
#include <optional>

namespace GraphLanguage
{
	enum class ValueType
	{
		Vector1, Vector2, Vector3, Vector4,
		Matrix2, Matrix3, Matrix4,
		Boolean,
		Texture2D, Texture2DArray, Texture3D, Cubemap,
		SamplerState,
		Gradient
	};

	enum class Precision { Half, Float };
	enum class GenerationMode { Preview, ForReals };

	const char* AsString(ValueType);
	const char* AsString(Precision);
	const char* AsString(GenerationMode);

	std::optional<ValueType> AsValueType(StringSection<> str);
	std::optional<Precision> AsPrecision(StringSection<> str);
	std::optional<GenerationMode> AsGenerationMode(StringSection<> str);

	/// <summary>Number of scalar components in a vector or matrix type</summary>
	/// Returns 0 for types that can't be expressed as a list of components (textures, samplers, etc)
	unsigned GetComponentCount(ValueType type);

	/// <summary>Row count for square matrix types, 0 for everything else</summary>
	unsigned GetMatrixDimension(ValueType type);

	inline bool IsVectorType(ValueType type) { return type >= ValueType::Vector1 && type <= ValueType::Vector4; }
	inline bool IsMatrixType(ValueType type) { return type >= ValueType::Matrix2 && type <= ValueType::Matrix4; }

	/// <summary>Shader language name for a value type</summary>
	/// Numeric types take their scalar from the precision ("half3", "float4x4"). Resource types
	/// (textures, samplers, gradients) are unaffected by precision.
	std::string ToTypeString(ValueType type, Precision precision);
}
