// Copyright 2015 XLGAMES Inc.
//
// Distributed under the MIT License (See
// accompanying file "LICENSE" or the website
// http://www.opensource.org/licenses/mit-license.php)

#include "Identifiers.h"
#include <algorithm>

namespace NodeCodegen
{
	static bool IsIdentifierChar(char c)
	{
		return (c >= '0' && c <= '9') || c == '_' || (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z');
	}

	std::string SanitizeIdentifier(StringSection<> input)
	{
		std::string result;
		result.reserve(input.size());
		for (auto c:input)
			result.push_back(IsIdentifierChar(c) ? c : '_');
		return result;
	}

	static const char* s_reservedWords[] = 
	{
		"AppendStructuredBuffer", "asm", "asm_fragment", "BlendState", "bool", "break", "Buffer", "ByteAddressBuffer",
		"case", "cbuffer", "centroid", "class", "column_major", "compile", "compile_fragment", "CompileShader",
		"const", "continue", "ComputeShader", "ConsumeStructuredBuffer", "default", "DepthStencilState",
		"DepthStencilView", "discard", "do", "double", "DomainShader", "dword", "else", "export", "extern",
		"false", "float", "for", "fxgroup", "GeometryShader", "groupshared", "half", "HullShader", "if", "in",
		"inline", "inout", "InputPatch", "int", "interface", "line", "lineadj", "linear", "LineStream", "matrix",
		"min16float", "min10float", "min16int", "min12int", "min16uint", "namespace", "nointerpolation",
		"noperspective", "NULL", "out", "OutputPatch", "packoffset", "pass", "pixelfragment", "PixelShader",
		"point", "PointStream", "precise", "RasterizerState", "RenderTargetView", "return", "register",
		"row_major", "RWBuffer", "RWByteAddressBuffer", "RWStructuredBuffer", "RWTexture1D", "RWTexture1DArray",
		"RWTexture2D", "RWTexture2DArray", "RWTexture3D", "sample", "sampler", "SamplerState",
		"SamplerComparisonState", "shared", "snorm", "stateblock", "stateblock_state", "static", "string",
		"struct", "switch", "StructuredBuffer", "tbuffer", "technique", "technique10", "technique11", "texture",
		"Texture1D", "Texture1DArray", "Texture2D", "Texture2DArray", "Texture2DMS", "Texture2DMSArray",
		"Texture3D", "TextureCube", "TextureCubeArray", "true", "typedef", "triangle", "triangleadj",
		"TriangleStream", "uint", "uniform", "unorm", "unsigned", "vector", "vertexfragment", "VertexShader",
		"void", "volatile", "while"
	};

	bool IsReservedWord(StringSection<> name)
	{
		return std::find_if(
			std::begin(s_reservedWords), std::end(s_reservedWords),
			[name](const char* w) { return XlEqString(name, w); }) != std::end(s_reservedWords);
	}

	std::optional<std::string> ValidateSlotName(StringSection<> name)
	{
		if (name.IsEmpty())
			return std::string("Slot names can not be empty.");

		auto invalidChar = std::find_if(name.begin(), name.end(), [](char c) { return !IsIdentifierChar(c) && c != ' '; });
		if (invalidChar != name.end())
			return "Slot name (" + name.AsString() + ") contains invalid characters. Only letters, digits, spaces and underscores are allowed.";

		if (name[0] >= '0' && name[0] <= '9')
			return "Slot name (" + name.AsString() + ") can not start with a digit.";

		if (IsReservedWord(name) || IsReservedWord(MakeStringSection(SanitizeIdentifier(name))))
			return "Slot name (" + name.AsString() + ") is a reserved shader language keyword.";

		return {};
	}

	std::string VariableNameForSlot(const GraphLanguage::Node& node, GraphLanguage::SlotId slotId)
	{
		return "_" + SanitizeIdentifier(MakeStringSection(node._name)) + "_" + std::to_string(node._nodeId) + "_" + std::to_string(slotId);
	}
}
