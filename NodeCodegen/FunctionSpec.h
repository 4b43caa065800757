// Distributed under the MIT License (See
// accompanying file "LICENSE" or the website
// http://www.opensource.org/licenses/mit-license.php)

#pragma once

#include <string>
#include <variant>

namespace GraphLanguage
{
	/// <summary>Function implemented in an external shader include file</summary>
	/// The reference is an opaque handle (typically an asset id) that must be passed through
	/// an IAssetPathResolver to get a usable path.
	class FileSource
	{
	public:
		std::string _reference;
	};

	/// <summary>Function implemented with a body typed directly into the node</summary>
	class InlineSource
	{
	public:
		std::string _body;
	};

	enum class SourceMode { File, Inline };

	/// <summary>The function a custom function node calls</summary>
	/// Exactly one of the source kinds is active at a time.
	class FunctionSpec
	{
	public:
		std::string _functionName;
		std::variant<FileSource, InlineSource> _source;

		SourceMode GetSourceMode() const { return std::holds_alternative<InlineSource>(_source) ? SourceMode::Inline : SourceMode::File; }
		const FileSource* GetFileSource() const { return std::get_if<FileSource>(&_source); }
		const InlineSource* GetInlineSource() const { return std::get_if<InlineSource>(&_source); }
	};

	inline FunctionSpec MakeFileFunction(std::string functionName, std::string reference)
	{
		return FunctionSpec { std::move(functionName), FileSource { std::move(reference) } };
	}

	inline FunctionSpec MakeInlineFunction(std::string functionName, std::string body)
	{
		return FunctionSpec { std::move(functionName), InlineSource { std::move(body) } };
	}
}
