// Distributed under the MIT License (See
// accompanying file "LICENSE" or the website
// http://www.opensource.org/licenses/mit-license.php)

#pragma once

#include "SlotTypes.h"
#include "../Utility/Streams/StreamFormatter.h"
#include <string>
#include <vector>

namespace NodeCodegen
{
	/// <summary>Placeholder text that a freshly created node carries until the author replaces it</summary>
	class EmitterSentinels
	{
	public:
		std::string _functionName = "Enter function name here...";
		std::string _functionBody = "Enter function body here...";
		std::string _functionSource = "Enter function source file path here...";
	};

	class EmitterConfig
	{
	public:
		GraphLanguage::Precision		_precision = GraphLanguage::Precision::Float;
		GraphLanguage::GenerationMode	_generationMode = GraphLanguage::GenerationMode::ForReals;

		/// File extensions (including the period) a function source file may have
		std::vector<std::string>		_acceptedExtensions = { ".hlsl", ".cginc" };

		EmitterSentinels				_sentinels;
	};

	/// <summary>Reads an EmitterConfig from the indentation based text format</summary>
	/// Example:
	/// <code>\code
	///		Precision = half
	///		GenerationMode = Preview
	///		AcceptedExtensions =~
	///			= .hlsl; = .cginc; = .hlsli
	///		Sentinels =~
	///			FunctionName = <:(Enter function name here...):>
	/// \endcode</code>
	/// Settings not mentioned keep their defaults. Unknown keys are skipped. Throws
	/// Utility::FormatException on malformed input or unrecognized enum values.
	EmitterConfig LoadEmitterConfig(InputStreamFormatter<utf8>& formatter);
	EmitterConfig LoadEmitterConfig(StringSection<utf8> text);
}
