// Copyright 2015 XLGAMES Inc.
//
// Distributed under the MIT License (See
// accompanying file "LICENSE" or the website
// http://www.opensource.org/licenses/mit-license.php)

#include "EmitterConfig.h"
#include "../ConsoleRig/Log.h"
#include "../Core/Exceptions.h"

namespace NodeCodegen
{
	using namespace GraphLanguage;

	static void LoadSentinels(EmitterSentinels& dst, InputStreamFormatter<utf8>& formatter)
	{
		RequireBeginElement(formatter);
		for (;;) {
			StringSection<utf8> name;
			if (!formatter.TryKeyedItem(name)) break;

			if (XlEqString(name, "FunctionName")) {
				dst._functionName = RequireValue(formatter).AsString();
			} else if (XlEqString(name, "FunctionBody")) {
				dst._functionBody = RequireValue(formatter).AsString();
			} else if (XlEqString(name, "FunctionSource")) {
				dst._functionSource = RequireValue(formatter).AsString();
			} else {
				Log(Warning) << "Skipping unknown sentinel (" << name.AsString() << ") in emitter config" << std::endl;
				SkipValueOrElement(formatter);
			}
		}
		RequireEndElement(formatter);
	}

	static std::vector<std::string> LoadStringList(InputStreamFormatter<utf8>& formatter)
	{
		std::vector<std::string> result;
		RequireBeginElement(formatter);
		StringSection<utf8> value;
		while (formatter.TryValue(value))
			result.push_back(value.AsString());
		RequireEndElement(formatter);
		return result;
	}

	EmitterConfig LoadEmitterConfig(InputStreamFormatter<utf8>& formatter)
	{
		EmitterConfig result;
		for (;;) {
			StringSection<utf8> name;
			if (!formatter.TryKeyedItem(name)) break;

			if (XlEqString(name, "Precision")) {
				auto value = RequireValue(formatter);
				auto precision = AsPrecision(value);
				if (!precision)
					Throw(FormatException("Unknown precision in emitter config. Expecting half or float", formatter.GetLocation()));
				result._precision = precision.value();
			} else if (XlEqString(name, "GenerationMode")) {
				auto value = RequireValue(formatter);
				auto mode = AsGenerationMode(value);
				if (!mode)
					Throw(FormatException("Unknown generation mode in emitter config. Expecting Preview or ForReals", formatter.GetLocation()));
				result._generationMode = mode.value();
			} else if (XlEqString(name, "AcceptedExtensions")) {
				result._acceptedExtensions = LoadStringList(formatter);
			} else if (XlEqString(name, "Sentinels")) {
				LoadSentinels(result._sentinels, formatter);
			} else {
				Log(Warning) << "Skipping unknown key (" << name.AsString() << ") in emitter config" << std::endl;
				SkipValueOrElement(formatter);
			}
		}

		if (formatter.PeekNext() != FormatterBlob::None)
			Throw(FormatException("Unexpected trailing content in emitter config", formatter.GetLocation()));

		return result;
	}

	EmitterConfig LoadEmitterConfig(StringSection<utf8> text)
	{
		InputStreamFormatter<utf8> formatter{TextStreamMarker<utf8>{text}};
		return LoadEmitterConfig(formatter);
	}
}
