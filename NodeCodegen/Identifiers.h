// Distributed under the MIT License (See
// accompanying file "LICENSE" or the website
// http://www.opensource.org/licenses/mit-license.php)

#pragma once

#include "SlotGraph.h"
#include "../Utility/StringUtils.h"
#include <string>
#include <optional>

namespace NodeCodegen
{
	/// <summary>Replaces every character that can't appear in a shader identifier with '_'</summary>
	std::string SanitizeIdentifier(StringSection<> input);

	/// <summary>Checks that a slot's display name can become a shader parameter name</summary>
	/// Returns an error message for the first problem found, or nothing when the name is usable.
	/// Spaces are accepted, because SanitizeIdentifier() turns them into underscores.
	std::optional<std::string> ValidateSlotName(StringSection<> name);

	bool IsReservedWord(StringSection<> name);

	/// <summary>Name of the temporary that holds the value of a node's slot in generated code</summary>
	/// Unique per (node, slot id) pair and stable from pass to pass.
	std::string VariableNameForSlot(const GraphLanguage::Node& node, GraphLanguage::SlotId slotId);
}
