// Copyright 2015 XLGAMES Inc.
//
// Distributed under the MIT License (See
// accompanying file "LICENSE" or the website
// http://www.opensource.org/licenses/mit-license.php)

#pragma once

#include "../NodeCodegen/SlotGraph.h"
#include "../NodeCodegen/Diagnostics.h"
#include <string>
#include <vector>
#include <algorithm>

#pragma GCC diagnostic ignored "-Wunused-function"

namespace UnitTests
{
	using namespace GraphLanguage;

	static Slot MakeSlot(SlotId id, SlotDirection direction, ValueType type, const char displayName[], const char defaultValue[] = "")
	{
		Slot result;
		result._id = id;
		result._direction = direction;
		result._valueType = type;
		result._displayName = displayName;
		result._defaultValue = defaultValue;
		return result;
	}

	static Slot MakeInput(SlotId id, ValueType type, const char displayName[], const char defaultValue[] = "")
	{
		return MakeSlot(id, SlotDirection::Input, type, displayName, defaultValue);
	}

	static Slot MakeOutput(SlotId id, ValueType type, const char displayName[])
	{
		return MakeSlot(id, SlotDirection::Output, type, displayName);
	}

	static Node MakeFunctionNode(NodeId nodeId, FunctionSpec spec, std::vector<Slot> slots, const char name[] = "Custom Function")
	{
		Node result;
		result._nodeId = nodeId;
		result._type = Node::Type::CustomFunction;
		result._name = name;
		result._function = std::move(spec);
		result._slots = std::move(slots);
		return result;
	}

	static Node MakeConstantNode(NodeId nodeId, const char name[], std::vector<Slot> slots)
	{
		Node result;
		result._nodeId = nodeId;
		result._type = Node::Type::Constant;
		result._name = name;
		result._slots = std::move(slots);
		return result;
	}

	/// The standard "In"/"Out" float3 pair used by most of the emitter tests
	static std::vector<Slot> MakeInOutSlots()
	{
		return { MakeInput(0, ValueType::Vector3, "In", "1, 0, 0"), MakeOutput(1, ValueType::Vector3, "Out") };
	}

	static unsigned CountDiagnostics(
		const NodeCodegen::DiagnosticList& diagnostics, 
		NodeCodegen::Diagnostic::Severity severity, const std::string& message)
	{
		return (unsigned)std::count_if(
			diagnostics.begin(), diagnostics.end(),
			[severity, &message](const NodeCodegen::Diagnostic& d) { return d._severity == severity && d._message == message; });
	}

	static unsigned CountDiagnosticsContaining(
		const NodeCodegen::DiagnosticList& diagnostics, 
		NodeCodegen::Diagnostic::Severity severity, const std::string& fragment)
	{
		return (unsigned)std::count_if(
			diagnostics.begin(), diagnostics.end(),
			[severity, &fragment](const NodeCodegen::Diagnostic& d) { return d._severity == severity && d._message.find(fragment) != std::string::npos; });
	}

	/// Counts the top level comma separated items between the first '(' and its matching ')'
	static unsigned CountParameters(const std::string& signatureOrCall)
	{
		auto open = signatureOrCall.find('(');
		if (open == std::string::npos) return 0;
		unsigned depth = 0, count = 0;
		bool anyContent = false;
		for (auto i=signatureOrCall.begin()+open+1; i!=signatureOrCall.end(); ++i) {
			if (*i == '(') ++depth;
			else if (*i == ')') {
				if (depth == 0) break;
				--depth;
			} else if (*i == ',' && depth == 0) ++count;
			if (*i != ' ') anyContent = true;
		}
		return anyContent ? count+1 : 0;
	}
}
