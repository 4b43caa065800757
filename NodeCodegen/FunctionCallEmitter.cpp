// Copyright 2015 XLGAMES Inc.
//
// Distributed under the MIT License (See
// accompanying file "LICENSE" or the website
// http://www.opensource.org/licenses/mit-license.php)

#include "FunctionCallEmitter.h"
#include "AssetPathResolver.h"
#include "ExpressionAdapter.h"
#include "Identifiers.h"
#include "Exceptions.h"
#include "../ConsoleRig/Log.h"
#include "../Core/Exceptions.h"
#include "../Utility/StringUtils.h"
#include "../Utility/Streams/PathUtils.h"
#include <sstream>
#include <algorithm>

namespace NodeCodegen
{
	using namespace GraphLanguage;

	static const char s_noFunctionNameSet[] = "A Custom Function Node requires a function name to be set.";
	static const char s_noFunctionBodySet[] = "String mode requires a function body to be set.";
	static const char s_noFileSelected[] = "File mode requires a Source file to be selected.";
	static const char s_missingOutputSlot[] = "A Custom Function Node must have at least one output slot";

	static std::string InvalidFileTypeMessage(IteratorRange<const std::string*> acceptedExtensions)
	{
		std::stringstream str;
		str << "Source file is not a valid file type. Valid file extensions are ";
		for (size_t c=0; c<acceptedExtensions.size(); ++c) {
			if (c != 0) str << ((c+1 == acceptedExtensions.size()) ? " and " : ", ");
			str << acceptedExtensions[c];
		}
		return str.str();
	}

	static std::string FunctionNameWithPrecision(const FunctionSpec& spec, Precision precision)
	{
		return spec._functionName + "_" + AsString(precision);
	}

///////////////////////////////////////////////////////////////////////////////////////////////////

	std::string FunctionCallEmitter::ResolveSourcePath(const FileSource& source) const
	{
		std::string path;
		if (_pathResolver)
			path = _pathResolver->Resolve(MakeStringSection(source._reference));

		// Older nodes stored a plain path instead of a reference. Fall back to using that directly
		if (path.empty())
			path = source._reference;
		return path;
	}

	bool FunctionCallEmitter::IsAcceptedExtension(StringSection<> path) const
	{
		auto extension = MakeFileNameSplitter(path).ExtensionWithPeriod();
		if (extension.IsEmpty()) return false;
		return std::find_if(
			_cfg._acceptedExtensions.begin(), _cfg._acceptedExtensions.end(),
			[extension](const std::string& e) { return XlEqString(MakeStringSection(e), extension); }) != _cfg._acceptedExtensions.end();
	}

	bool FunctionCallEmitter::IsValid(const FunctionSpec& spec) const
	{
		if (!IsSet(spec._functionName, _cfg._sentinels._functionName))
			return false;

		if (auto* inlineSource = spec.GetInlineSource())
			return IsSet(inlineSource->_body, _cfg._sentinels._functionBody);

		if (auto* fileSource = spec.GetFileSource()) {
			if (!IsSet(fileSource->_reference, _cfg._sentinels._functionSource))
				return false;
			return IsAcceptedExtension(MakeStringSection(ResolveSourcePath(*fileSource)));
		}

		return false;
	}

	void FunctionCallEmitter::ValidateNode(DiagnosticList& diagnostics, const Node& node) const
	{
		auto addDiagnostic = [&diagnostics, &node](Diagnostic::Severity severity, std::string message) {
			diagnostics.push_back(Diagnostic{severity, std::move(message), node._nodeId});
		};

		auto partition = PartitionSlots(node.GetSlots());
		if (partition._outputs.empty())
			addDiagnostic(Diagnostic::Severity::Warning, s_missingOutputSlot);

		const auto& spec = node._function;
		if (!IsSet(spec._functionName, _cfg._sentinels._functionName))
			addDiagnostic(Diagnostic::Severity::Warning, s_noFunctionNameSet);

		if (auto* inlineSource = spec.GetInlineSource()) {
			if (!IsSet(inlineSource->_body, _cfg._sentinels._functionBody))
				addDiagnostic(Diagnostic::Severity::Warning, s_noFunctionBodySet);
		} else if (auto* fileSource = spec.GetFileSource()) {
			if (!IsSet(fileSource->_reference, _cfg._sentinels._functionSource))
				addDiagnostic(Diagnostic::Severity::Warning, s_noFileSelected);
			else if (!IsAcceptedExtension(MakeStringSection(ResolveSourcePath(*fileSource))))
				addDiagnostic(Diagnostic::Severity::Error, InvalidFileTypeMessage(MakeIteratorRange(_cfg._acceptedExtensions)));
		}

		// Only the first bad slot name is reported
		for (const auto& slot:node.GetSlots()) {
			auto error = ValidateSlotName(MakeStringSection(slot._displayName));
			if (error) {
				addDiagnostic(Diagnostic::Severity::Error, error.value());
				break;
			}
		}

		// Parameter names in the header are the sanitized display names, so they must be unique
		std::vector<std::pair<std::string, const Slot*>> sanitizedNames;
		for (const auto& slot:node.GetSlots()) {
			auto sanitized = SanitizeIdentifier(MakeStringSection(slot._displayName));
			auto existing = std::find_if(
				sanitizedNames.begin(), sanitizedNames.end(),
				[&sanitized](const std::pair<std::string, const Slot*>& p) { return p.first == sanitized; });
			if (existing != sanitizedNames.end()) {
				addDiagnostic(
					Diagnostic::Severity::Error,
					"Slots (" + existing->second->_displayName + ") and (" + slot._displayName + ") both use the parameter name (" + sanitized + ")");
			} else
				sanitizedNames.emplace_back(std::move(sanitized), &slot);
		}
	}

///////////////////////////////////////////////////////////////////////////////////////////////////

	CodeFragment FunctionCallEmitter::EmitCallSite(const Node& node, const InputResolver& resolveInput) const
	{
		CodeFragment result;
		auto partition = PartitionSlots(node.GetSlots());

		auto precision = _cfg._precision;
		if (!IsValid(node._function)) {
			// Incomplete nodes still declare their first output in preview mode, so the
			// previewer has a typed variable to display
			if (_cfg._generationMode == GenerationMode::Preview && !partition._outputs.empty()) {
				const auto& first = *partition._outputs[0];
				result._statements.push_back(ToTypeString(first._valueType, precision) + " " + VariableNameForSlot(node, first._id) + ";");
			}
			return result;
		}

		for (const auto* output:partition._outputs)
			result._statements.push_back(ToTypeString(output->_valueType, precision) + " " + VariableNameForSlot(node, output->_id) + ";");

		std::stringstream call;
		call << FunctionNameWithPrecision(node._function, precision) << "(";
		bool pendingComma = false;
		for (const auto* input:partition._inputs) {
			if (pendingComma) call << ", ";
			pendingComma = true;
			call << resolveInput(*input);
		}
		for (const auto* output:partition._outputs) {
			if (pendingComma) call << ", ";
			pendingComma = true;
			call << VariableNameForSlot(node, output->_id);
		}
		call << ");";
		result._statements.push_back(call.str());
		return result;
	}

	std::string EmitFunctionHeader(const FunctionSpec& spec, IteratorRange<const Slot*> slots, Precision precision)
	{
		auto partition = PartitionSlots(slots);

		std::stringstream header;
		header << "void " << FunctionNameWithPrecision(spec, precision) << "(";
		bool pendingComma = false;
		for (const auto* input:partition._inputs) {
			if (pendingComma) header << ", ";
			pendingComma = true;
			header << ToTypeString(input->_valueType, precision) << " " << SanitizeIdentifier(MakeStringSection(input->_displayName));
		}
		for (const auto* output:partition._outputs) {
			if (pendingComma) header << ", ";
			pendingComma = true;
			header << "out " << ToTypeString(output->_valueType, precision) << " " << SanitizeIdentifier(MakeStringSection(output->_displayName));
		}
		header << ")";
		return header.str();
	}

	std::string FunctionCallEmitter::EmitFunctionHeader(const FunctionSpec& spec, IteratorRange<const Slot*> slots) const
	{
		return NodeCodegen::EmitFunctionHeader(spec, slots, _cfg._precision);
	}

///////////////////////////////////////////////////////////////////////////////////////////////////

	void FunctionCallEmitter::Provide(
		FunctionRegistry& registry,
		const FunctionSpec& spec, IteratorRange<const Slot*> slots,
		DiagnosticList& diagnostics) const
	{
		if (spec._source.valueless_by_exception())
			Throw(Exceptions::UnsupportedSourceMode(spec._functionName.c_str()));

		if (!IsValid(spec))
			return;

		if (auto* fileSource = spec.GetFileSource()) {
			auto path = ResolveSourcePath(*fileSource);
			auto result = registry.ProvideFunction(
				MakeStringSection(path),
				[&path](SourceBuilder& builder) {
					builder.AppendLine(MakeStringSection("#include \"" + path + "\""));
				});
			if (result == FunctionRegistry::ProvideResult::Inserted)
				Log(Verbose) << "Including function source (" << path << ") for (" << spec._functionName << ")" << std::endl;
		} else if (auto* inlineSource = spec.GetInlineSource()) {
			auto header = EmitFunctionHeader(spec, slots);
			auto fingerprint = header + "\n" + inlineSource->_body;
			auto result = registry.ProvideFunction(
				MakeStringSection(spec._functionName),
				[&header, inlineSource](SourceBuilder& builder) {
					builder.AppendLine(MakeStringSection(header));
					auto block = builder.Block();
					builder.AppendLines(MakeStringSection(inlineSource->_body));
				},
				MakeStringSection(fingerprint));

			if (result == FunctionRegistry::ProvideResult::Conflict) {
				// The first definition wins; the author must rename one of the functions
				Log(Warning) << "Function (" << spec._functionName << ") is defined more than once with different signatures or bodies. Only the first definition is used" << std::endl;
				diagnostics.push_back(Diagnostic{
					Diagnostic::Severity::Warning,
					"Function (" + spec._functionName + ") is already defined by another node with a different signature or body. Only the first definition is used."});
			}
		} else
			Throw(Exceptions::UnsupportedSourceMode(spec._functionName.c_str()));
	}

	FunctionCallEmitter::FunctionCallEmitter(const EmitterConfig& cfg, std::shared_ptr<IAssetPathResolver> pathResolver)
	: _cfg(cfg), _pathResolver(std::move(pathResolver))
	{}

	FunctionCallEmitter::~FunctionCallEmitter() {}

///////////////////////////////////////////////////////////////////////////////////////////////////

	std::string DefaultValueLiteral(const Node& node, const Slot& slot, Precision precision)
	{
		auto componentCount = GetComponentCount(slot._valueType);

		// Resource types have no literal form; they can only be bound from outside
		if (componentCount == 0)
			return slot._defaultValue.empty() ? VariableNameForSlot(node, slot._id) : slot._defaultValue;

		if (slot._valueType == ValueType::Boolean) {
			auto* comma = std::find(slot._defaultValue.data(), slot._defaultValue.data() + slot._defaultValue.size(), ',');
			auto stripped = StripWhitespace(MakeStringSection(slot._defaultValue.data(), comma));
			return stripped.IsEmpty() ? std::string("false") : stripped.AsString();
		}

		std::vector<std::string> components;
		components.reserve(componentCount);
		auto* i = slot._defaultValue.data();
		auto* end = slot._defaultValue.data() + slot._defaultValue.size();
		while (i != end && components.size() < componentCount) {
			auto* comma = std::find(i, end, ',');
			auto component = StripWhitespace(MakeStringSection(i, comma));
			components.push_back(component.IsEmpty() ? std::string("0") : component.AsString());
			i = (comma != end) ? comma+1 : end;
		}
		while (components.size() < componentCount)
			components.push_back("0");

		if (componentCount == 1)
			return components[0];

		std::stringstream str;
		str << ToTypeString(slot._valueType, precision) << "(";
		for (size_t c=0; c<components.size(); ++c) {
			if (c != 0) str << ", ";
			str << components[c];
		}
		str << ")";
		return str.str();
	}

	std::string DefaultValueExpression(const Node& node, const Slot& slot, Precision precision, GenerationMode mode)
	{
		if (mode == GenerationMode::Preview)
			return VariableNameForSlot(node, slot._id);
		return DefaultValueLiteral(node, slot, precision);
	}

	std::string ResolveInput(
		const SlotGraph& graph, 
		const Node& node, const Slot& slot,
		IExpressionAdapter& adapter,
		Precision precision, GenerationMode mode)
	{
		auto edge = graph.GetIncomingEdge(node._nodeId, slot._id);
		if (!edge)
			return DefaultValueExpression(node, slot, precision, mode);

		auto* producer = graph.GetNode(edge->_producerNodeId);
		if (!producer || !producer->FindOutputSlot(edge->_producerSlotId)) {
			Log(Verbose) << "Input (" << slot._displayName << ") on node (" << node._nodeId << ") is connected to a missing node or slot. Passing an empty expression" << std::endl;
			return std::string();
		}

		return adapter.Adapt(*producer, edge->_producerSlotId, slot._valueType, precision);
	}

	InputResolver MakeInputResolver(
		const SlotGraph& graph, const Node& node,
		IExpressionAdapter& adapter,
		Precision precision, GenerationMode mode)
	{
		return [&graph, &node, &adapter, precision, mode](const Slot& slot) {
			return ResolveInput(graph, node, slot, adapter, precision, mode);
		};
	}
}
