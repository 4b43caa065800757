// Distributed under the MIT License (See
// accompanying file "LICENSE" or the website
// http://www.opensource.org/licenses/mit-license.php)

#pragma once

#include "SlotGraph.h"
#include "FunctionSpec.h"
#include "Diagnostics.h"
#include "EmitterConfig.h"
#include "FunctionRegistry.h"
#include "../Utility/IteratorUtils.h"
#include <string>
#include <vector>
#include <memory>
#include <functional>

namespace NodeCodegen
{
	class IAssetPathResolver;
	class IExpressionAdapter;

	/// <summary>Ordered statements generated for a single call site</summary>
	class CodeFragment
	{
	public:
		std::vector<std::string> _statements;
	};

	/// <summary>Returns the value expression to pass for an input slot</summary>
	using InputResolver = std::function<std::string(const GraphLanguage::Slot&)>;

	/// <summary>Generates code for nodes that call a user supplied shader function</summary>
	/// The function either lives in an external include file, or its body is typed into the
	/// node. For each node, generation happens in three parts:
	/// <list>
	///		<item>EmitCallSite() declares the output temporaries and calls the function</item>
	///		<item>EmitFunctionHeader() builds the prototype that matches that call</item>
	///		<item>Provide() registers the function definition (or the #include) once per identity</item>
	/// </list>
	/// Incomplete nodes don't fail generation; they just generate less code. ValidateNode()
	/// explains to the author why.
	class FunctionCallEmitter
	{
	public:
		bool IsValid(const GraphLanguage::FunctionSpec& spec) const;
		void ValidateNode(DiagnosticList& diagnostics, const GraphLanguage::Node& node) const;

		CodeFragment EmitCallSite(const GraphLanguage::Node& node, const InputResolver& resolveInput) const;
		std::string EmitFunctionHeader(const GraphLanguage::FunctionSpec& spec, IteratorRange<const GraphLanguage::Slot*> slots) const;

		void Provide(
			FunctionRegistry& registry,
			const GraphLanguage::FunctionSpec& spec, IteratorRange<const GraphLanguage::Slot*> slots,
			DiagnosticList& diagnostics) const;

		/// <summary>Include path for a file source; the raw reference when the resolver doesn't know it</summary>
		std::string ResolveSourcePath(const GraphLanguage::FileSource& source) const;
		bool IsAcceptedExtension(StringSection<> path) const;

		const EmitterConfig& GetConfig() const { return _cfg; }

		FunctionCallEmitter(const EmitterConfig& cfg, std::shared_ptr<IAssetPathResolver> pathResolver);
		~FunctionCallEmitter();
	private:
		EmitterConfig _cfg;
		std::shared_ptr<IAssetPathResolver> _pathResolver;

		bool IsSet(const std::string& value, const std::string& sentinel) const { return !value.empty() && value != sentinel; }
	};

	std::string EmitFunctionHeader(
		const GraphLanguage::FunctionSpec& spec, 
		IteratorRange<const GraphLanguage::Slot*> slots,
		GraphLanguage::Precision precision);

	/// <summary>Value expression for an input slot with no incoming edge</summary>
	/// In preview mode this is the slot's own variable, so the previewer can drive it as a
	/// material property. Otherwise it's a literal built from the slot's default components.
	std::string DefaultValueExpression(
		const GraphLanguage::Node& node, const GraphLanguage::Slot& slot,
		GraphLanguage::Precision precision, GraphLanguage::GenerationMode mode);

	/// <summary>Literal for a slot's default value, with missing components set to zero</summary>
	std::string DefaultValueLiteral(
		const GraphLanguage::Node& node, const GraphLanguage::Slot& slot,
		GraphLanguage::Precision precision);

	/// <summary>Value expression for an input slot, following its incoming edge if there is one</summary>
	/// A dangling edge (missing producer node or slot) results in an empty expression.
	std::string ResolveInput(
		const GraphLanguage::SlotGraph& graph, 
		const GraphLanguage::Node& node, const GraphLanguage::Slot& slot,
		IExpressionAdapter& adapter,
		GraphLanguage::Precision precision, GraphLanguage::GenerationMode mode);

	InputResolver MakeInputResolver(
		const GraphLanguage::SlotGraph& graph, const GraphLanguage::Node& node,
		IExpressionAdapter& adapter,
		GraphLanguage::Precision precision, GraphLanguage::GenerationMode mode);
}
