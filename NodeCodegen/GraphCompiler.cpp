// Copyright 2015 XLGAMES Inc.
//
// Distributed under the MIT License (See
// accompanying file "LICENSE" or the website
// http://www.opensource.org/licenses/mit-license.php)

#include "GraphCompiler.h"
#include "FunctionRegistry.h"
#include "ExpressionAdapter.h"
#include "AssetPathResolver.h"
#include "Identifiers.h"
#include "../ConsoleRig/Log.h"
#include <algorithm>

namespace NodeCodegen
{
	using namespace GraphLanguage;

	static void EmitConstantNode(std::vector<std::string>& dst, const Node& node, Precision precision)
	{
		for (const auto& slot:node.GetSlots()) {
			if (slot._direction != SlotDirection::Output) continue;
			dst.push_back(
				ToTypeString(slot._valueType, precision) + " " + VariableNameForSlot(node, slot._id)
				+ " = " + DefaultValueLiteral(node, slot, precision) + ";");
		}
	}

	GeneratedGraph GraphCompiler::Compile(const SlotGraph& graph, const GraphCompileOptions& options) const
	{
		const auto& cfg = _emitter.GetConfig();

		GeneratedGraph result;
		result._entryPointName = options._graphName + "_" + AsString(cfg._precision);

		const SlotGraph* workingGraph = &graph;
		SlotGraph trimmedGraph;
		if (options._previewNode) {
			trimmedGraph = graph;
			trimmedGraph.Trim(options._previewNode.value());
			workingGraph = &trimmedGraph;
		}

		bool isAcyclic = true;
		result._nodeOrder = SortNodes(*workingGraph, isAcyclic);
		if (!isAcyclic) {
			Log(Warning) << "Graph (" << options._graphName << ") contains a cycle. Generated code may use variables before they are written" << std::endl;
			result._bodyStatements.push_back("// Warning -- graph contains a cycle. Node ordering is only partial");
			result._diagnostics.push_back(Diagnostic{
				Diagnostic::Severity::Warning, 
				"Graph contains a cycle; nodes could not be fully ordered"});
		}

		FunctionRegistry registry;
		for (auto nodeId:result._nodeOrder) {
			auto* node = workingGraph->GetNode(nodeId);
			if (!node) continue;

			if (node->GetType() == Node::Type::Constant) {
				EmitConstantNode(result._bodyStatements, *node, cfg._precision);
				continue;
			}

			_emitter.ValidateNode(result._diagnostics, *node);

			auto fragment = _emitter.EmitCallSite(
				*node, 
				MakeInputResolver(*workingGraph, *node, *_expressionAdapter, cfg._precision, cfg._generationMode));
			result._bodyStatements.insert(
				result._bodyStatements.end(),
				std::make_move_iterator(fragment._statements.begin()), std::make_move_iterator(fragment._statements.end()));

			auto firstNewDiagnostic = result._diagnostics.size();
			_emitter.Provide(registry, node->_function, node->GetSlots(), result._diagnostics);
			for (auto i=result._diagnostics.begin()+firstNewDiagnostic; i!=result._diagnostics.end(); ++i)
				i->_nodeId = node->_nodeId;
		}

		result._functionBlock = registry.BuildSource();

		Log(Verbose) 
			<< "Generated graph (" << options._graphName << ") with (" << result._nodeOrder.size() << ") nodes, ("
			<< registry.GetEntries().size() << ") functions and (" << result._diagnostics.size() << ") diagnostics" << std::endl;
		return result;
	}

	GraphCompiler::GraphCompiler(
		const EmitterConfig& cfg,
		std::shared_ptr<IAssetPathResolver> pathResolver,
		std::shared_ptr<IExpressionAdapter> expressionAdapter)
	: _emitter(cfg, std::move(pathResolver))
	, _expressionAdapter(std::move(expressionAdapter))
	{
		if (!_expressionAdapter)
			_expressionAdapter = std::make_shared<BasicExpressionAdapter>();
	}

	GraphCompiler::~GraphCompiler() {}

///////////////////////////////////////////////////////////////////////////////////////////////////

	std::string GeneratedGraph::AssembleSource() const
	{
		SourceBuilder builder;
		builder.AppendLines(MakeStringSection(_functionBlock));
		if (!_functionBlock.empty())
			builder.AppendLine("");
		builder.AppendLine(MakeStringSection("void " + _entryPointName + "()"));
		{
			auto block = builder.Block();
			for (const auto& s:_bodyStatements)
				builder.AppendLine(MakeStringSection(s));
		}
		return builder.GetText();
	}

	bool GeneratedGraph::HasErrors() const
	{
		return std::find_if(
			_diagnostics.begin(), _diagnostics.end(),
			[](const Diagnostic& d) { return d._severity == Diagnostic::Severity::Error; }) != _diagnostics.end();
	}
}
