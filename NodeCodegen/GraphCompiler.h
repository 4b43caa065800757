// Distributed under the MIT License (See
// accompanying file "LICENSE" or the website
// http://www.opensource.org/licenses/mit-license.php)

#pragma once

#include "SlotGraph.h"
#include "Diagnostics.h"
#include "EmitterConfig.h"
#include "FunctionCallEmitter.h"
#include <string>
#include <vector>
#include <memory>
#include <optional>

namespace NodeCodegen
{
	class IAssetPathResolver;
	class IExpressionAdapter;

	class GraphCompileOptions
	{
	public:
		std::string _graphName = "Graph";

		/// When set, only the nodes that contribute to this node are generated
		std::optional<GraphLanguage::NodeId> _previewNode;
	};

	/// <summary>Output of a full graph pass</summary>
	class GeneratedGraph
	{
	public:
		std::string					_entryPointName;
		std::string					_functionBlock;		///< every provided function, in first-use order
		std::vector<std::string>	_bodyStatements;
		DiagnosticList				_diagnostics;
		std::vector<GraphLanguage::NodeId> _nodeOrder;

		/// <summary>Function block followed by an entry point that runs the body</summary>
		std::string AssembleSource() const;
		bool HasErrors() const;
	};

	/// <summary>Generates shader source for a complete slot graph</summary>
	/// Nodes are visited so that every node comes after the nodes that feed it. Each custom
	/// function node is validated, its call site is appended to the body, and its function
	/// definition is provided to a registry owned by the pass. Constant nodes declare their
	/// outputs initialized from their default values.
	class GraphCompiler
	{
	public:
		GeneratedGraph Compile(const GraphLanguage::SlotGraph& graph, const GraphCompileOptions& options) const;

		GraphCompiler(
			const EmitterConfig& cfg,
			std::shared_ptr<IAssetPathResolver> pathResolver,
			std::shared_ptr<IExpressionAdapter> expressionAdapter);
		~GraphCompiler();
	private:
		FunctionCallEmitter _emitter;
		std::shared_ptr<IExpressionAdapter> _expressionAdapter;
	};
}
