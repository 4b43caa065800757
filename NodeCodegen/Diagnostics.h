// Distributed under the MIT License (See
// accompanying file "LICENSE" or the website
// http://www.opensource.org/licenses/mit-license.php)

#pragma once

#include "SlotGraph.h"
#include <string>
#include <vector>

namespace NodeCodegen
{
	/// <summary>Authoring problem found on a node</summary>
	/// Diagnostics are reported back to the author; they never stop generation of the
	/// rest of the graph.
	class Diagnostic
	{
	public:
		enum class Severity { Warning, Error };

		Severity					_severity = Severity::Warning;
		std::string					_message;
		GraphLanguage::NodeId		_nodeId = GraphLanguage::NodeId_Invalid;
	};

	using DiagnosticList = std::vector<Diagnostic>;

	inline const char* AsString(Diagnostic::Severity severity)
	{
		return (severity == Diagnostic::Severity::Error) ? "Error" : "Warning";
	}
}
