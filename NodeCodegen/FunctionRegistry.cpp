// Distributed under the MIT License (See
// accompanying file "LICENSE" or the website
// http://www.opensource.org/licenses/mit-license.php)

#include "FunctionRegistry.h"
#include <algorithm>

namespace NodeCodegen
{
	void SourceBuilder::AppendLine(StringSection<> line)
	{
		if (!line.IsEmpty())
			_text.append(_indentLevel, '\t');
		_text.append(line.begin(), line.end());
		_text.push_back('\n');
	}

	void SourceBuilder::AppendLines(StringSection<> lines)
	{
		ForEachLine(lines, [this](StringSection<> line) { AppendLine(line); });
	}

	SourceBuilder::BlockScope::BlockScope(SourceBuilder& builder)
	: _builder(&builder)
	{
		_builder->AppendLine("{");
		++_builder->_indentLevel;
	}

	SourceBuilder::BlockScope::~BlockScope()
	{
		--_builder->_indentLevel;
		_builder->AppendLine("}");
	}

	SourceBuilder::SourceBuilder() : _indentLevel(0) {}
	SourceBuilder::~SourceBuilder() {}

		///////////////////////////////////////////////////////////////

	auto FunctionRegistry::ProvideFunction(StringSection<> identity, const ContentWriter& writer, StringSection<> fingerprint) -> ProvideResult
	{
		// check and insert under the same lock, so concurrent providers of the same identity can't both write
		ScopedLock(_lock);
		auto existing = std::find_if(
			_entries.begin(), _entries.end(),
			[identity](const Entry& e) { return XlEqString(MakeStringSection(e._identity), identity); });
		if (existing != _entries.end()) {
			if (!fingerprint.IsEmpty() && !existing->_fingerprint.empty() && !XlEqString(MakeStringSection(existing->_fingerprint), fingerprint))
				return ProvideResult::Conflict;
			return ProvideResult::AlreadyPresent;
		}

		SourceBuilder builder;
		writer(builder);
		_entries.push_back(Entry{identity.AsString(), builder.GetText(), fingerprint.AsString()});
		return ProvideResult::Inserted;
	}

	auto FunctionRegistry::FindEntry(StringSection<> identity) const -> std::optional<Entry>
	{
		ScopedLock(_lock);
		auto i = std::find_if(
			_entries.begin(), _entries.end(),
			[identity](const Entry& e) { return XlEqString(MakeStringSection(e._identity), identity); });
		if (i != _entries.end())
			return *i;
		return {};
	}

	std::string FunctionRegistry::BuildSource() const
	{
		ScopedLock(_lock);
		std::string result;
		for (const auto& e:_entries)
			result += e._content;
		return result;
	}

	FunctionRegistry::FunctionRegistry() {}
	FunctionRegistry::~FunctionRegistry() {}
}
