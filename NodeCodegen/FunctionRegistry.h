// Distributed under the MIT License (See
// accompanying file "LICENSE" or the website
// http://www.opensource.org/licenses/mit-license.php)

#pragma once

#include "../Utility/StringUtils.h"
#include "../Utility/IteratorUtils.h"
#include "../Utility/Threading/Mutex.h"
#include <string>
#include <vector>
#include <functional>
#include <optional>

namespace NodeCodegen
{
	/// <summary>Accumulates lines of generated source, tracking indentation</summary>
	class SourceBuilder
	{
	public:
		void AppendLine(StringSection<> line);
		void AppendLines(StringSection<> lines);

		class BlockScope
		{
		public:
			BlockScope(SourceBuilder& builder);
			~BlockScope();
			BlockScope(const BlockScope&) = delete;
			BlockScope& operator=(const BlockScope&) = delete;
		private:
			SourceBuilder* _builder;
		};

		/// <summary>Opens a "{" block that is closed when the returned object is destroyed</summary>
		/// Lines appended while the scope is alive are indented one level further.
		BlockScope Block() { return BlockScope(*this); }

		const std::string& GetText() const { return _text; }

		SourceBuilder();
		~SourceBuilder();
	private:
		std::string _text;
		unsigned _indentLevel;
	};

	/// <summary>Function definitions required by generated code, at most one per identity</summary>
	/// Many call sites can require the same function; only the first request writes the
	/// content. Entries are kept in the order they were first provided.
	class FunctionRegistry
	{
	public:
		using ContentWriter = std::function<void(SourceBuilder&)>;

		enum class ProvideResult
		{
			Inserted,			///< content writer was called and a new entry added
			AlreadyPresent,		///< an identical (or unfingerprinted) entry already exists
			Conflict			///< an entry exists, but it was provided with a different fingerprint
		};

		/// <summary>Add the function with the given identity, if it's not already present</summary>
		/// "writer" is only called when the identity is new. "fingerprint" identifies the exact
		/// content a provider would write; when two providers with non-empty fingerprints disagree,
		/// the existing entry is kept and Conflict is returned.
		ProvideResult ProvideFunction(StringSection<> identity, const ContentWriter& writer, StringSection<> fingerprint = {});

		struct Entry
		{
			std::string _identity;
			std::string _content;
			std::string _fingerprint;
		};

		/// <summary>Every entry, in provision order</summary>
		/// The range points into the registry's storage; only use it once all providers have finished.
		IteratorRange<const Entry*> GetEntries() const { return MakeIteratorRange(_entries); }

		/// <summary>Copy of the entry with the given identity, taken under the lock</summary>
		std::optional<Entry> FindEntry(StringSection<> identity) const;

		/// <summary>Content of every entry, in provision order</summary>
		std::string BuildSource() const;

		FunctionRegistry();
		~FunctionRegistry();
		FunctionRegistry(const FunctionRegistry&) = delete;
		FunctionRegistry& operator=(const FunctionRegistry&) = delete;
	private:
		std::vector<Entry> _entries;
		mutable Threading::Mutex _lock;
	};
}
