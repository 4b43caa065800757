// Distributed under the MIT License (See
// accompanying file "LICENSE" or the website
// http://www.opensource.org/licenses/mit-license.php)

#include "AssetPathResolver.h"
#include <algorithm>

namespace NodeCodegen
{
	IAssetPathResolver::~IAssetPathResolver() {}

	std::string BasicAssetPathResolver::Resolve(StringSection<> reference)
	{
		auto i = std::find_if(
			_table.begin(), _table.end(),
			[reference](const std::pair<std::string, std::string>& p) { return XlEqString(MakeStringSection(p.first), reference); });
		if (i != _table.end())
			return i->second;
		return std::string();
	}

	void BasicAssetPathResolver::Add(StringSection<> reference, StringSection<> path)
	{
		auto i = std::find_if(
			_table.begin(), _table.end(),
			[reference](const std::pair<std::string, std::string>& p) { return XlEqString(MakeStringSection(p.first), reference); });
		if (i != _table.end()) {
			i->second = path.AsString();
		} else
			_table.emplace_back(reference.AsString(), path.AsString());
	}

	BasicAssetPathResolver::BasicAssetPathResolver() {}
	BasicAssetPathResolver::~BasicAssetPathResolver() {}
}
