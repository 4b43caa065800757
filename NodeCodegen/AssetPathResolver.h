// Distributed under the MIT License (See
// accompanying file "LICENSE" or the website
// http://www.opensource.org/licenses/mit-license.php)

#pragma once

#include "../Utility/StringUtils.h"
#include <string>
#include <vector>

namespace NodeCodegen
{
	/// <summary>Converts opaque file references on nodes into include paths</summary>
	class IAssetPathResolver
	{
	public:
		/// Returns an empty string when the reference is unknown
		virtual std::string Resolve(StringSection<> reference) = 0;
		virtual ~IAssetPathResolver();
	};

	class BasicAssetPathResolver : public IAssetPathResolver
	{
	public:
		std::string Resolve(StringSection<> reference);

		void Add(StringSection<> reference, StringSection<> path);

		BasicAssetPathResolver();
		~BasicAssetPathResolver();
	protected:
		std::vector<std::pair<std::string, std::string>> _table;
	};
}
