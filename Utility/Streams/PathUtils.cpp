// Copyright 2015 XLGAMES Inc.
//
// Distributed under the MIT License (See
// accompanying file "LICENSE" or the website
// http://www.opensource.org/licenses/mit-license.php)

#include "PathUtils.h"
#include "../IteratorUtils.h"
#include <algorithm>

namespace Utility
{
    template<typename CharType>
        FileNameSplitter<CharType>::FileNameSplitter(Section rawString)
	{
        _fullFilename = rawString;

        // Both separator styles are accepted, because references can come from
        // serialized files written on any platform
        auto lastSlash = std::find_if(
            std::make_reverse_iterator(rawString._end), std::make_reverse_iterator(rawString._start),
            [](CharType c) { return c == (CharType)'\\' || c == (CharType)'/'; });
        const CharType* fileStart = lastSlash.base();
        _path = Section(rawString._start, fileStart);

        // A leading period belongs to the file name (eg, ".hlsl" has no extension)
        auto endOfFile = FindLastOf(fileStart, rawString._end, (CharType)'.');
        if (endOfFile == fileStart)
            endOfFile = rawString._end;
		_file = Section(fileStart, endOfFile);
        _extension = Section(endOfFile, rawString._end);
	}

    template class FileNameSplitter<utf8>;
}
