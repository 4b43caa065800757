// Copyright 2015 XLGAMES Inc.
//
// Distributed under the MIT License (See
// accompanying file "LICENSE" or the website
// http://www.opensource.org/licenses/mit-license.php)

#pragma once

#include "../StringUtils.h"

namespace Utility
{
	/// <summary>Split a file name into path, file and extension parts</summary>
	/// No allocations are made; each part points back into the original string,
	/// so the source must outlive the splitter.
	template<typename CharType=utf8>
        class FileNameSplitter
	{
	public:
        using Section = StringSection<CharType>;

		Section		Path() const					{ return _path; }
		Section		File() const					{ return _file; }
		Section		Extension() const				{ return !_extension.IsEmpty() ? Section(_extension._start+1, _extension._end) : Section(); }
		Section		ExtensionWithPeriod() const		{ return _extension; }
		Section	    FileAndExtension() const        { return Section(_file._start, _extension._end); }
        Section     FullFilename() const            { return _fullFilename; }

        FileNameSplitter(Section rawString);
	private:
		Section     _path;
		Section     _file;
		Section     _extension;
        Section     _fullFilename;
	};

    template<typename CharType, typename T, typename A> FileNameSplitter<CharType> MakeFileNameSplitter(const std::basic_string<CharType, T, A>& rawString)   { return FileNameSplitter<CharType>(MakeStringSection(rawString)); }
    template<typename CharType> FileNameSplitter<CharType> MakeFileNameSplitter(StringSection<CharType> rawString)              { return FileNameSplitter<CharType>(rawString); }
}

using namespace Utility;
