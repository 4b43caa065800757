// Copyright 2015 XLGAMES Inc.
//
// Distributed under the MIT License (See
// accompanying file "LICENSE" or the website
// http://www.opensource.org/licenses/mit-license.php)

#pragma once

#include "../Core/Types.h"
#include "PtrUtils.h"	// for AsPointer
#include <string>
#include <cstring>
#include <algorithm>
#include <assert.h>
#include <cstddef>

namespace Utility
{
    size_t  XlStringSize        (const utf8* str);
    int     XlCompareString     (const utf8* x, const utf8* y);
    int     XlCompareStringI    (const utf8* x, const utf8* y);

    template <typename CharType>
        const CharType* XlStringEnd(const CharType nullTermStr[])
            { return &nullTermStr[XlStringSize(nullTermStr)]; }

        ////////////   S T R I N G   S E C T I O N   ////////////

    /// <summary>Pointers to the start and end of a string</summary>
    /// This object points into the interior of another object, identifying
    /// the start and end of a string.
    ///
    /// This is a 3rd common string representation:
    ///     * c-style char pointer
    ///     * stl-style std::string
    ///     * begin/end string "section"
    ///
    /// This useful for separating a part of a large string, or while serializing
    /// from an text file (when we want to identify an interior string without
    /// requiring an extra allocation).
    template<typename CharType=char>
        class StringSection
    {
    public:
        const CharType* _start;
        const CharType* _end;

        size_t Length() const                           { return size_t(_end - _start); }
        bool IsEmpty() const                            { return _end <= _start; }
        std::basic_string<CharType> AsString() const    { return std::basic_string<CharType>(_start, _end); }

        const CharType* begin() const   { return _start; }
        const CharType* end() const     { return _end; }
		size_t size() const				{ return Length(); }

        const CharType& operator[](size_t index) const { assert(index < Length()); return _start[index]; }

        StringSection(const CharType* start, const CharType* end) : _start(start), _end(end) {}
        StringSection() : _start(nullptr), _end(nullptr) {}
        StringSection(const CharType* nullTerm) : _start(nullTerm), _end(XlStringEnd(_start)) {}
        StringSection(std::nullptr_t) = delete;      // prevent construction from nullptr constant (tends to be a common error)
        
		template<typename CT, typename A>
			StringSection(const std::basic_string<CharType, CT, A>& str) : _start(str.data()), _end(str.data() + str.size()) {}
    };

    template<typename Iterator>
        inline auto MakeStringSection(Iterator start, Iterator end)
            -> StringSection<typename std::decay<decltype(*AsPointer(std::declval<Iterator>()))>::type>
        {
            using CharType = typename std::decay<decltype(*AsPointer(std::declval<Iterator>()))>::type;
            return StringSection<CharType>(AsPointer(start), AsPointer(start) + (end - start));
        }

    template<typename CharType>
        inline StringSection<CharType> MakeStringSection(const CharType* nullTerm)
        {
            return StringSection<CharType>(nullTerm);
        }

    template<typename CharType, typename CT, typename A>
        inline StringSection<CharType> MakeStringSection(const std::basic_string<CharType, CT, A>& str)
        {
            return StringSection<CharType>(str.data(), str.data() + str.size());
        }

        ////////////   C O M P A R I S O N S   ////////////

    bool XlEqString     (StringSection<utf8> a, StringSection<utf8> b);
    bool XlEqStringI    (StringSection<utf8> a, StringSection<utf8> b);
    bool XlBeginsWith   (StringSection<utf8> a, StringSection<utf8> prefix);
    bool XlEndsWithI    (StringSection<utf8> a, StringSection<utf8> postfix);

    inline bool XlEqString(const std::string& a, const utf8* b)    { return XlEqString(MakeStringSection(a), MakeStringSection(b)); }
    inline bool XlEqStringI(const std::string& a, const utf8* b)   { return XlEqStringI(MakeStringSection(a), MakeStringSection(b)); }

        ////////////   T E X T   ////////////

    /// <summary>Strip leading and trailing whitespace (including new lines)</summary>
    StringSection<utf8> StripWhitespace(StringSection<utf8> input);

    /// <summary>Calls "fn" for each line in "input"</summary>
    /// Lines may be terminated with "\n", "\r\n" or "\r". The terminator is not passed
    /// to the callback. A trailing terminator does not produce an extra empty line.
    template<typename Fn>
        void ForEachLine(StringSection<utf8> input, Fn&& fn)
        {
            auto* i = input.begin();
            while (i != input.end()) {
                auto* lineEnd = std::find_if(i, input.end(), [](utf8 c) { return c == '\r' || c == '\n'; });
                fn(StringSection<utf8>(i, lineEnd));
                i = lineEnd;
                if (i != input.end()) {
                    if (*i == '\r' && (i+1) != input.end() && *(i+1) == '\n') ++i;
                    ++i;
                }
            }
        }
}

using namespace Utility;
