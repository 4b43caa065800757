// Copyright 2015 XLGAMES Inc.
//
// Distributed under the MIT License (See
// accompanying file "LICENSE" or the website
// http://www.opensource.org/licenses/mit-license.php)

#include "StringUtils.h"
#include <cctype>

namespace Utility
{
    static inline utf8 XlToLower(utf8 c)
    {
        return (c >= 'A' && c <= 'Z') ? utf8(c - 'A' + 'a') : c;
    }

    static inline bool XlIsWhitespace(utf8 c)
    {
        return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == 0x0B || c == 0x0C;
    }

    size_t XlStringSize(const utf8* str)
    {
        return std::strlen(str);
    }

    int XlCompareString(const utf8* x, const utf8* y)
    {
        return std::strcmp(x, y);
    }

    int XlCompareStringI(const utf8* x, const utf8* y)
    {
        for (;; ++x, ++y) {
            auto a = XlToLower(*x), b = XlToLower(*y);
            if (a != b) return (a < b) ? -1 : 1;
            if (!a) return 0;
        }
    }

    bool XlEqString(StringSection<utf8> a, StringSection<utf8> b)
    {
        if (a.Length() != b.Length()) return false;
        return std::equal(a.begin(), a.end(), b.begin());
    }

    bool XlEqStringI(StringSection<utf8> a, StringSection<utf8> b)
    {
        if (a.Length() != b.Length()) return false;
        return std::equal(
            a.begin(), a.end(), b.begin(),
            [](utf8 lhs, utf8 rhs) { return XlToLower(lhs) == XlToLower(rhs); });
    }

    bool XlBeginsWith(StringSection<utf8> a, StringSection<utf8> prefix)
    {
        return a.Length() >= prefix.Length()
            && XlEqString(StringSection<utf8>(a.begin(), a.begin() + prefix.Length()), prefix);
    }

    bool XlEndsWithI(StringSection<utf8> a, StringSection<utf8> postfix)
    {
        return a.Length() >= postfix.Length()
            && XlEqStringI(StringSection<utf8>(a.end() - postfix.Length(), a.end()), postfix);
    }

    StringSection<utf8> StripWhitespace(StringSection<utf8> input)
    {
        auto* start = input.begin();
        auto* end = input.end();
        while (start < end && XlIsWhitespace(*start)) ++start;
        while (end > start && XlIsWhitespace(*(end-1))) --end;
        return StringSection<utf8>(start, end);
    }
}
