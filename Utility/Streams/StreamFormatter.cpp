// Copyright 2015 XLGAMES Inc.
//
// Distributed under the MIT License (See
// accompanying file "LICENSE" or the website
// http://www.opensource.org/licenses/mit-license.php)

#include "StreamFormatter.h"
#include "../../Core/Exceptions.h"
#include <assert.h>
#include <algorithm>

namespace Utility
{
    static const unsigned TabWidth = 4;
    
    template<typename CharType>
        struct FormatterConstants 
    {
        static const CharType ProtectedNamePrefix[3];
        static const CharType ProtectedNamePostfix[3];
        static const CharType CommentPrefix[2];
        static const CharType HeaderPrefix[3];
    };
    
    template<> const utf8 FormatterConstants<utf8>::ProtectedNamePrefix[3] = { (utf8)'<', (utf8)':', (utf8)'(' };
    template<> const utf8 FormatterConstants<utf8>::ProtectedNamePostfix[3] = { (utf8)')', (utf8)':', (utf8)'>' };
    template<> const utf8 FormatterConstants<utf8>::CommentPrefix[2] = { (utf8)'~', (utf8)'~' };
    template<> const utf8 FormatterConstants<utf8>::HeaderPrefix[3] = { (utf8)'~', (utf8)'~', (utf8)'!' };

    template<typename CharType> 
        static bool FormattingChar(CharType c)
    {
        return c=='~' || c==';' || c=='=' || c=='\r' || c=='\n' || c == 0x0;
    }

    template<typename CharType> 
        static bool WhitespaceChar(CharType c)  // (excluding new line)
    {
        return c==' ' || c=='\t' || c==0x0B || c==0x0C;
    }

    FormatException::FormatException(const char label[], StreamLocation location)
        : ::Exceptions::BasicLabel("Format Exception: (%s) at line (%i), char (%i)", label, location._lineIndex, location._charIndex) {}

    template<typename CharType, int Count>
        static bool TryEat(TextStreamMarker<CharType>& marker, const CharType (&pattern)[Count])
    {
        if (marker.Remaining() < Count)
            return false;

        for (unsigned c=0; c<Count; ++c)
            if (marker[c] != pattern[c])
                return false;
        
        marker += Count;
        return true;
    }

    template<typename CharType>
        static const CharType* ReadToStringEnd(
            TextStreamMarker<CharType>& marker, bool protectedStringMode, bool allowEquals,
            StreamLocation location)
    {
        const auto& pattern = FormatterConstants<CharType>::ProtectedNamePostfix;
        const auto patternLength = dimof(FormatterConstants<CharType>::ProtectedNamePostfix);

        if (protectedStringMode) {
            if (marker.Remaining() >= (ptrdiff_t)patternLength) {
                const auto* end = marker.End() - patternLength;
                for (const auto* ptr = marker.Pointer(); ptr <= end; ++ptr) {
                    if (std::equal(pattern, pattern + patternLength, ptr)) {
                        marker.SetPointer(ptr + patternLength);
                        return ptr;
                    }
                }
            }

            Throw(FormatException("String deliminator not found", location));
        } else {
                // we must read forward until we hit a formatting character
                // the end of the string will be the last non-whitespace before that formatting character
            const auto* end = marker.End();
            const auto* ptr = marker.Pointer();
            const auto* stringEnd = ptr;
            for (;;) {
                    // here, hitting EOF is the same as hitting a formatting char
                if (ptr == end || (FormattingChar(*ptr) && (!allowEquals || *ptr != '='))) {
                    marker.SetPointer(ptr);
                    return stringEnd;
                } else if (!WhitespaceChar(*ptr)) {
                    stringEnd = ptr+1;
                }
                ++ptr;
            }
        }
    }

    template<typename CharType>
        static void EatWhitespace(TextStreamMarker<CharType>& marker)
    {
            // eat all whitespace (excluding new line)
        const auto* end = marker.End();
        const auto* ptr = marker.Pointer();
        while (ptr < end && WhitespaceChar(*ptr)) ++ptr;
        marker.SetPointer(ptr);
    }

    template<typename CharType>
        static unsigned ParseUnsigned(StringSection<CharType> str, StreamLocation location)
    {
        if (str.IsEmpty())
            Throw(FormatException("Expecting unsigned integer value", location));
        unsigned result = 0;
        for (auto c:str) {
            if (c < '0' || c > '9')
                Throw(FormatException("Expecting unsigned integer value", location));
            result = result * 10 + unsigned(c - '0');
        }
        return result;
    }

    template<typename CharType>
        auto InputStreamFormatter<CharType>::PeekNext() -> Blob
    {
        if (_primed != FormatterBlob::None) return _primed;

        using Consts = FormatterConstants<CharType>;
        
        if (_pendingHeader) {
                // attempt to read file header
            if (TryEat(_marker, Consts::HeaderPrefix))
                ReadHeader();

            _pendingHeader = false;
        }

        while (_marker.Remaining()) {
            const auto* next = _marker.Pointer();

            switch (unsigned(*next))
            {
            case '\t':
                ++_marker;
                _activeLineSpaces = ((_activeLineSpaces / (signed)_tabWidth) + 1) * (signed)_tabWidth;
                break;
            case ' ': 
                ++_marker;
                ++_activeLineSpaces; 
                break;

            case 0: 
                Throw(FormatException("Unexpected null character", GetLocation()));

            case 0x0B:  // (line tabulation)
            case 0x0C:  // (form feed)
                Throw(FormatException("Unsupported white space character", GetLocation()));

            case '\r':  // (could be an independant new line, or /r/n combo)
            case '\n':  // (independant new line. A following /r will be treated as another new line)
                _marker.AdvanceCheckNewLine();
                _activeLineSpaces = 0;
                break;

            case ';':
                    // deliminator is ignored here
                ++_marker;
                break;

            case '=':
                if (_activeLineSpaces <= _parentBaseLine) {
                    _protectedStringMode = false;
                    return _primed = FormatterBlob::EndElement;
                }

                ++_marker;
                EatWhitespace<CharType>(_marker);

                // Either the value half of a keyed item, or a sequence item with no key.
                // Both must follow the '=' on the same line, so new lines and comments
                // are not allowed here
                if (!_marker.Remaining())
                    Throw(FormatException("Unexpected end of file in the middle of mapping pair", GetLocation()));

                if (*_marker == '\r' || *_marker == '\n')
                    Throw(FormatException("The value for a key/pair mapping pair must follow immediate after the '='. New lines can not appear here", GetLocation()));

                if (_marker.Remaining() >= 2 && _marker[0] == '~' && _marker[1] == '~')
                    Throw(FormatException("The value for a key/pair mapping pair must follow immediate after the '='. Comments can not appear here", GetLocation()));

                if (*_marker == '~') {
                    _protectedStringMode = false;
                    ++_marker;
                    return _primed = FormatterBlob::BeginElement;
                } else {
                    _protectedStringMode = TryEat(_marker, Consts::ProtectedNamePrefix);
                    return _primed = FormatterBlob::Value;
                }

            case '~':
                if (TryEat(_marker, Consts::CommentPrefix)) {
                        // this is a comment... Read forward until the end of the line
                    const auto* end = _marker.End();
                    const auto* ptr = _marker.Pointer();
                    while (ptr < end && *ptr!='\r' && *ptr!='\n') ++ptr;
                    _marker.SetPointer(ptr);
                    break;
                }

                Throw(FormatException("Element markers must follow a '='", GetLocation()));

            default:
                // first, if our spacing has decreased, then we must consider it an "end element"
                // caller must follow with "TryEndElement" until _parentBaseLine matches _activeLineSpaces
                if (_activeLineSpaces <= _parentBaseLine) {
                    _protectedStringMode = false;
                    return _primed = FormatterBlob::EndElement;
                }

                _protectedStringMode = TryEat(_marker, Consts::ProtectedNamePrefix);
                return _primed = FormatterBlob::KeyedItem;
            }
        }

            // we've reached the end of the stream...
            // while there are elements on our stack, we need to end them
        if (_baseLineStackPtr > 0) return _primed = FormatterBlob::EndElement;
        return FormatterBlob::None;
    }

    template<typename CharType>
        void InputStreamFormatter<CharType>::ReadHeader()
    {
        const CharType* aNameStart = nullptr;
        const CharType* aNameEnd = nullptr;

        while (_marker.Remaining()) {
            switch (*_marker)
            {
            case '\t':
            case ' ': 
            case ';':
                ++_marker;
                break;

            case '~':
                Throw(FormatException("Unexpected element in header", GetLocation()));

            case '\r':
            case '\n':
                return;

            case '=':
                ++_marker;
                EatWhitespace<CharType>(_marker);
                
                {
                    const auto* aValueStart = _marker.Pointer();
                    const auto* aValueEnd = ReadToStringEnd<CharType>(_marker, false, true, GetLocation());
                    auto name = MakeStringSection(aNameStart, aNameEnd);
                    auto value = MakeStringSection(aValueStart, aValueEnd);

                    if (XlEqStringI(name, "Format")) {
                        if (ParseUnsigned(value, GetLocation()) != 2)
                            Throw(FormatException("Unsupported format in input stream formatter header", GetLocation()));
                    } else if (XlEqStringI(name, "Tab")) {
                        _tabWidth = ParseUnsigned(value, GetLocation());
                        if (_tabWidth==0)
                            Throw(FormatException("Bad tab width in input stream formatter header", GetLocation()));
                    }
                }
                break;

            default:
                aNameStart = _marker.Pointer();
                aNameEnd = ReadToStringEnd<CharType>(_marker, false, false, GetLocation());
                break;
            }
        }
    }

    template<typename CharType>
        bool InputStreamFormatter<CharType>::TryBeginElement()
    {
        if (PeekNext() != FormatterBlob::BeginElement) return false;

        // the new "parent base line" should be the indentation level of the line this element started on
        if ((_baseLineStackPtr+1) > dimof(_baseLineStack))
            Throw(FormatException(
                "Excessive indentation format in input stream formatter", GetLocation()));

        _baseLineStack[_baseLineStackPtr++] = _activeLineSpaces;
        _parentBaseLine = _activeLineSpaces;
        _primed = FormatterBlob::None;
        _protectedStringMode = false;
        return true;
    }

    template<typename CharType>
        bool InputStreamFormatter<CharType>::TryEndElement()
    {
        if (PeekNext() != FormatterBlob::EndElement) return false;

        if (_baseLineStackPtr != 0) {
            _parentBaseLine = (_baseLineStackPtr > 1) ? _baseLineStack[_baseLineStackPtr-2] : -1;
            --_baseLineStackPtr;
        }

        _primed = FormatterBlob::None;
        _protectedStringMode = false;
        return true;
    }

    template<typename CharType>
        bool InputStreamFormatter<CharType>::TryKeyedItem(StringSection<CharType>& name)
    {
        if (PeekNext() != FormatterBlob::KeyedItem) return false;

        name._start = _marker.Pointer();
        name._end = ReadToStringEnd<CharType>(_marker, _protectedStringMode, false, GetLocation());
        EatWhitespace<CharType>(_marker);

        _primed = FormatterBlob::None;
        _protectedStringMode = false;
        
        // After the name must come '=' on the same line, followed by either a value or
        // an element. We don't advance over the '='; PeekNext() handles it the same
        // way as a sequence item
        if (!_marker.Remaining())
            Throw(FormatException("Unexpected end of file while looking for a '=' to signify value for keyed item", GetLocation()));

        if (*_marker == '\r' || *_marker == '\n')
            Throw(FormatException("New lines can not appear before the '=' in a keyed item", GetLocation()));

        if (*_marker != '=')
            Throw(FormatException("Missing '=' to signify value for keyed item", GetLocation()));
        
        return true;
    }

    template<typename CharType>
        bool InputStreamFormatter<CharType>::TryValue(StringSection<CharType>& value)
    {
        if (PeekNext() != FormatterBlob::Value) return false;

        value._start = _marker.Pointer();
        value._end = ReadToStringEnd<CharType>(_marker, _protectedStringMode, false, GetLocation());
        EatWhitespace<CharType>(_marker);

        _primed = FormatterBlob::None;
        _protectedStringMode = false;

        return true;
    }

    template<typename CharType>
        StreamLocation InputStreamFormatter<CharType>::GetLocation() const
    {
        return _marker.GetLocation();
    }

    template<typename CharType>
        InputStreamFormatter<CharType>::InputStreamFormatter(const TextStreamMarker<CharType>& marker) 
        : _marker(marker)
    {
        _primed = FormatterBlob::None;
        _activeLineSpaces = 0;
        _parentBaseLine = -1;
        for (signed& s:_baseLineStack) s = 0;
        _baseLineStackPtr = 0;
        _protectedStringMode = false;
        _tabWidth = TabWidth;
        _pendingHeader = true;
    }

    template<typename CharType>
        InputStreamFormatter<CharType>::~InputStreamFormatter()
    {}

///////////////////////////////////////////////////////////////////////////////////////////////////

    template<typename CharType>
        StreamLocation TextStreamMarker<CharType>::GetLocation() const
    {
        StreamLocation result;
        result._charIndex = 1 + unsigned(_ptr - _lineStart);
        result._lineIndex = 1 + _lineIndex;
        return result;
    }

    template<typename CharType>
        void TextStreamMarker<CharType>::AdvanceCheckNewLine()
    {
        assert(Remaining() >= 1);

            // as per xml spec, 0xd0xa, 0xa or 0xd are all considered single new lines
        if (*_ptr == 0xd || *_ptr == 0xa) {
            if (Remaining()>=2 && *_ptr == 0xd && *(_ptr+1)==0xa) ++_ptr;
            _lineStart = _ptr+1;
            ++_lineIndex;
        }
                    
        ++_ptr;
    }

    template<typename CharType>
        TextStreamMarker<CharType>::TextStreamMarker(StringSection<CharType> source)
    : _ptr(source.begin())
    , _end(source.end())
    {
        _lineIndex = 0;
        _lineStart = _ptr;
    }

    template<typename CharType>
        TextStreamMarker<CharType>::TextStreamMarker()
    : _ptr(nullptr)
    , _end(nullptr)
    {
        _lineIndex = 0;
        _lineStart = nullptr;
    }

///////////////////////////////////////////////////////////////////////////////////////////////////

    template class InputStreamFormatter<utf8>;
    template class TextStreamMarker<utf8>;
}
