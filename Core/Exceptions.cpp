// Copyright 2015 XLGAMES Inc.
//
// Distributed under the MIT License (See
// accompanying file "LICENSE" or the website
// http://www.opensource.org/licenses/mit-license.php)

#include "Exceptions.h"
#include <cstdio>
#include <cstring>

namespace Exceptions
{
    BasicLabel::BasicLabel() never_throws { _buffer[0] = '\0'; }

#pragma clang diagnostic push
#pragma clang diagnostic ignored "-Wformat-nonliteral"
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wformat-nonliteral"
    BasicLabel::BasicLabel(const char format[], ...) never_throws
    {
        va_list args;
        va_start(args, format);
        std::vsnprintf(_buffer, dimof(_buffer), format, args);
        va_end(args);
    }

    BasicLabel::BasicLabel(const char format[], va_list args) never_throws
    {
        std::vsnprintf(_buffer, dimof(_buffer), format, args);
    }
#pragma GCC diagnostic pop
#pragma clang diagnostic pop

    BasicLabel::BasicLabel(const BasicLabel& copyFrom) never_throws
    {
        std::memcpy(_buffer, copyFrom._buffer, sizeof(_buffer));
    }

    BasicLabel& BasicLabel::operator=(const BasicLabel& copyFrom) never_throws
    {
		std::memcpy(_buffer, copyFrom._buffer, sizeof(_buffer));
        return *this;
    }

    BasicLabel::~BasicLabel() {}
}
