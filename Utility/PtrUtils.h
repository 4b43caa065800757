// Copyright 2015 XLGAMES Inc.
//
// Distributed under the MIT License (See
// accompanying file "LICENSE" or the website
// http://www.opensource.org/licenses/mit-license.php)

#pragma once

#include "../Core/Prefix.h"
#include <cstddef>
#include <utility>

namespace Utility
{
    template <typename Type>
        Type * AsPointer( Type * i )                     { return i; }

        // vector & string iterators decay to pointers to their element
    template <typename Iterator>
        decltype(&(*std::declval<Iterator>())) AsPointer(Iterator i) { return &(*i); }
}

using namespace Utility;
