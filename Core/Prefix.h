// Copyright 2015 XLGAMES Inc.
//
// Distributed under the MIT License (See
// accompanying file "LICENSE" or the website
// http://www.opensource.org/licenses/mit-license.php)

#pragma once

#include "SelectConfiguration.h"

#define never_throws    noexcept

#if !defined(dimof)
    #define dimof(x) (sizeof(x)/sizeof(*x))
#endif
