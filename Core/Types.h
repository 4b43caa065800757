// Copyright 2015 XLGAMES Inc.
//
// Distributed under the MIT License (See
// accompanying file "LICENSE" or the website
// http://www.opensource.org/licenses/mit-license.php)

#pragma once

#include "Prefix.h"
#include <cstdint>

    // All text handled by the code generator is utf8
typedef char                 utf8;
