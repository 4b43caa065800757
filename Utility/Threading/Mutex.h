// Copyright 2015 XLGAMES Inc.
//
// Distributed under the MIT License (See
// accompanying file "LICENSE" or the website
// http://www.opensource.org/licenses/mit-license.php)

#pragma once

#include "../../Core/Prefix.h"
#include <mutex>

namespace Utility { namespace Threading
{
    using Mutex = std::mutex;
}}
using namespace Utility;

#if defined(ScopedLock)
    #undef ScopedLock
#endif

#define ScopedLock(x)            std::unique_lock<decltype(x)> _autoLockA(x)
