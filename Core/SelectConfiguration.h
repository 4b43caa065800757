// Copyright 2015 XLGAMES Inc.
//
// Distributed under the MIT License (See
// accompanying file "LICENSE" or the website
// http://www.opensource.org/licenses/mit-license.php)

#pragma once

#include <ciso646>      // (for standard library detection)

////////////////////////////////////////////////////////////////////////////////////////////////

#define COMPILER_TYPE_MSVC       1
#define COMPILER_TYPE_GCC        2
#define COMPILER_TYPE_CLANG      3

#if defined(__clang__)
    #define COMPILER_ACTIVE     COMPILER_TYPE_CLANG
#elif defined(__GNUC__)
    #define COMPILER_ACTIVE     COMPILER_TYPE_GCC
#elif defined(_MSC_VER)
    #define COMPILER_ACTIVE     COMPILER_TYPE_MSVC
#else
    #error "Cannot determine current compiler type. Platform unsupported!"
#endif

////////////////////////////////////////////////////////////////////////////////////////////////

#if (COMPILER_ACTIVE == COMPILER_TYPE_GCC) || (COMPILER_ACTIVE == COMPILER_TYPE_CLANG)

    #if defined(__EXCEPTIONS)
        #define FEATURE_EXCEPTIONS    __EXCEPTIONS
    #elif defined(_CPPUNWIND)   // (set when ms-compatibility mode is enabled in clang)
        #define FEATURE_EXCEPTIONS  1
    #else
        #define FEATURE_EXCEPTIONS    0
    #endif

#elif COMPILER_ACTIVE == COMPILER_TYPE_MSVC

    #if defined(_CPPUNWIND)
        #define FEATURE_EXCEPTIONS  1
    #else
        #define FEATURE_EXCEPTIONS  0
    #endif

#else

    #define FEATURE_EXCEPTIONS  1

#endif
