// Copyright 2015 XLGAMES Inc.
//
// Distributed under the MIT License (See
// accompanying file "LICENSE" or the website
// http://www.opensource.org/licenses/mit-license.php)

#pragma once

#include "Prefix.h"
#include <exception>
#include <cstdarg>

#if FEATURE_EXCEPTIONS
    #include <type_traits>  // for std::is_base_of, used by exceptions
#else
	#include <stdlib.h>     // (for exit)
#endif

/*!
    \page ExceptionsPage Exceptions

    Code generation faults are reported with exceptions derived from ::Exceptions::BasicLabel
    and raised with Throw(). Authoring problems in a graph are never reported this way; they
    become diagnostics on the node (see NodeCodegen::Diagnostic).

    When exceptions are disabled in the compiler, Throw() results in a call to exit(), and catch
    code is compiled out. Code that must work in both configurations uses this pattern:

    \code{.cpp}

    TRY {
        emitter.Provide(registry, spec, slots, diagnostics);
    } CATCH (const NodeCodegen::Exceptions::UnsupportedSourceMode& e) {
        Log(Error) << "Bad function spec: " << e.what() << std::endl;
        RETHROW;
    } CATCH_END

    \endcode
*/

#if FEATURE_EXCEPTIONS

    #define TRY { try 
    #define CATCH(x) catch(x) 
    #define RETHROW throw 
    #define CATCH_END } 

#else 

    #define TRY { if (true) 
    #define CATCH(x) else if (false) 
    #define RETHROW 
    #define CATCH_END } 

#endif 

namespace Exceptions
{
	class CustomReportableException : public std::exception
	{
	public:
		virtual bool CustomReport() const { return false; }
	};

    /// <summary>Exception with a printf-formatted message held in a fixed buffer</summary>
    /// Construction never allocates, so it can be used to report out-of-memory and similar
    /// conditions.
    class BasicLabel : public CustomReportableException
    {
    public:
        virtual const char* what() const never_throws override { return _buffer; }
        
        BasicLabel(const char format[], ...) never_throws;
        BasicLabel(const char format[], va_list args) never_throws;
        BasicLabel(const BasicLabel& copyFrom) never_throws;
        BasicLabel& operator=(const BasicLabel& copyFrom) never_throws;
        virtual ~BasicLabel();
    protected:
        BasicLabel() never_throws;
        char _buffer[512];
    };
}

#if COMPILER_ACTIVE == COMPILER_TYPE_MSVC
    #define NO_RETURN_PREFIX __declspec(noreturn)
    #define NO_RETURN_POSTFIX
#else
    #define NO_RETURN_PREFIX
    #define NO_RETURN_POSTFIX __attribute((noreturn))
#endif

namespace Utility
{
    #if FEATURE_EXCEPTIONS
        typedef void (*OnThrowCallback)(const ::Exceptions::CustomReportableException&);
        inline OnThrowCallback& GlobalOnThrowCallback()
        {
            static OnThrowCallback s_result = nullptr;
            return s_result;
        }

        template <class E, typename std::enable_if<std::is_base_of<::Exceptions::CustomReportableException, E>::value>::type* = nullptr>
            inline NO_RETURN_PREFIX void Throw(const E& e) NO_RETURN_POSTFIX;

        template <class E, typename std::enable_if<std::is_base_of<::Exceptions::CustomReportableException, E>::value>::type*>
            inline NO_RETURN_PREFIX void Throw(const E& e)
        {
            auto* callback = GlobalOnThrowCallback();
            if (callback) (*callback)(e);
            throw e;
        }

        template <class E, typename std::enable_if<!std::is_base_of<::Exceptions::CustomReportableException, E>::value>::type* = nullptr>
            NO_RETURN_PREFIX void Throw(const E& e) NO_RETURN_POSTFIX;

        template <class E, typename std::enable_if<!std::is_base_of<::Exceptions::CustomReportableException, E>::value>::type*>
            inline NO_RETURN_PREFIX void Throw(const E& e)
        {
            throw e;
        }
    #else
        template <class E> inline void Throw(const E& e)
        {
            exit(-1);
        }
    #endif
}

using namespace Utility;
