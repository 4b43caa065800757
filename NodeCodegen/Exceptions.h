// Distributed under the MIT License (See
// accompanying file "LICENSE" or the website
// http://www.opensource.org/licenses/mit-license.php)

#pragma once

#include "../Core/Exceptions.h"

namespace NodeCodegen
{
    namespace Exceptions
    {
		/// <summary>A function spec has no usable source</summary>
		/// Only happens when a FunctionSpec has been left without an active source (for example,
		/// after an exception during assignment). Never caused by normal authoring.
        class UnsupportedSourceMode : public ::Exceptions::BasicLabel
        {
        public:
            UnsupportedSourceMode(const char functionName[]) never_throws
			: ::Exceptions::BasicLabel("Unsupported source mode while providing function (%s)", functionName) {}
        };
    }
}
