// Distributed under the MIT License (See
// accompanying file "LICENSE" or the website
// http://www.opensource.org/licenses/mit-license.php)

#pragma once

#include "SlotGraph.h"
#include <string>

namespace NodeCodegen
{
	/// <summary>Produces the expression that feeds a producer's output into an input of another type</summary>
	class IExpressionAdapter
	{
	public:
		/// Returns an empty string when the producer slot can't be found
		virtual std::string Adapt(
			const GraphLanguage::Node& producerNode, GraphLanguage::SlotId producerSlotId,
			GraphLanguage::ValueType targetType, GraphLanguage::Precision precision) = 0;
		virtual ~IExpressionAdapter();
	};

	/// <summary>Standard conversions between vector and matrix types</summary>
	/// <list>
	///		<item>Larger vectors are truncated with a swizzle ("v.xy")</item>
	///		<item>Scalars are splatted ("s.xxx")</item>
	///		<item>Smaller vectors are extended with zeroes ("float4(v, 0, 0)")</item>
	///		<item>Larger matrices are truncated with a cast ("(float3x3)m")</item>
	/// </list>
	/// Anything else is wrapped in a call to "Cast_<src>_to_<dst>()", which the including
	/// shader code must provide.
	class BasicExpressionAdapter : public IExpressionAdapter
	{
	public:
		std::string Adapt(
			const GraphLanguage::Node& producerNode, GraphLanguage::SlotId producerSlotId,
			GraphLanguage::ValueType targetType, GraphLanguage::Precision precision);

		BasicExpressionAdapter();
		~BasicExpressionAdapter();
	};

	std::string AdaptExpression(
		const std::string& expression, 
		GraphLanguage::ValueType srcType, GraphLanguage::ValueType dstType,
		GraphLanguage::Precision precision);
}
