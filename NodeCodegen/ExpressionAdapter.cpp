// Copyright 2015 XLGAMES Inc.
//
// Distributed under the MIT License (See
// accompanying file "LICENSE" or the website
// http://www.opensource.org/licenses/mit-license.php)

#include "ExpressionAdapter.h"
#include "Identifiers.h"
#include <sstream>

namespace NodeCodegen
{
	using namespace GraphLanguage;

	static std::string WriteCastExpression(const std::string& expression, ValueType srcType, ValueType dstType, Precision precision)
	{
		std::stringstream result;
		result << "Cast_" << ToTypeString(srcType, precision) << "_to_" << ToTypeString(dstType, precision) << "(" << expression << ")";
		return result.str();
	}

	std::string AdaptExpression(
		const std::string& expression, 
		ValueType srcType, ValueType dstType,
		Precision precision)
	{
		if (srcType == dstType || expression.empty())
			return expression;

		static const char swizzleChars[] = "xyzw";

		if (IsVectorType(srcType) && IsVectorType(dstType)) {
			auto srcCount = GetComponentCount(srcType), dstCount = GetComponentCount(dstType);
			std::stringstream result;
			if (srcCount > dstCount) {
				result << expression << "." << std::string(swizzleChars, swizzleChars+dstCount);
			} else if (srcCount == 1) {
				result << expression << "." << std::string(dstCount, 'x');
			} else {
				result << ToTypeString(dstType, precision) << "(" << expression;
				for (unsigned c=srcCount; c<dstCount; ++c) result << ", 0";
				result << ")";
			}
			return result.str();
		}

		if (IsMatrixType(srcType) && IsMatrixType(dstType) && GetMatrixDimension(srcType) > GetMatrixDimension(dstType))
			return "(" + ToTypeString(dstType, precision) + ")" + expression;

		return WriteCastExpression(expression, srcType, dstType, precision);
	}

	std::string BasicExpressionAdapter::Adapt(
		const Node& producerNode, SlotId producerSlotId,
		ValueType targetType, Precision precision)
	{
		auto* slot = producerNode.FindOutputSlot(producerSlotId);
		if (!slot) return std::string();
		return AdaptExpression(VariableNameForSlot(producerNode, producerSlotId), slot->_valueType, targetType, precision);
	}

	BasicExpressionAdapter::BasicExpressionAdapter() {}
	BasicExpressionAdapter::~BasicExpressionAdapter() {}
	IExpressionAdapter::~IExpressionAdapter() {}
}
