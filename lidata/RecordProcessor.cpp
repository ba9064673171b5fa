/***********************************************************************************************************************
*                                                                                                                      *
* liblidata v0.1                                                                                                       *
*                                                                                                                      *
* Copyright (c) 2012-2022 Andrew D. Zonenberg and contributors                                                         *
* All rights reserved.                                                                                                 *
*                                                                                                                      *
* Redistribution and use in source and binary forms, with or without modification, are permitted provided that the     *
* following conditions are met:                                                                                        *
*                                                                                                                      *
*    * Redistributions of source code must retain the above copyright notice, this list of conditions, and the         *
*      following disclaimer.                                                                                           *
*                                                                                                                      *
*    * Redistributions in binary form must reproduce the above copyright notice, this list of conditions and the       *
*      following disclaimer in the documentation and/or other materials provided with the distribution.                *
*                                                                                                                      *
*    * Neither the name of the author nor the names of any contributors may be used to endorse or promote products     *
*      derived from this software without specific prior written permission.                                           *
*                                                                                                                      *
* THIS SOFTWARE IS PROVIDED BY THE AUTHORS "AS IS" AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED   *
* TO, THE IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE ARE DISCLAIMED. IN NO EVENT SHALL *
* THE AUTHORS BE HELD LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR CONSEQUENTIAL DAMAGES        *
* (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF SUBSTITUTE GOODS OR SERVICES; LOSS OF USE, DATA, OR PROFITS; OR       *
* BUSINESS INTERRUPTION) HOWEVER CAUSED AND ON ANY THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY, OR TORT *
* (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE OF THIS SOFTWARE, EVEN IF ADVISED OF THE       *
* POSSIBILITY OF SUCH DAMAGE.                                                                                          *
*                                                                                                                      *
***********************************************************************************************************************/

/**
	@file
	@author Andrew D. Zonenberg
	@brief Implementation of RecordProcessor
 */

#include "lidata.h"

using namespace std;

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Record level

/**
	@brief Processes a batch of raw records

	@param raw		Records from the BitstreamDecoder
	@param expr		Processing expression for the channel the records came from

	@return One processed record per input record, in the same order
 */
vector<ProcessedRecord> RecordProcessor::Process(const vector<RawRecord>& raw, const ProcessingExpression& expr)
{
	vector<ProcessedRecord> ret;
	ret.reserve(raw.size());
	for(auto& r : raw)
		ret.push_back(ProcessRecord(r, expr));
	return ret;
}

ProcessedRecord RecordProcessor::ProcessRecord(const RawRecord& raw, const ProcessingExpression& expr)
{
	vector<RecordValue> fields;
	fields.reserve(raw.size());
	for(size_t i=0; i<raw.size(); i++)
		fields.push_back(Apply(raw[i], expr.GetOps(i)));
	return ProcessedRecord(fields);
}

/**
	@brief Folds a chain of operations over one field value, left to right
 */
RecordValue RecordProcessor::Apply(RecordValue value, const vector<ProcessingOp>& ops)
{
	for(auto& op : ops)
		value = ApplyOp(value, op);
	return value;
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Operators

RecordValue RecordProcessor::ApplyOp(const RecordValue& value, const ProcessingOp& op)
{
	switch(op.m_op)
	{
		case ProcessingOp::OP_SQRT:
			return RecordValue::FromFloat(sqrt(value.GetFloat()));

		case ProcessingOp::OP_FLOOR:
			return RoundToInteger(value, false);

		case ProcessingOp::OP_CEIL:
			return RoundToInteger(value, true);

		default:
			break;
	}

	if(!op.m_operand.has_value())
		throw FormatError(string("Operation '") + ProcessingOp::GetOpChar(op.m_op) + "' has no operand");

	auto& operand = *op.m_operand;

	//Masking is only defined for integers
	if(op.m_op == ProcessingOp::OP_AND)
	{
		if(!value.IsIntegral() || !operand.IsIntegral())
			throw FormatError("Can't apply '&' to a floating point value");
		if(value.GetType() == RecordValue::TYPE_UNSIGNED)
			return RecordValue::FromUnsigned(value.GetUnsigned() & operand.GetUnsigned());
		return RecordValue::FromSigned(value.GetSigned() & operand.GetSigned());
	}

	if(!value.FitsSigned() || !operand.FitsSigned())
		return ApplyFloatOp(value.GetFloat(), operand.GetFloat(), op.m_op);

	int64_t a = value.GetSigned();
	int64_t b = operand.GetSigned();

	//Integer arithmetic wraps at 64 bits, do it unsigned to stay out of undefined behavior
	uint64_t ua = static_cast<uint64_t>(a);
	uint64_t ub = static_cast<uint64_t>(b);

	switch(op.m_op)
	{
		case ProcessingOp::OP_MUL:
			return RecordValue::FromSigned(static_cast<int64_t>(ua * ub));

		case ProcessingOp::OP_ADD:
			return RecordValue::FromSigned(static_cast<int64_t>(ua + ub));

		case ProcessingOp::OP_SUB:
			return RecordValue::FromSigned(static_cast<int64_t>(ua - ub));

		case ProcessingOp::OP_DIV:
			if( (b != 0) && !( (a == INT64_MIN) && (b == -1) ) )
				return RecordValue::FromSigned(FloorDivide(a, b));
			break;

		case ProcessingOp::OP_POW:
			if(b >= 0)
				return RecordValue::FromSigned(IntegerPower(a, b));
			break;

		default:
			break;
	}

	return ApplyFloatOp(value.GetFloat(), operand.GetFloat(), op.m_op);
}

/**
	@brief Binary operation on floating point values
 */
RecordValue RecordProcessor::ApplyFloatOp(double a, double b, ProcessingOp::OpType op)
{
	switch(op)
	{
		case ProcessingOp::OP_MUL:
			return RecordValue::FromFloat(a * b);

		case ProcessingOp::OP_ADD:
			return RecordValue::FromFloat(a + b);

		case ProcessingOp::OP_SUB:
			return RecordValue::FromFloat(a - b);

		case ProcessingOp::OP_DIV:
			return RecordValue::FromFloat(a / b);

		case ProcessingOp::OP_POW:
			return RecordValue::FromFloat(pow(a, b));

		default:
			throw FormatError(string("Don't recognize operation ") + ProcessingOp::GetOpChar(op));
	}
}

/**
	@brief Floor or ceiling, producing an integer where the result fits in one
 */
RecordValue RecordProcessor::RoundToInteger(const RecordValue& value, bool up)
{
	if(value.IsIntegral())
	{
		if(value.FitsSigned())
			return RecordValue::FromSigned(value.GetSigned());
		return value;
	}

	double d = up ? ceil(value.GetFloat()) : floor(value.GetFloat());

	//NaN, infinities and huge values can't be converted
	if(!isfinite(d) || (d < -9.2e18) || (d > 9.2e18) )
		return RecordValue::FromFloat(d);
	return RecordValue::FromSigned(static_cast<int64_t>(d));
}

/**
	@brief Integer division rounding toward negative infinity
 */
int64_t RecordProcessor::FloorDivide(int64_t a, int64_t b)
{
	int64_t q = a / b;
	if( (a % b != 0) && ( (a < 0) != (b < 0) ) )
		q --;
	return q;
}

int64_t RecordProcessor::IntegerPower(int64_t base, int64_t exp)
{
	uint64_t result = 1;
	uint64_t ubase = static_cast<uint64_t>(base);
	while(exp > 0)
	{
		if(exp & 1)
			result *= ubase;
		ubase *= ubase;
		exp >>= 1;
	}
	return static_cast<int64_t>(result);
}
