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
	@brief Declaration of RecordProcessor
 */

#ifndef RecordProcessor_h
#define RecordProcessor_h

/**
	@brief Applies a ProcessingExpression to decoded records.

	Stateless; the per-channel bookkeeping lives in LIDataParser.

	Integer values stay integers through +, -, *, / (floor division), & and ^ with integer operands. Any float
	operand, or sqrt, turns the value into a double. Floor and ceiling turn it back into an integer.
 */
class RecordProcessor
{
public:
	static std::vector<ProcessedRecord> Process(const std::vector<RawRecord>& raw, const ProcessingExpression& expr);
	static ProcessedRecord ProcessRecord(const RawRecord& raw, const ProcessingExpression& expr);
	static RecordValue Apply(RecordValue value, const std::vector<ProcessingOp>& ops);

protected:
	static RecordValue ApplyOp(const RecordValue& value, const ProcessingOp& op);
	static RecordValue ApplyFloatOp(double a, double b, ProcessingOp::OpType op);
	static RecordValue RoundToInteger(const RecordValue& value, bool up);
	static int64_t FloorDivide(int64_t a, int64_t b);
	static int64_t IntegerPower(int64_t base, int64_t exp);
};

#endif
