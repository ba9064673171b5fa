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
	@brief Declaration of ProcessingExpression and ProcessingOp
 */

#ifndef ProcessingExpression_h
#define ProcessingExpression_h

class BinaryLayout;

/**
	@brief One arithmetic step applied to a field value
 */
class ProcessingOp
{
public:

	enum OpType
	{
		OP_MUL,
		OP_DIV,
		OP_ADD,
		OP_SUB,
		OP_AND,
		OP_SQRT,
		OP_FLOOR,
		OP_CEIL,
		OP_POW
	};

	ProcessingOp(OpType op)
		: m_op(op)
		, m_isCalibration(false)
	{}

	ProcessingOp(OpType op, RecordValue operand, bool isCalibration = false)
		: m_op(op)
		, m_operand(operand)
		, m_isCalibration(isCalibration)
	{}

	///@brief True for operators which take no operand (sqrt, floor, ceil)
	bool IsUnary() const
	{ return (m_op == OP_SQRT) || (m_op == OP_FLOOR) || (m_op == OP_CEIL); }

	static char GetOpChar(OpType op);

	OpType m_op;

	///@brief Operand, empty for unary operators
	std::optional<RecordValue> m_operand;

	///@brief True if the operand came from the "C" placeholder and tracks the channel calibration
	bool m_isCalibration;
};

/**
	@brief Per-channel arithmetic post-processing applied to decoded records.

	The expression string contains one colon-separated clause per output field of the binary layout. Each clause is
	a sequence of operator/operand pairs applied left to right to the raw field value:

	* multiply, / divide, + add, - subtract, & bitwise and, ^ power (all with an operand)
	s square root, f floor, c ceiling (no operand)

	Operands are decimal, hex (0x, upper case digits) or exponential literals, or "C" for the channel's calibration
	coefficient. For example "*C/2.5e3:f" scales the first field and rounds the second one down.
 */
class ProcessingExpression
{
public:
	ProcessingExpression()
		: m_calibration(0)
	{}

	static ProcessingExpression Parse(const std::string& spec, double calibration);

	void SetCoefficient(double calibration);

	///@brief Gets the calibration coefficient currently substituted for "C"
	double GetCalibration() const
	{ return m_calibration; }

	void Validate(const BinaryLayout& layout) const;

	///@brief Number of clauses (fields with a processing chain)
	size_t GetFieldCount() const
	{ return m_fields.size(); }

	/**
		@brief Gets the processing chain for one output field

		Fields beyond the end of the expression have an empty chain (no processing).
	 */
	const std::vector<ProcessingOp>& GetOps(size_t field) const
	{
		static const std::vector<ProcessingOp> empty;
		if(field >= m_fields.size())
			return empty;
		return m_fields[field];
	}

	std::string ToString() const;

protected:
	static void ParseClause(const std::string& clause, double calibration, std::vector<ProcessingOp>& ops);
	static RecordValue ParseOperand(const std::string& clause, size_t& i, double calibration, bool& isCalibration);

	std::vector< std::vector<ProcessingOp> > m_fields;
	double m_calibration;
};

#endif
