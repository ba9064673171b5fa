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
	@brief Implementation of ProcessingExpression
 */

#include "lidata.h"

using namespace std;

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Parsing

/**
	@brief Parses a processing expression string

	@param spec			Expression string, one clause per output field separated by colons
	@param calibration	Calibration coefficient to substitute for "C" operands

	Throws FormatError on an unknown operator, a malformed literal, or a binary operator with no operand.
 */
ProcessingExpression ProcessingExpression::Parse(const string& spec, double calibration)
{
	ProcessingExpression ret;
	ret.m_calibration = calibration;

	for(auto& clause : split(spec, ':'))
	{
		vector<ProcessingOp> ops;
		ParseClause(clause, calibration, ops);
		ret.m_fields.push_back(ops);
	}

	return ret;
}

void ProcessingExpression::ParseClause(const string& text, double calibration, vector<ProcessingOp>& ops)
{
	//Whitespace is insignificant
	string clause;
	for(auto c : text)
	{
		if(!isspace(static_cast<unsigned char>(c)))
			clause += c;
	}

	size_t i = 0;
	while(i < clause.length())
	{
		char c = clause[i];

		ProcessingOp::OpType op;
		switch(c)
		{
			case '*':	op = ProcessingOp::OP_MUL;		break;
			case '/':	op = ProcessingOp::OP_DIV;		break;
			case '+':	op = ProcessingOp::OP_ADD;		break;
			case '-':	op = ProcessingOp::OP_SUB;		break;
			case '&':	op = ProcessingOp::OP_AND;		break;
			case 's':	op = ProcessingOp::OP_SQRT;		break;
			case 'f':	op = ProcessingOp::OP_FLOOR;	break;
			case 'c':	op = ProcessingOp::OP_CEIL;		break;
			case '^':	op = ProcessingOp::OP_POW;		break;

			default:
				throw FormatError(string("Don't recognize operation '") + c + "' in \"" + clause + "\"");
		}
		i++;

		//Does an operand follow?
		bool hasOperand = false;
		if(i < clause.length())
		{
			char n = clause[i];
			if(isdigit(static_cast<unsigned char>(n)) || (n == '.') || (n == 'C'))
				hasOperand = true;
			else if( (n == '-') && (i+1 < clause.length()) && (isdigit(static_cast<unsigned char>(clause[i+1])) || (clause[i+1] == '.')) )
				hasOperand = true;
		}

		ProcessingOp pop(op);
		if(hasOperand)
		{
			bool isCalibration = false;
			auto operand = ParseOperand(clause, i, calibration, isCalibration);

			//Unary operators ignore any operand
			if(!pop.IsUnary())
				pop = ProcessingOp(op, operand, isCalibration);
		}
		else if(!pop.IsUnary())
			throw FormatError(string("Operation '") + c + "' requires an operand in \"" + clause + "\"");

		ops.push_back(pop);
	}
}

/**
	@brief Parses one operand starting at position i, and advances i past it
 */
RecordValue ProcessingExpression::ParseOperand(const string& clause, size_t& i, double calibration, bool& isCalibration)
{
	if(clause[i] == 'C')
	{
		i++;
		isCalibration = true;
		return RecordValue::FromFloat(calibration);
	}

	size_t start = i;
	if(clause[i] == '-')
		i++;

	//Hex integer. Only upper case digits, since lower case f and c are operators
	if( (i+1 < clause.length()) && (clause[i] == '0') && ( (clause[i+1] == 'x') || (clause[i+1] == 'X') ) )
	{
		i += 2;
		size_t digits = i;
		while( (i < clause.length()) && (isdigit(static_cast<unsigned char>(clause[i])) || ( (clause[i] >= 'A') && (clause[i] <= 'F') ) ) )
			i++;
		if(i == digits)
			throw FormatError(string("Can't parse literal in \"") + clause + "\"");

		errno = 0;
		int64_t v = strtoll(clause.substr(start, i-start).c_str(), NULL, 16);
		if(errno == ERANGE)
			throw FormatError(string("Literal out of range in \"") + clause + "\"");
		return RecordValue::FromSigned(v);
	}

	//Decimal integer or float, possibly with exponent
	bool isFloat = false;
	while( (i < clause.length()) && (isdigit(static_cast<unsigned char>(clause[i])) || (clause[i] == '.')) )
	{
		if(clause[i] == '.')
			isFloat = true;
		i++;
	}
	if( (i < clause.length()) && ( (clause[i] == 'e') || (clause[i] == 'E') ) )
	{
		size_t j = i+1;
		if( (j < clause.length()) && ( (clause[j] == '-') || (clause[j] == '+') ) )
			j++;
		if( (j < clause.length()) && isdigit(static_cast<unsigned char>(clause[j])) )
		{
			while( (j < clause.length()) && isdigit(static_cast<unsigned char>(clause[j])) )
				j++;
			i = j;
			isFloat = true;
		}
	}

	auto lit = clause.substr(start, i-start);
	char* end = NULL;
	errno = 0;
	if(isFloat)
	{
		double v = strtod(lit.c_str(), &end);
		if( (end == lit.c_str()) || (*end != '\0') )
			throw FormatError(string("Can't parse literal ") + lit);
		return RecordValue::FromFloat(v);
	}

	int64_t v = strtoll(lit.c_str(), &end, 10);
	if( (end == lit.c_str()) || (*end != '\0') || (errno == ERANGE) )
		throw FormatError(string("Can't parse literal ") + lit);
	return RecordValue::FromSigned(v);
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Calibration

/**
	@brief Re-resolves every "C" operand to a new calibration coefficient

	Used when the coefficient is only learned after the expression was parsed, e.g. from a stream frame header.
 */
void ProcessingExpression::SetCoefficient(double calibration)
{
	m_calibration = calibration;
	for(auto& ops : m_fields)
	{
		for(auto& op : ops)
		{
			if(op.m_isCalibration)
				op.m_operand = RecordValue::FromFloat(calibration);
		}
	}
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Checking

/**
	@brief Checks that the expression can be applied to records of the given layout

	Bitwise and is only defined on integers, so applying it to a float field (or to a value that was already
	converted to float by an earlier step) is rejected up front rather than on every record.
 */
void ProcessingExpression::Validate(const BinaryLayout& layout) const
{
	if(m_fields.size() > layout.GetOutputFieldCount())
	{
		LogWarning("Processing expression has %zu clauses but the layout only has %zu fields, ignoring the rest\n",
			m_fields.size(), layout.GetOutputFieldCount());
	}

	size_t nfield = 0;
	for(auto& field : layout.GetFields())
	{
		if(!field.IsOutput())
			continue;

		bool integral = (field.m_kind != FieldDescriptor::KIND_FLOAT);
		for(auto& op : GetOps(nfield))
		{
			bool operandIntegral = op.m_operand.has_value() && op.m_operand->IsIntegral();
			switch(op.m_op)
			{
				case ProcessingOp::OP_AND:
					if(!integral || !operandIntegral)
					{
						throw FormatError(string("Bitwise and on a floating point value in field ") +
							to_string(nfield) + " of " + ToString());
					}
					break;

				case ProcessingOp::OP_SQRT:
					integral = false;
					break;

				case ProcessingOp::OP_FLOOR:
				case ProcessingOp::OP_CEIL:
					integral = true;
					break;

				case ProcessingOp::OP_POW:
					integral = integral && operandIntegral && (op.m_operand->GetSigned() >= 0);
					break;

				default:
					integral = integral && operandIntegral;
					break;
			}
		}

		nfield ++;
	}
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Display

char ProcessingOp::GetOpChar(OpType op)
{
	switch(op)
	{
		case OP_MUL:	return '*';
		case OP_DIV:	return '/';
		case OP_ADD:	return '+';
		case OP_SUB:	return '-';
		case OP_AND:	return '&';
		case OP_SQRT:	return 's';
		case OP_FLOOR:	return 'f';
		case OP_CEIL:	return 'c';
		case OP_POW:
		default:		return '^';
	}
}

string ProcessingExpression::ToString() const
{
	string ret;
	for(size_t i=0; i<m_fields.size(); i++)
	{
		if(i > 0)
			ret += ":";
		for(auto& op : m_fields[i])
		{
			ret += ProcessingOp::GetOpChar(op.m_op);
			if(op.m_isCalibration)
				ret += "C";
			else if(op.m_operand.has_value())
			{
				//Keep floats looking like floats so the string parses back the same way
				auto s = op.m_operand->ToString();
				if(op.m_operand->IsFloat() && (s.find_first_of(".e") == string::npos))
					s += ".0";
				ret += s;
			}
		}
	}
	return ret;
}
