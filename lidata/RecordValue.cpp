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
	@brief Implementation of RecordValue and ProcessedRecord
 */

#include "lidata.h"

using namespace std;

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Construction

RecordValue RecordValue::FromSigned(int64_t v)
{
	RecordValue ret;
	ret.m_type = TYPE_SIGNED;
	ret.m_signed = v;
	return ret;
}

RecordValue RecordValue::FromUnsigned(uint64_t v)
{
	RecordValue ret;
	ret.m_type = TYPE_UNSIGNED;
	ret.m_unsigned = v;
	return ret;
}

RecordValue RecordValue::FromFloat(double v)
{
	RecordValue ret;
	ret.m_type = TYPE_FLOAT;
	ret.m_float = v;
	return ret;
}

RecordValue RecordValue::FromBool(bool v)
{
	RecordValue ret;
	ret.m_type = TYPE_BOOL;
	ret.m_signed = v ? 1 : 0;
	return ret;
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Conversions

/**
	@brief Gets the value as a signed integer.

	Floats are truncated toward zero and saturate at the limits of int64_t (NaN gives zero). Unsigned values above
	INT64_MAX wrap.
 */
int64_t RecordValue::GetSigned() const
{
	switch(m_type)
	{
		case TYPE_UNSIGNED:
			return static_cast<int64_t>(m_unsigned);

		case TYPE_FLOAT:
			if(isnan(m_float))
				return 0;
			if(m_float <= -9223372036854775808.0)
				return INT64_MIN;
			if(m_float >= 9223372036854775808.0)
				return INT64_MAX;
			return static_cast<int64_t>(m_float);

		case TYPE_SIGNED:
		case TYPE_BOOL:
		default:
			return m_signed;
	}
}

/**
	@brief Gets the raw 64-bit pattern of an integral value (two's complement for negative numbers)

	Floats are truncated toward zero and saturate the same way as GetSigned().
 */
uint64_t RecordValue::GetUnsigned() const
{
	switch(m_type)
	{
		case TYPE_UNSIGNED:
			return m_unsigned;

		case TYPE_FLOAT:
			if(m_float >= 18446744073709551616.0)
				return UINT64_MAX;
			if(m_float >= 9223372036854775808.0)
				return static_cast<uint64_t>(m_float);
			return static_cast<uint64_t>(GetSigned());

		case TYPE_SIGNED:
		case TYPE_BOOL:
		default:
			return static_cast<uint64_t>(m_signed);
	}
}

double RecordValue::GetFloat() const
{
	switch(m_type)
	{
		case TYPE_UNSIGNED:
			return static_cast<double>(m_unsigned);

		case TYPE_FLOAT:
			return m_float;

		case TYPE_SIGNED:
		case TYPE_BOOL:
		default:
			return static_cast<double>(m_signed);
	}
}

bool RecordValue::GetBool() const
{
	switch(m_type)
	{
		case TYPE_UNSIGNED:
			return m_unsigned != 0;

		case TYPE_FLOAT:
			return m_float != 0;

		case TYPE_SIGNED:
		case TYPE_BOOL:
		default:
			return m_signed != 0;
	}
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Comparison and display

/**
	@brief Numeric comparison, ignoring the type tag (so 2 == 2.0 and true == 1)
 */
bool RecordValue::operator==(const RecordValue& rhs) const
{
	if(IsFloat() || rhs.IsFloat())
		return GetFloat() == rhs.GetFloat();

	//Both integral. Negative signed values never equal an unsigned one
	bool lneg = (m_type != TYPE_UNSIGNED) && (m_signed < 0);
	bool rneg = (rhs.m_type != TYPE_UNSIGNED) && (rhs.m_signed < 0);
	if(lneg != rneg)
		return false;
	return GetUnsigned() == rhs.GetUnsigned();
}

string RecordValue::ToString() const
{
	char tmp[32];
	switch(m_type)
	{
		case TYPE_SIGNED:
			snprintf(tmp, sizeof(tmp), "%" PRId64, m_signed);
			return tmp;

		case TYPE_UNSIGNED:
			snprintf(tmp, sizeof(tmp), "%" PRIu64, m_unsigned);
			return tmp;

		case TYPE_BOOL:
			return m_signed ? "True" : "False";

		case TYPE_FLOAT:
		default:
			return to_string_shortest(m_float);
	}
}

string ProcessedRecord::ToString() const
{
	if(IsScalar())
		return m_fields[0].ToString();

	string ret = "(";
	for(size_t i=0; i<m_fields.size(); i++)
	{
		if(i > 0)
			ret += ", ";
		ret += m_fields[i].ToString();
	}
	ret += ")";
	return ret;
}
