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
	@brief Declaration of RecordValue and ProcessedRecord
 */

#ifndef RecordValue_h
#define RecordValue_h

/**
	@brief A single decoded field value.

	Tagged union of the types a binary layout can produce. Arithmetic post-processing may turn an integral
	value into a floating point one (or back again, for floor/ceil), so the tag travels with the value.
 */
class RecordValue
{
public:

	enum ValueType
	{
		TYPE_SIGNED,
		TYPE_UNSIGNED,
		TYPE_FLOAT,
		TYPE_BOOL
	};

	RecordValue()
		: m_type(TYPE_SIGNED)
		, m_signed(0)
		, m_unsigned(0)
		, m_float(0)
	{}

	static RecordValue FromSigned(int64_t v);
	static RecordValue FromUnsigned(uint64_t v);
	static RecordValue FromFloat(double v);
	static RecordValue FromBool(bool v);

	ValueType GetType() const
	{ return m_type; }

	///@brief True for anything other than a floating point value (booleans count as integers)
	bool IsIntegral() const
	{ return m_type != TYPE_FLOAT; }

	bool IsFloat() const
	{ return m_type == TYPE_FLOAT; }

	///@brief True if the value is an integer that can be represented in an int64_t without loss
	bool FitsSigned() const
	{ return (m_type != TYPE_FLOAT) && ( (m_type != TYPE_UNSIGNED) || (m_unsigned <= INT64_MAX) ); }

	int64_t GetSigned() const;
	uint64_t GetUnsigned() const;
	double GetFloat() const;
	bool GetBool() const;

	bool operator==(const RecordValue& rhs) const;

	bool operator!=(const RecordValue& rhs) const
	{ return !(*this == rhs); }

	std::string ToString() const;

protected:
	ValueType m_type;

	int64_t m_signed;
	uint64_t m_unsigned;
	double m_float;
};

///@brief One decoded record, before processing: one value per non-padding field of the layout
typedef std::vector<RecordValue> RawRecord;

/**
	@brief One record after arithmetic post-processing.

	A record with a single field behaves as a scalar, anything longer as a tuple.
 */
class ProcessedRecord
{
public:
	ProcessedRecord()
	{}

	explicit ProcessedRecord(std::vector<RecordValue> fields)
		: m_fields(std::move(fields))
	{}

	ProcessedRecord(std::initializer_list<RecordValue> fields)
		: m_fields(fields)
	{}

	bool IsScalar() const
	{ return m_fields.size() == 1; }

	size_t size() const
	{ return m_fields.size(); }

	bool empty() const
	{ return m_fields.empty(); }

	const RecordValue& operator[](size_t i) const
	{ return m_fields[i]; }

	///@brief Returns the value of a scalar record (the first field of a tuple)
	const RecordValue& GetScalar() const
	{ return m_fields[0]; }

	const std::vector<RecordValue>& GetFields() const
	{ return m_fields; }

	bool operator==(const ProcessedRecord& rhs) const
	{ return m_fields == rhs.m_fields; }

	bool operator!=(const ProcessedRecord& rhs) const
	{ return !(*this == rhs); }

	std::string ToString() const;

protected:
	std::vector<RecordValue> m_fields;
};

#endif
