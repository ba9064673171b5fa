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
	@brief Declaration of BinaryLayout and FieldDescriptor
 */

#ifndef BinaryLayout_h
#define BinaryLayout_h

/**
	@brief One field of a binary record layout
 */
class FieldDescriptor
{
public:

	enum FieldKind
	{
		KIND_UNSIGNED,
		KIND_SIGNED,
		KIND_FLOAT,
		KIND_BOOL,
		KIND_PADDING
	};

	FieldDescriptor(FieldKind kind, unsigned int width)
		: m_kind(kind)
		, m_bitWidth(width)
	{}

	FieldDescriptor(FieldKind kind, unsigned int width, uint64_t literal)
		: m_kind(kind)
		, m_bitWidth(width)
		, m_literal(literal)
	{}

	///@brief True if the field is a fixed marker which must match for the record to be accepted
	bool IsLiteral() const
	{ return m_literal.has_value(); }

	///@brief True if the field appears in decoded records (everything except padding)
	bool IsOutput() const
	{ return m_kind != KIND_PADDING; }

	///@brief Bit mask covering the field width
	uint64_t GetMask() const
	{ return (m_bitWidth >= 64) ? UINT64_MAX : ( (1ULL << m_bitWidth) - 1); }

	/**
		@brief Checks a raw bit pattern against the literal

		@param bits		Raw field bits, right aligned

		@return True if the field has no literal or the literal matches
	 */
	bool MatchesLiteral(uint64_t bits) const
	{ return !m_literal.has_value() || ( (*m_literal & GetMask()) == bits ); }

	std::string ToString() const;

	///@brief Type of the field
	FieldKind m_kind;

	///@brief Width of the field, in bits (1-64)
	unsigned int m_bitWidth;

	///@brief Expected bit pattern for alignment/sync markers
	std::optional<uint64_t> m_literal;
};

/**
	@brief An immutable, parsed binary record layout.

	The layout string is a list of clauses separated by colons. Each clause is a type character (u = unsigned,
	s = signed, f = float, b = boolean, p = padding), a bit width, and an optional comma-separated literal value.
	A leading '<' marks the (only supported) little-endian byte order.

	For example "<p8,0xFF:s24:b1:p7" is a 0xFF sync byte followed by a 24-bit signed value and a flag bit.
 */
class BinaryLayout
{
public:
	BinaryLayout()
		: m_recordBitLength(0)
		, m_outputFieldCount(0)
	{}

	static BinaryLayout Parse(const std::string& spec);

	std::string ToString() const;

	const std::vector<FieldDescriptor>& GetFields() const
	{ return m_fields; }

	size_t size() const
	{ return m_fields.size(); }

	const FieldDescriptor& operator[](size_t i) const
	{ return m_fields[i]; }

	///@brief Total length of one record, in bits (need not be a multiple of 8)
	size_t GetRecordBitLength() const
	{ return m_recordBitLength; }

	///@brief Number of values in each decoded record
	size_t GetOutputFieldCount() const
	{ return m_outputFieldCount; }

protected:
	static FieldDescriptor ParseClause(const std::string& clause);
	static uint64_t ParseLiteral(const std::string& str, unsigned int width, const std::string& clause);

	std::vector<FieldDescriptor> m_fields;
	size_t m_recordBitLength;
	size_t m_outputFieldCount;
};

#endif
