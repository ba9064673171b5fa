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
	@brief Implementation of BinaryLayout
 */

#include "lidata.h"

using namespace std;

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Parsing

/**
	@brief Parses a binary layout string

	@param spec		Layout string, for example "<s32:f32" or "<p8,0xFF:u8"

	@return The parsed layout

	Throws FormatError if the string is empty, requests big-endian byte order, or contains a malformed clause.
 */
BinaryLayout BinaryLayout::Parse(const string& spec)
{
	if(spec.empty())
		throw FormatError("Can't use empty binary record string");

	if(spec.find('>') != string::npos)
		throw FormatError("Big-endian data order currently not supported");

	//Leading little-endian marker is the default, skip it
	string body = spec;
	if(body[0] == '<')
		body = body.substr(1);

	BinaryLayout ret;
	for(auto& clause : split(body, ':'))
	{
		auto field = ParseClause(Trim(clause));

		ret.m_recordBitLength += field.m_bitWidth;
		if(field.IsOutput())
			ret.m_outputFieldCount ++;
		ret.m_fields.push_back(field);
	}

	LogTrace("Parsed \"%s\": %zu fields, %zu bits per record\n",
		spec.c_str(), ret.m_fields.size(), ret.m_recordBitLength);

	return ret;
}

/**
	@brief Parses a single <type><width>[,<literal>] clause
 */
FieldDescriptor BinaryLayout::ParseClause(const string& clause)
{
	if(clause.empty())
		throw FormatError("Can't parse empty binary specifier");

	FieldDescriptor::FieldKind kind;
	switch(clause[0])
	{
		case 'u':
			kind = FieldDescriptor::KIND_UNSIGNED;
			break;

		case 's':
			kind = FieldDescriptor::KIND_SIGNED;
			break;

		case 'f':
			kind = FieldDescriptor::KIND_FLOAT;
			break;

		case 'b':
			kind = FieldDescriptor::KIND_BOOL;
			break;

		case 'p':
			kind = FieldDescriptor::KIND_PADDING;
			break;

		case 'r':
			throw FormatError(string("Reserved binary specifier type 'r' in ") + clause);

		default:
			throw FormatError(string("Can't parse binary specifier ") + clause);
	}

	//Bit width
	size_t i = 1;
	while( (i < clause.length()) && isdigit(static_cast<unsigned char>(clause[i])) )
		i++;
	if(i == 1)
		throw FormatError(string("Missing bit width in binary specifier ") + clause);
	auto width = strtoul(clause.substr(1, i-1).c_str(), NULL, 10);
	if( (width < 1) || (width > 64) )
		throw FormatError(string("Bit width must be between 1 and 64 in binary specifier ") + clause);

	if( (kind == FieldDescriptor::KIND_FLOAT) && (width != 32) && (width != 64) )
		throw FormatError("Can't have a floating point spec with bit length other than 32/64 bits");
	if( (kind == FieldDescriptor::KIND_BOOL) && (width != 1) )
		throw FormatError("Boolean that isn't a single bit");

	//No literal
	if(i == clause.length())
		return FieldDescriptor(kind, width);

	if(clause[i] != ',')
		throw FormatError(string("Can't parse binary specifier ") + clause);

	return FieldDescriptor(kind, width, ParseLiteral(Trim(clause.substr(i+1)), width, clause));
}

/**
	@brief Parses the literal part of a clause and checks that it fits in the field

	@param str		Literal text (decimal, 0x hex, 0b binary or 0o octal, optionally negative)
	@param width	Width of the field, in bits
	@param clause	The whole clause, for error reporting

	@return Bit pattern of the literal (two's complement if negative)
 */
uint64_t BinaryLayout::ParseLiteral(const string& str, unsigned int width, const string& clause)
{
	if(str.empty())
		throw FormatError(string("Empty literal in binary specifier ") + clause);

	bool negative = false;
	size_t i = 0;
	if(str[0] == '-')
	{
		negative = true;
		i++;
	}

	int base = 10;
	if( (str.length() > i+1) && (str[i] == '0') )
	{
		switch(str[i+1])
		{
			case 'x':
			case 'X':
				base = 16;
				i += 2;
				break;

			case 'b':
			case 'B':
				base = 2;
				i += 2;
				break;

			case 'o':
			case 'O':
				base = 8;
				i += 2;
				break;

			default:
				break;
		}
	}

	auto digits = str.substr(i);
	if(digits.empty())
		throw FormatError(string("Can't parse literal in binary specifier ") + clause);

	errno = 0;
	char* end = NULL;
	uint64_t magnitude = strtoull(digits.c_str(), &end, base);
	if( (*end != '\0') || (errno == ERANGE) || (digits[0] == '-') || (digits[0] == '+') )
		throw FormatError(string("Can't parse literal in binary specifier ") + clause);

	uint64_t mask = (width >= 64) ? UINT64_MAX : ( (1ULL << width) - 1);
	if(!negative)
	{
		if(magnitude > mask)
			throw FormatError(string("Literal doesn't fit in field width in binary specifier ") + clause);
		return magnitude;
	}

	//Negative literals must fit in a signed field of the same width
	uint64_t limit = 1ULL << (width - 1);
	if(magnitude > limit)
		throw FormatError(string("Literal doesn't fit in field width in binary specifier ") + clause);
	return (~magnitude + 1) & mask;
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Display

string FieldDescriptor::ToString() const
{
	string ret;
	switch(m_kind)
	{
		case KIND_UNSIGNED:
			ret = "u";
			break;

		case KIND_SIGNED:
			ret = "s";
			break;

		case KIND_FLOAT:
			ret = "f";
			break;

		case KIND_BOOL:
			ret = "b";
			break;

		case KIND_PADDING:
		default:
			ret = "p";
			break;
	}

	ret += to_string(m_bitWidth);
	if(m_literal.has_value())
		ret += string(",0x") + to_string_hex(*m_literal);
	return ret;
}

/**
	@brief Renders the layout back to canonical string form
 */
string BinaryLayout::ToString() const
{
	string ret = "<";
	for(size_t i=0; i<m_fields.size(); i++)
	{
		if(i > 0)
			ret += ":";
		ret += m_fields[i].ToString();
	}
	return ret;
}
