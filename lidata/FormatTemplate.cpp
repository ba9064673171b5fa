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
	@brief Implementation of FormatTemplate
 */

#include "lidata.h"

using namespace std;

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// FormatSpec

/**
	@brief Parses the part of a replacement field after the colon
 */
FormatSpec FormatSpec::Parse(const string& spec)
{
	FormatSpec ret;
	size_t i = 0;
	auto isAlign = [](char c) { return (c == '<') || (c == '>') || (c == '^') || (c == '='); };

	//Fill and alignment
	if( (spec.length() >= 2) && isAlign(spec[1]) )
	{
		ret.m_fill = spec[0];
		ret.m_align = spec[1];
		i = 2;
	}
	else if( (spec.length() >= 1) && isAlign(spec[0]) )
	{
		ret.m_align = spec[0];
		i = 1;
	}

	if( (i < spec.length()) && ( (spec[i] == '+') || (spec[i] == '-') || (spec[i] == ' ') ) )
		ret.m_sign = spec[i++];

	if( (i < spec.length()) && (spec[i] == '#') )
	{
		ret.m_alternate = true;
		i++;
	}

	//Zero padding is sign-aware padding with '0' unless an alignment was given
	if( (i < spec.length()) && (spec[i] == '0') )
	{
		if(ret.m_align == '\0')
		{
			ret.m_fill = '0';
			ret.m_align = '=';
		}
		i++;
	}

	while( (i < spec.length()) && isdigit(static_cast<unsigned char>(spec[i])) )
	{
		ret.m_width = ret.m_width*10 + (spec[i] - '0');
		i++;
	}

	if( (i < spec.length()) && (spec[i] == '.') )
	{
		i++;
		if( (i >= spec.length()) || !isdigit(static_cast<unsigned char>(spec[i])) )
			throw FormatError(string("Missing precision in format spec \"") + spec + "\"");
		ret.m_precision = 0;
		while( (i < spec.length()) && isdigit(static_cast<unsigned char>(spec[i])) )
		{
			ret.m_precision = ret.m_precision*10 + (spec[i] - '0');
			i++;
		}
	}

	if(i < spec.length())
	{
		if(!strchr("dxXoeEfFgG%s", spec[i]))
			throw FormatError(string("Unknown format type '") + spec[i] + "' in \"" + spec + "\"");
		ret.m_type = spec[i++];
	}

	if(i != spec.length())
		throw FormatError(string("Garbage at end of format spec \"") + spec + "\"");

	return ret;
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Parsing

/**
	@brief Parses a template string

	@throws FormatError on unbalanced braces or a bad replacement field
 */
FormatTemplate::FormatTemplate(const string& text)
	: m_text(text)
{
	Segment literal;
	for(size_t i=0; i<text.length(); i++)
	{
		char c = text[i];

		if(c == '}')
		{
			if( (i+1 < text.length()) && (text[i+1] == '}') )
			{
				literal.m_text += '}';
				i++;
				continue;
			}
			throw FormatError(string("Single '}' in template \"") + text + "\"");
		}

		if(c != '{')
		{
			literal.m_text += c;
			continue;
		}

		if( (i+1 < text.length()) && (text[i+1] == '{') )
		{
			literal.m_text += '{';
			i++;
			continue;
		}

		//Start of a replacement field, flush the literal text before it
		size_t end = text.find('}', i);
		if(end == string::npos)
			throw FormatError(string("Unterminated replacement field in template \"") + text + "\"");
		string body = text.substr(i+1, end-i-1);
		i = end;

		if(body.find('{') != string::npos)
			throw FormatError(string("Nested replacement fields aren't supported: \"") + body + "\"");

		if(!literal.m_text.empty())
		{
			m_segments.push_back(literal);
			literal = Segment();
		}

		Segment field;
		field.m_isField = true;

		string spec;
		size_t colon = body.find(':');
		if(colon != string::npos)
		{
			spec = body.substr(colon+1);
			body = body.substr(0, colon);
		}

		//Optional index
		size_t bracket = body.find('[');
		if(bracket != string::npos)
		{
			if( (body.back() != ']') || (bracket+2 >= body.length()) )
				throw FormatError(string("Bad index in replacement field \"") + body + "\"");
			string index = body.substr(bracket+1, body.length() - bracket - 2);
			for(auto d : index)
			{
				if(!isdigit(static_cast<unsigned char>(d)))
					throw FormatError(string("Bad index in replacement field \"") + body + "\"");
			}
			field.m_index = stoull(index);
			body = body.substr(0, bracket);
		}

		if(body.empty())
			throw FormatError(string("Empty replacement field in template \"") + text + "\"");
		for(auto n : body)
		{
			if(!isalnum(static_cast<unsigned char>(n)) && (n != '_'))
				throw FormatError(string("Bad name in replacement field \"") + body + "\"");
		}

		field.m_text = body;
		field.m_spec = FormatSpec::Parse(spec);
		m_segments.push_back(field);
	}

	if(!literal.m_text.empty())
		m_segments.push_back(literal);
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Rendering

/**
	@brief Expands the template with a set of named values

	@throws FormatError if an index is out of range for the bound record
 */
string FormatTemplate::Render(const FormatArgs& args) const
{
	string ret;
	for(auto& seg : m_segments)
	{
		if(!seg.m_isField)
		{
			ret += seg.m_text;
			continue;
		}

		auto str = args.GetString(seg.m_text);
		if(str)
		{
			ret += FormatString(*str, seg.m_spec);
			continue;
		}

		auto rec = args.GetRecord(seg.m_text);
		if(!rec)
			continue;

		if(seg.m_index.has_value())
		{
			size_t index = *seg.m_index;
			if(index >= rec->size())
			{
				throw FormatError(
					string("Index ") + to_string(index) + " out of range for \"" + seg.m_text + "\", which has " +
					to_string(rec->size()) + " fields");
			}
			ret += FormatValue((*rec)[index], seg.m_spec);
		}
		else if(rec->IsScalar())
			ret += FormatValue(rec->GetScalar(), seg.m_spec);
		else
			ret += FormatString(rec->ToString(), seg.m_spec);
	}
	return ret;
}

/**
	@brief Applies width, fill and alignment to an already formatted value
 */
string FormatTemplate::Pad(const string& body, const FormatSpec& spec, char defaultAlign)
{
	if(body.length() >= spec.m_width)
		return body;

	size_t npad = spec.m_width - body.length();
	char align = spec.m_align ? spec.m_align : defaultAlign;
	switch(align)
	{
		case '<':
			return body + string(npad, spec.m_fill);

		case '^':
			return string(npad/2, spec.m_fill) + body + string(npad - npad/2, spec.m_fill);

		//Padding goes between the sign (or radix prefix) and the digits
		case '=':
			{
				size_t prefix = 0;
				if( !body.empty() && ( (body[0] == '-') || (body[0] == '+') || (body[0] == ' ') ) )
					prefix = 1;
				if( (body.length() >= prefix+2) && (body[prefix] == '0') && strchr("xXo", body[prefix+1]) )
					prefix += 2;
				return body.substr(0, prefix) + string(npad, spec.m_fill) + body.substr(prefix);
			}

		case '>':
		default:
			return string(npad, spec.m_fill) + body;
	}
}

string FormatTemplate::FormatString(const string& str, const FormatSpec& spec)
{
	string body = str;
	if( (spec.m_precision >= 0) && (body.length() > static_cast<size_t>(spec.m_precision)) )
		body.resize(spec.m_precision);
	return Pad(body, spec, '<');
}

/**
	@brief Formats one value according to a format spec
 */
string FormatTemplate::FormatValue(const RecordValue& value, const FormatSpec& spec)
{
	string body;

	char signflag[2] = { 0, 0 };
	if(spec.m_sign != '-')
		signflag[0] = spec.m_sign;

	switch(spec.m_type)
	{
		case 's':
			return FormatString(value.ToString(), spec);

		case 'd':
			if(value.IsFloat())
				throw FormatError(string("Format code '") + spec.m_type + "' can't be used with a floating point value");
			if(value.GetType() == RecordValue::TYPE_UNSIGNED)
				body = string_printf("%s%" PRIu64, signflag, value.GetUnsigned());
			else
				body = string_printf("%s%" PRId64, signflag, value.GetSigned());
			break;

		case 'x':
		case 'X':
		case 'o':
			{
				if(value.IsFloat())
					throw FormatError(string("Format code '") + spec.m_type + "' can't be used with a floating point value");

				//Negative numbers print as a sign and the magnitude
				bool negative = (value.GetType() != RecordValue::TYPE_UNSIGNED) && (value.GetSigned() < 0);
				uint64_t magnitude = value.GetUnsigned();
				if(negative)
					magnitude = 0 - static_cast<uint64_t>(value.GetSigned());

				const char* fmt = "%" PRIx64;
				if(spec.m_type == 'X')
					fmt = "%" PRIX64;
				else if(spec.m_type == 'o')
					fmt = "%" PRIo64;
				auto digits = string_printf(fmt, magnitude);

				if(negative)
					body = "-";
				else if(signflag[0])
					body = signflag;
				if(spec.m_alternate)
					body += (spec.m_type == 'o') ? "0o" : ( (spec.m_type == 'X') ? "0X" : "0x" );
				body += digits;
			}
			break;

		case 'e':
		case 'E':
		case 'f':
		case 'F':
		case 'g':
		case 'G':
		case '%':
			{
				int precision = (spec.m_precision >= 0) ? spec.m_precision : 6;
				double d = value.GetFloat();
				char type = spec.m_type;
				if(type == '%')
				{
					d *= 100;
					type = 'f';
				}

				char fmt[16];
				snprintf(fmt, sizeof(fmt), "%%%s%s.*%c", signflag, spec.m_alternate ? "#" : "", type);
				body = string_printf(fmt, precision, d);
				if(spec.m_type == '%')
					body += "%";
			}
			break;

		//No type: natural representation of the value
		default:
			if(value.IsFloat() && (spec.m_precision >= 0))
				body = string_printf("%s%.*g", signflag, spec.m_precision ? spec.m_precision : 1, value.GetFloat());
			else if(value.GetType() == RecordValue::TYPE_BOOL)
				return FormatString(value.ToString(), spec);
			else
			{
				body = value.ToString();
				if(signflag[0] && (body[0] != '-'))
					body = signflag + body;
			}
			break;
	}

	return Pad(body, spec, '>');
}
