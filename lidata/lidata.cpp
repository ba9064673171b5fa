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
	@brief String and byte order helpers shared by the library
 */

#include "lidata.h"

using namespace std;

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// String helpers

/**
	@brief Removes whitespace from the start and end of a string
 */
string Trim(const string& str)
{
	string ret;
	string tmp;

	//Skip leading spaces
	size_t i=0;
	for(; i<str.length() && isspace(static_cast<unsigned char>(str[i])); i++)
	{}

	//Read non-space stuff
	for(; i<str.length(); i++)
	{
		//Non-space
		char c = str[i];
		if(!isspace(static_cast<unsigned char>(c)))
		{
			ret = ret + tmp + c;
			tmp = "";
		}

		//Space. Save it, only append if we have non-space after
		else
			tmp += c;
	}

	return ret;
}

/**
	@brief Splits a string up into an array separated by delimiters, keeping empty pieces

	split("a::b", ':') is {"a", "", "b"}, and split("", ':') is {""}.
 */
vector<string> split(const string& str, char separator)
{
	vector<string> ret;
	string tmp;
	for(auto c : str)
	{
		if(c == separator)
		{
			ret.push_back(tmp);
			tmp = "";
		}
		else
			tmp += c;
	}
	ret.push_back(tmp);
	return ret;
}

string to_string_hex(uint64_t n, bool zeropad, int len)
{
	char format[32];
	if(zeropad)
		snprintf(format, sizeof(format), "%%0%d" PRIx64, len);
	else if(len > 0)
		snprintf(format, sizeof(format), "%%%d" PRIx64, len);
	else
		snprintf(format, sizeof(format), "%%" PRIx64);

	char tmp[32];
	snprintf(tmp, sizeof(tmp), format, n);
	return tmp;
}

/**
	@brief printf into a std::string of whatever length the output needs
 */
string string_printf(const char* fmt, ...)
{
	va_list va;
	va_start(va, fmt);
	int len = vsnprintf(NULL, 0, fmt, va);
	va_end(va);
	if(len <= 0)
		return "";

	vector<char> buf(len + 1);
	va_start(va, fmt);
	vsnprintf(buf.data(), buf.size(), fmt, va);
	va_end(va);
	return string(buf.data(), len);
}

/**
	@brief Formats a double with the fewest significant digits that read back as the same value

	Integral values print without a decimal point ("-100"), others in %g style ("-0.1", "1e-07").
 */
string to_string_shortest(double d)
{
	if(isnan(d))
		return "nan";
	if(isinf(d))
		return (d < 0) ? "-inf" : "inf";

	//Find the fewest significant digits that still read back as the same value
	char tmp[64];
	int precision = 1;
	for(; precision < 17; precision ++)
	{
		snprintf(tmp, sizeof(tmp), "%.*e", precision - 1, d);
		if(strtod(tmp, NULL) == d)
			break;
	}
	if(precision == 17)
		snprintf(tmp, sizeof(tmp), "%.16e", d);

	//Positional notation unless the exponent is very large or small
	int exponent = atoi(strchr(tmp, 'e') + 1);
	if( (exponent < -4) || (exponent >= 16) )
		return tmp;

	snprintf(tmp, sizeof(tmp), "%.*f", max(precision - 1 - exponent, 0), d);
	return tmp;
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Little endian byte order helpers

uint16_t ReadLE16(const uint8_t* p)
{
	return static_cast<uint16_t>(p[0] | (p[1] << 8));
}

uint32_t ReadLE32(const uint8_t* p)
{
	return static_cast<uint32_t>(ReadLE16(p)) | (static_cast<uint32_t>(ReadLE16(p+2)) << 16);
}

uint64_t ReadLE64(const uint8_t* p)
{
	return static_cast<uint64_t>(ReadLE32(p)) | (static_cast<uint64_t>(ReadLE32(p+4)) << 32);
}

void AppendLE16(vector<uint8_t>& buf, uint16_t v)
{
	buf.push_back(v & 0xff);
	buf.push_back(v >> 8);
}

void AppendLE32(vector<uint8_t>& buf, uint32_t v)
{
	AppendLE16(buf, v & 0xffff);
	AppendLE16(buf, v >> 16);
}

void AppendLE64(vector<uint8_t>& buf, uint64_t v)
{
	AppendLE32(buf, v & 0xffffffff);
	AppendLE32(buf, v >> 32);
}
