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
	@brief Implementation of StreamFrame
 */

#include "lidata.h"

using namespace std;

/**
	@brief Decodes a frame header and attaches the payload

	@throws FormatError if the header is too short or has trailing bytes
 */
StreamFrame StreamFrame::Parse(const vector<uint8_t>& header, const vector<uint8_t>& payload)
{
	StreamFrame ret;
	ret.m_payload = payload;

	if(header.size() < 2)
		throw FormatError("Stream frame header too short for tag length");
	size_t taglen = ReadLE16(&header[0]);

	size_t expected = 2 + taglen + 4 + 8 + 8;
	if(header.size() != expected)
	{
		throw FormatError(
			string("Stream frame header is ") + to_string(header.size()) + " bytes, expected " + to_string(expected));
	}

	const uint8_t* p = &header[2];
	ret.m_tag.assign(reinterpret_cast<const char*>(p), taglen);
	p += taglen;

	ret.m_channel = static_cast<int32_t>(ReadLE32(p));
	p += 4;

	ret.m_startIndex = ReadLE64(p);
	p += 8;

	uint64_t tmp = ReadLE64(p);
	memcpy(&ret.m_calibration, &tmp, sizeof(tmp));

	return ret;
}

vector<uint8_t> StreamFrame::SerializeHeader() const
{
	if(m_tag.length() > 0xffff)
		throw FormatError("Stream frame tag is too long");

	vector<uint8_t> ret;
	AppendLE16(ret, m_tag.length());
	ret.insert(ret.end(), m_tag.begin(), m_tag.end());
	AppendLE32(ret, static_cast<uint32_t>(m_channel));
	AppendLE64(ret, m_startIndex);

	uint64_t tmp;
	memcpy(&tmp, &m_calibration, sizeof(tmp));
	AppendLE64(ret, tmp);
	return ret;
}
