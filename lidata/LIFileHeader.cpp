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
	@brief Implementation of LIFileHeader
 */

#include "lidata.h"

using namespace std;

/**
	@brief Bounds checked reader over a header body
 */
class HeaderCursor
{
public:
	HeaderCursor(const uint8_t* data, size_t len)
		: m_data(data)
		, m_len(len)
		, m_offset(0)
	{}

	bool Read8(uint8_t& v)
	{
		if(!Have(1))
			return false;
		v = m_data[m_offset++];
		return true;
	}

	bool Read16(uint16_t& v)
	{
		if(!Have(2))
			return false;
		v = ReadLE16(m_data + m_offset);
		m_offset += 2;
		return true;
	}

	bool Read64(uint64_t& v)
	{
		if(!Have(8))
			return false;
		v = ReadLE64(m_data + m_offset);
		m_offset += 8;
		return true;
	}

	bool ReadFloat(float& v)
	{
		if(!Have(4))
			return false;
		uint32_t tmp = ReadLE32(m_data + m_offset);
		memcpy(&v, &tmp, sizeof(v));
		m_offset += 4;
		return true;
	}

	bool ReadDouble(double& v)
	{
		uint64_t tmp;
		if(!Read64(tmp))
			return false;
		memcpy(&v, &tmp, sizeof(v));
		return true;
	}

	bool ReadString(string& str)
	{
		uint16_t len;
		if(!Read16(len) || !Have(len))
			return false;
		str.assign(reinterpret_cast<const char*>(m_data + m_offset), len);
		m_offset += len;
		return true;
	}

	bool AtEnd() const
	{ return m_offset == m_len; }

protected:
	bool Have(size_t n) const
	{ return (m_len - m_offset) >= n; }

	const uint8_t* m_data;
	size_t m_len;
	size_t m_offset;
};

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Channel masks

///@brief Bitmask of the active physical channels
uint8_t LIFileHeader::GetChannelMask() const
{
	uint8_t mask = 0;
	for(auto ch : m_channels)
	{
		if(ch > 7)
			throw FormatError(string("Channel ") + to_string(ch) + " doesn't fit in a channel mask");
		mask |= (1 << ch);
	}
	return mask;
}

vector<size_t> LIFileHeader::ChannelsFromMask(uint8_t mask)
{
	vector<size_t> ret;
	for(size_t i=0; i<8; i++)
	{
		if(mask & (1 << i))
			ret.push_back(i);
	}
	return ret;
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Serialization

void LIFileHeader::AppendString(vector<uint8_t>& buf, const string& str, const char* what)
{
	if(str.length() > 0xffff)
		throw FormatError(string(what) + " is too long (" + to_string(str.length()) + " bytes, max 65535)");
	AppendLE16(buf, str.length());
	buf.insert(buf.end(), str.begin(), str.end());
}

/**
	@brief Serializes the header, including magic, version and length

	@throws FormatError if a string or the whole header is too long for its length field, or if a legacy header
	is asked for with channels that aren't numbered 0...n-1
 */
vector<uint8_t> LIFileHeader::Serialize(Revision rev) const
{
	size_t nchans = m_channels.size();
	if(m_calibration.size() < nchans)
	{
		LogWarning("Header has %zu calibration coefficients for %zu channels, writing zero for the rest\n",
			m_calibration.size(), nchans);
	}

	vector<uint8_t> body;
	if(rev == REV_LEGACY)
	{
		for(size_t i=0; i<nchans; i++)
		{
			if(m_channels[i] != i)
				throw FormatError("Legacy LI headers can only describe channels 0...n-1");
		}
		body.push_back(nchans);
	}
	else
		body.push_back(GetChannelMask());

	body.push_back(m_instrument);
	AppendLE16(body, m_instrumentVersion);

	if(rev == REV_LEGACY)
	{
		float ts = m_timestep;
		uint32_t tmp;
		memcpy(&tmp, &ts, sizeof(tmp));
		AppendLE32(body, tmp);
	}
	else
	{
		uint64_t tmp;
		memcpy(&tmp, &m_timestep, sizeof(tmp));
		AppendLE64(body, tmp);
	}

	AppendLE64(body, m_startTime);

	for(size_t i=0; i<nchans; i++)
	{
		double cal = GetCalibration(i);
		uint64_t tmp;
		memcpy(&tmp, &cal, sizeof(tmp));
		AppendLE64(body, tmp);
	}

	AppendString(body, m_layout, "Binary layout");

	if(rev == REV_LEGACY)
	{
		//One expression for everything if they're all the same, otherwise a '|' separated list
		bool same = true;
		for(size_t i=1; i<nchans; i++)
		{
			if(GetProcessing(i) != GetProcessing(0))
				same = false;
		}

		string proc;
		if(same)
			proc = GetProcessing(0);
		else
		{
			for(size_t i=0; i<nchans; i++)
			{
				if(i > 0)
					proc += "|";
				proc += GetProcessing(i);
			}
		}
		AppendString(body, proc, "Processing string");
	}
	else
	{
		for(size_t i=0; i<nchans; i++)
			AppendString(body, GetProcessing(i), "Processing string");
	}

	AppendString(body, m_csvFormat, "CSV format");
	AppendString(body, m_csvHeader, "CSV header");

	if(body.size() > 0xffff)
		throw FormatError(string("LI header is too long (") + to_string(body.size()) + " bytes, max 65535)");

	vector<uint8_t> ret(LI_MAGIC, LI_MAGIC + 2);
	ret.push_back(LI_VERSION);
	AppendLE16(ret, body.size());
	ret.insert(ret.end(), body.begin(), body.end());
	return ret;
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Parsing

/**
	@brief Parses a header body (everything after the length field)

	@param data		Header body
	@param len		Declared header length

	@throws CorruptFileError if neither revision consumes exactly len bytes
 */
LIFileHeader LIFileHeader::Parse(const uint8_t* data, size_t len)
{
	LIFileHeader ret;
	if(TryParse(data, len, REV_CURRENT, ret))
		return ret;
	if(TryParse(data, len, REV_LEGACY, ret))
		return ret;

	throw CorruptFileError(string("Header content doesn't match its declared length of ") + to_string(len) + " bytes");
}

/**
	@brief Attempts to parse a header body as one revision

	@return True if every field was read and exactly len bytes were consumed
 */
bool LIFileHeader::TryParse(const uint8_t* data, size_t len, Revision rev, LIFileHeader& out)
{
	HeaderCursor cur(data, len);
	LIFileHeader hdr;
	hdr.m_revision = rev;

	uint8_t chans;
	if(!cur.Read8(chans))
		return false;
	if(rev == REV_LEGACY)
	{
		for(size_t i=0; i<chans; i++)
			hdr.m_channels.push_back(i);
	}
	else
		hdr.m_channels = ChannelsFromMask(chans);

	if(!cur.Read8(hdr.m_instrument) || !cur.Read16(hdr.m_instrumentVersion))
		return false;

	if(rev == REV_LEGACY)
	{
		float ts;
		if(!cur.ReadFloat(ts))
			return false;
		hdr.m_timestep = ts;
	}
	else if(!cur.ReadDouble(hdr.m_timestep))
		return false;

	if(!cur.Read64(hdr.m_startTime))
		return false;

	for(size_t i=0; i<hdr.m_channels.size(); i++)
	{
		double cal;
		if(!cur.ReadDouble(cal))
			return false;
		hdr.m_calibration.push_back(cal);
	}

	if(!cur.ReadString(hdr.m_layout))
		return false;

	if(rev == REV_LEGACY)
	{
		string proc;
		if(!cur.ReadString(proc))
			return false;
		if(proc.find('|') != string::npos)
			hdr.m_processing = split(proc, '|');
		else
			hdr.m_processing.push_back(proc);
	}
	else
	{
		for(size_t i=0; i<hdr.m_channels.size(); i++)
		{
			string proc;
			if(!cur.ReadString(proc))
				return false;
			hdr.m_processing.push_back(proc);
		}
	}

	if(!cur.ReadString(hdr.m_csvFormat) || !cur.ReadString(hdr.m_csvHeader))
		return false;

	if(!cur.AtEnd())
		return false;

	out = hdr;
	return true;
}

/**
	@brief Prints the header fields at debug level
 */
void LIFileHeader::LogSummary() const
{
	LogDebug("Header revision:      %s\n", (m_revision == REV_LEGACY) ? "legacy" : "current");
	LogDebug("Instrument:           %d\n", m_instrument);
	LogDebug("Instrument version:   %d\n", m_instrumentVersion);
	LogDebug("Channels:             %zu\n", m_channels.size());
	{
		LogIndenter li;
		for(size_t i=0; i<m_channels.size(); i++)
		{
			LogDebug("Channel %zu: calibration %g, processing \"%s\"\n",
				m_channels[i], GetCalibration(i), GetProcessing(i).c_str());
		}
	}
	LogDebug("Timestep:             %g s\n", m_timestep);
	LogDebug("Start time:           %" PRIu64 "\n", m_startTime);
	LogDebug("Binary layout:        %s\n", m_layout.c_str());
	LogDebug("CSV format:           %s\n", m_csvFormat.c_str());
}
