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
	@brief Implementation of LIFileWriter
 */

#include "lidata.h"

using namespace std;

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Construction / destruction

LIFileWriter::LIFileWriter()
	: m_fp(NULL)
{
}

LIFileWriter::~LIFileWriter()
{
	Finalize();
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// File creation

/**
	@brief Creates the file and writes the header

	@return True on success, false if the file couldn't be created or written

	@throws FormatError if the header can't be serialized
 */
bool LIFileWriter::Create(const string& path, const LIFileHeader& header, LIFileHeader::Revision rev)
{
	Finalize();

	//Serialize first so a bad header doesn't leave an empty file behind
	auto bytes = header.Serialize(rev);

	m_fp = fopen(path.c_str(), "wb");
	if(!m_fp)
	{
		LogError("Failed to create LI file \"%s\"\n", path.c_str());
		return false;
	}
	m_path = path;
	m_channels = header.m_channels;

	if(bytes.size() != fwrite(&bytes[0], 1, bytes.size(), m_fp))
	{
		LogError("Failed to write header to \"%s\"\n", path.c_str());
		Finalize();
		return false;
	}

	LogTrace("Created \"%s\" (%zu byte header)\n", path.c_str(), bytes.size());
	return true;
}

/**
	@brief Creates the file from individual header fields

	@param path					Output file
	@param instrument			Instrument type identifier
	@param instrumentVersion	Instrument version
	@param channelFlags			Bitmask of active physical channels
	@param layout				Binary layout string
	@param processing			Processing expression of each active channel
	@param csvFormat			CSV row template
	@param csvHeader			CSV header template
	@param calibration			Calibration coefficient of each active channel
	@param timestep				Time between samples, in seconds
	@param startTime			Capture start time (Unix timestamp)
 */
bool LIFileWriter::Create(
	const string& path,
	uint8_t instrument,
	uint16_t instrumentVersion,
	uint8_t channelFlags,
	const string& layout,
	const vector<string>& processing,
	const string& csvFormat,
	const string& csvHeader,
	const vector<double>& calibration,
	double timestep,
	uint64_t startTime)
{
	LIFileHeader header;
	header.m_instrument = instrument;
	header.m_instrumentVersion = instrumentVersion;
	header.m_channels = LIFileHeader::ChannelsFromMask(channelFlags);
	header.m_layout = layout;
	header.m_processing = processing;
	header.m_csvFormat = csvFormat;
	header.m_csvHeader = csvHeader;
	header.m_calibration = calibration;
	header.m_timestep = timestep;
	header.m_startTime = startTime;
	return Create(path, header);
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Data

/**
	@brief Appends raw data for one channel, split into chunks of at most 65535 bytes

	@return True on success, false if the file isn't open or the write failed

	@throws FormatError if the channel wasn't declared in the header
 */
bool LIFileWriter::Append(const uint8_t* data, size_t len, size_t channel)
{
	if(!m_fp)
	{
		LogError("Can't append to an LI file that isn't open\n");
		return false;
	}

	if(find(m_channels.begin(), m_channels.end(), channel) == m_channels.end())
		throw FormatError(string("Channel ") + to_string(channel) + " isn't declared in the file header");

	size_t offset = 0;
	while(offset < len)
	{
		size_t chunklen = min(len - offset, static_cast<size_t>(0xffff));

		vector<uint8_t> chunkhdr;
		chunkhdr.push_back(channel);
		AppendLE16(chunkhdr, chunklen);

		if( (chunkhdr.size() != fwrite(&chunkhdr[0], 1, chunkhdr.size(), m_fp)) ||
			(chunklen != fwrite(data + offset, 1, chunklen, m_fp)) )
		{
			LogError("Failed to write %zu bytes to \"%s\"\n", chunklen, m_path.c_str());
			return false;
		}

		offset += chunklen;
	}
	return true;
}

/**
	@brief Flushes and closes the file. Does nothing if it's already closed.
 */
void LIFileWriter::Finalize()
{
	if(!m_fp)
		return;

	if(fclose(m_fp) != 0)
		LogError("Error closing \"%s\", data may have been lost\n", m_path.c_str());
	m_fp = NULL;
}
