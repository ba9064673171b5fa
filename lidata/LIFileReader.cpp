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
	@brief Implementation of LIFileReader
 */

#include "lidata.h"

using namespace std;

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Construction / destruction

LIFileReader::LIFileReader()
	: m_fp(NULL)
{
}

LIFileReader::~LIFileReader()
{
	Close();
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Opening and closing

/**
	@brief Opens a file and parses its header

	@return False if the file couldn't be opened

	@throws CorruptFileError if the magic number is wrong or the header is damaged
	@throws UnsupportedVersionError if the version byte isn't one we know
	@throws FormatError if the layout, a processing expression or a template in the header is invalid
 */
bool LIFileReader::Open(const string& path)
{
	Close();

	LogDebug("Reading LI file %s\n", path.c_str());
	LogIndenter li;

	m_fp = fopen(path.c_str(), "rb");
	if(!m_fp)
	{
		LogError("Couldn't open LI file \"%s\"\n", path.c_str());
		return false;
	}
	m_path = path;

	try
	{
		uint8_t preamble[LI_PREAMBLE_LENGTH];
		size_t len = fread(preamble, 1, sizeof(preamble), m_fp);
		if( (len < 2) || (memcmp(preamble, LI_MAGIC, 2) != 0) )
			throw CorruptFileError(string("\"") + path + "\" is not an LI file (bad magic number)");
		if(len < 3)
			throw CorruptFileError("File ends before the version number");
		if(preamble[2] != LI_VERSION)
			throw UnsupportedVersionError(string("Don't know how to read LI file version ") + to_string(preamble[2]));
		if(len < LI_PREAMBLE_LENGTH)
			throw CorruptFileError("File ends before the header length");

		uint16_t hdrlen = ReadLE16(preamble + 3);
		LogDebug("Header length:        %d bytes\n", hdrlen);

		vector<uint8_t> body(hdrlen);
		if(hdrlen != fread(body.data(), 1, hdrlen, m_fp))
			throw CorruptFileError("File ends inside the header");

		m_header = LIFileHeader::Parse(body.data(), hdrlen);
		m_header.LogSummary();

		m_columnHeaders = m_header.GetColumnHeaders();
		m_parser = make_unique<LIDataParser>(m_header);
	}
	catch(const LIDataException&)
	{
		Close();
		throw;
	}

	return true;
}

/**
	@brief Closes the file. Partially decoded records are discarded.
 */
void LIFileReader::Close()
{
	m_parser.reset();
	if(m_fp)
	{
		fclose(m_fp);
		m_fp = NULL;
	}
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Data

/**
	@brief Reads the next chunk and feeds it to the parser

	@return Physical channel of the chunk, or nothing at end of file

	@throws CorruptFileError if the chunk is truncated or belongs to an inactive channel
 */
optional<size_t> LIFileReader::ReadChunk()
{
	if(!m_fp)
		return nullopt;

	uint8_t hdr[3];
	size_t len = fread(hdr, 1, sizeof(hdr), m_fp);
	if(len == 0)
		return nullopt;
	if(len != sizeof(hdr))
		throw CorruptFileError("File ends inside a chunk header");

	size_t channel = hdr[0];
	uint16_t chunklen = ReadLE16(hdr + 1);

	vector<uint8_t> payload(chunklen);
	if(chunklen != fread(payload.data(), 1, chunklen, m_fp))
	{
		throw CorruptFileError(
			string("Chunk for channel ") + to_string(channel) + " claims " + to_string(chunklen) +
			" bytes but the file ends first");
	}

	m_parser->Parse(payload, channel);
	return channel;
}

/**
	@brief Reads one time-aligned record for every active channel

	@return The records in channel order, or nothing once the file is exhausted. Samples of channels without a
	matching sample in every other channel at end of file are dropped.
 */
optional< vector<ProcessedRecord> > LIFileReader::ReadRecord()
{
	if(!m_parser || m_header.m_channels.empty())
		return nullopt;

	while(m_parser->GetMinPendingCount() == 0)
	{
		if(!ReadChunk())
			return nullopt;
	}

	vector<ProcessedRecord> ret;
	for(auto ch : m_header.m_channels)
		ret.push_back(*m_parser->PopRecord(ch));
	return ret;
}

vector< vector<ProcessedRecord> > LIFileReader::ReadAll()
{
	vector< vector<ProcessedRecord> > ret;
	while(true)
	{
		auto rec = ReadRecord();
		if(!rec)
			break;
		ret.push_back(*rec);
	}
	return ret;
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// CSV conversion

/**
	@brief Converts the rest of the file to CSV, replacing any existing output file

	Rows are rendered and written after every chunk so memory use stays bounded.

	@return True on success, false if the output couldn't be written
 */
bool LIFileReader::ToCSV(const string& path)
{
	if(!m_parser)
	{
		LogError("No LI file open\n");
		return false;
	}

	if( (remove(path.c_str()) != 0) && (errno != ENOENT) )
	{
		LogError("Couldn't remove old output file \"%s\"\n", path.c_str());
		return false;
	}

	//Header (plus anything already decoded)
	m_parser->FormatRecords();
	if(!m_parser->DumpCSV(path))
		return false;

	while(ReadChunk())
	{
		m_parser->FormatRecords();
		if(!m_parser->DumpCSV(path))
			return false;
	}

	return true;
}

/**
	@brief Converts an LI file to CSV

	@return True on success, false if either file couldn't be opened or written
 */
bool LIFileReader::ConvertToCSV(const string& inpath, const string& outpath)
{
	LIFileReader reader;
	if(!reader.Open(inpath))
		return false;
	return reader.ToCSV(outpath);
}
