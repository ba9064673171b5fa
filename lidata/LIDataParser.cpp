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
	@brief Implementation of LIDataParser
 */

#include "lidata.h"

using namespace std;

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Construction / destruction

/**
	@brief Creates a parser

	The rendered CSV header is placed at the start of the output buffer.

	@param channels		Physical channel numbers of the active channels
	@param layout		Binary layout string
	@param processing	Processing expression of each channel (a single entry applies to every channel)
	@param csvFormat	Row template
	@param csvHeader	Header template
	@param timestep		Time between samples, in seconds
	@param startTime	Capture start time (Unix timestamp)
	@param calibration	Calibration coefficient of each channel (missing entries are zero)

	@throws FormatError if the layout, a processing expression, or a template is invalid
 */
LIDataParser::LIDataParser(
	const vector<size_t>& channels,
	const string& layout,
	const vector<string>& processing,
	const string& csvFormat,
	const string& csvHeader,
	double timestep,
	uint64_t startTime,
	const vector<double>& calibration)
	: m_channels(channels)
	, m_renderer(csvFormat, timestep, startTime, channels)
{
	Init(layout, processing, calibration);
	m_renderer.AppendOutput(CSVRenderer::FormatHeader(csvHeader, startTime, timestep));
}

LIDataParser::LIDataParser(const CaptureConfig& config)
	: m_channels(config.m_channels)
	, m_renderer(config.m_csvFormat, config.m_timestep, config.m_startTime, config.m_channels)
{
	Init(config.m_layout, config.m_processing, config.m_calibration);
	m_renderer.AppendOutput(CSVRenderer::FormatHeader(config.m_csvHeader, config.m_startTime, config.m_timestep));
}

LIDataParser::~LIDataParser()
{
}

void LIDataParser::Init(const string& layout, const vector<string>& processing, const vector<double>& calibration)
{
	m_layout = BinaryLayout::Parse(layout);

	if( (processing.size() > 1) && (processing.size() != m_channels.size()) )
	{
		LogWarning("Got %zu processing expressions for %zu channels\n",
			processing.size(), m_channels.size());
	}
	if(calibration.size() < m_channels.size())
	{
		LogWarning("Got %zu calibration coefficients for %zu channels, using zero for the rest\n",
			calibration.size(), m_channels.size());
	}

	for(size_t i=0; i<m_channels.size(); i++)
	{
		string proc;
		if(processing.size() == 1)
			proc = processing[0];
		else if(i < processing.size())
			proc = processing[i];
		double cal = (i < calibration.size()) ? calibration[i] : 0;

		auto expr = ProcessingExpression::Parse(proc, cal);
		expr.Validate(m_layout);
		m_expressions.push_back(expr);

		m_processed.push_back(deque<ProcessedRecord>());
		m_mutexes.push_back(make_unique<mutex>());
	}

	m_decoder = make_unique<BitstreamDecoder>(m_layout, m_channels.size());
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Channel lookup

bool LIDataParser::HasChannel(size_t channel) const
{
	for(auto ch : m_channels)
	{
		if(ch == channel)
			return true;
	}
	return false;
}

/**
	@brief Maps a physical channel number to its slot index

	@throws CorruptFileError if the channel isn't active
 */
size_t LIDataParser::GetSlot(size_t channel) const
{
	for(size_t i=0; i<m_channels.size(); i++)
	{
		if(m_channels[i] == channel)
			return i;
	}
	throw CorruptFileError(string("Data for channel ") + to_string(channel) + ", which isn't active");
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Decoding

/**
	@brief Decodes new data for a channel and queues the processed records
 */
void LIDataParser::Parse(const uint8_t* data, size_t len, size_t channel)
{
	size_t slot = GetSlot(channel);
	m_decoder->Feed(data, len, slot);
	auto raw = m_decoder->TakeRecords(slot);

	lock_guard<mutex> lock(*m_mutexes[slot]);
	for(auto& r : raw)
		m_processed[slot].push_back(RecordProcessor::ProcessRecord(r, m_expressions[slot]));
}

/**
	@brief Changes the calibration coefficient of a channel, for records decoded from now on
 */
void LIDataParser::SetCoefficient(size_t channel, double calibration)
{
	size_t slot = GetSlot(channel);
	lock_guard<mutex> lock(*m_mutexes[slot]);
	m_expressions[slot].SetCoefficient(calibration);
}

ProcessingExpression LIDataParser::GetExpression(size_t channel)
{
	size_t slot = GetSlot(channel);
	lock_guard<mutex> lock(*m_mutexes[slot]);
	return m_expressions[slot];
}

/**
	@brief Discards buffered bits and queued records of every channel
 */
void LIDataParser::Reset()
{
	for(size_t i=0; i<m_channels.size(); i++)
	{
		m_decoder->Reset(i);
		m_decoder->TakeRecords(i);

		lock_guard<mutex> lock(*m_mutexes[i]);
		m_processed[i].clear();
	}
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Processed record queues

///@brief Returns a copy of the records queued for a channel
vector<ProcessedRecord> LIDataParser::GetProcessed(size_t channel)
{
	size_t slot = GetSlot(channel);
	lock_guard<mutex> lock(*m_mutexes[slot]);
	return vector<ProcessedRecord>(m_processed[slot].begin(), m_processed[slot].end());
}

///@brief Removes and returns every record queued for a channel
vector<ProcessedRecord> LIDataParser::TakeProcessed(size_t channel)
{
	size_t slot = GetSlot(channel);
	lock_guard<mutex> lock(*m_mutexes[slot]);
	vector<ProcessedRecord> ret(m_processed[slot].begin(), m_processed[slot].end());
	m_processed[slot].clear();
	return ret;
}

size_t LIDataParser::GetPendingCount(size_t channel)
{
	size_t slot = GetSlot(channel);
	lock_guard<mutex> lock(*m_mutexes[slot]);
	return m_processed[slot].size();
}

///@brief Number of complete time-aligned rows available (zero if there are no channels)
size_t LIDataParser::GetMinPendingCount()
{
	if(m_channels.empty())
		return 0;

	size_t ret = SIZE_MAX;
	for(size_t i=0; i<m_channels.size(); i++)
	{
		lock_guard<mutex> lock(*m_mutexes[i]);
		ret = min(ret, m_processed[i].size());
	}
	return ret;
}

optional<ProcessedRecord> LIDataParser::PopRecord(size_t channel)
{
	size_t slot = GetSlot(channel);
	lock_guard<mutex> lock(*m_mutexes[slot]);
	if(m_processed[slot].empty())
		return nullopt;

	auto ret = m_processed[slot].front();
	m_processed[slot].pop_front();
	return ret;
}

///@brief Discards every queued record
void LIDataParser::ClearProcessed()
{
	for(size_t i=0; i<m_channels.size(); i++)
	{
		lock_guard<mutex> lock(*m_mutexes[i]);
		m_processed[i].clear();
	}
}

///@brief Discards up to n records from the front of every channel's queue
void LIDataParser::ClearProcessed(size_t n)
{
	for(size_t i=0; i<m_channels.size(); i++)
	{
		lock_guard<mutex> lock(*m_mutexes[i]);
		auto& q = m_processed[i];
		q.erase(q.begin(), q.begin() + min(n, q.size()));
	}
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// CSV output

/**
	@brief Renders every complete time-aligned row into the CSV buffer

	@return Number of rows rendered
 */
size_t LIDataParser::FormatRecords()
{
	vector< unique_lock<mutex> > locks;
	for(auto& m : m_mutexes)
		locks.emplace_back(*m);

	return m_renderer.FormatRows(m_processed);
}

/**
	@brief Appends the CSV buffer to a file and clears it

	@return True on success, false if the file couldn't be written
 */
bool LIDataParser::DumpCSV(const string& path)
{
	return m_renderer.DumpCSV(path);
}

///@brief Returns the CSV buffer and clears it
string LIDataParser::TakeCSV()
{
	return m_renderer.TakeOutput();
}
