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
	@brief Implementation of CSVRenderer
 */

#include "lidata.h"

using namespace std;

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Construction / destruction

/**
	@brief Creates a renderer

	@param rowTemplate	Template for one CSV row (parsed immediately, so FormatError is thrown here)
	@param timestep		Time between samples, in seconds
	@param startTime	Capture start time (Unix timestamp)
	@param channels		Physical channel number of each processed record queue
 */
CSVRenderer::CSVRenderer(
	const string& rowTemplate,
	double timestep,
	uint64_t startTime,
	const vector<size_t>& channels)
	: m_rowTemplate(rowTemplate)
	, m_timestep(timestep)
	, m_startString(FormatStartTime(startTime))
	, m_channels(channels)
	, m_rowCount(0)
{
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Formatting

/**
	@brief Converts a Unix timestamp to the local date and time representation
 */
string CSVRenderer::FormatStartTime(uint64_t startTime)
{
	time_t t = static_cast<time_t>(startTime);
	struct tm now;
	if(!localtime_r(&t, &now))
	{
		LogWarning("Couldn't convert start time %" PRIu64 " to local time\n", startTime);
		return to_string(startTime);
	}

	char buf[128];
	if(strftime(buf, sizeof(buf), "%c", &now) == 0)
		return to_string(startTime);
	return buf;
}

/**
	@brief Renders the header block written at the top of a CSV file
 */
string CSVRenderer::FormatHeader(const string& headerTemplate, uint64_t startTime, double timestep)
{
	FormatTemplate tmpl(headerTemplate);

	FormatArgs args;
	args.Set("T", FormatStartTime(startTime));
	args.Set("d", RecordValue::FromFloat(timestep));
	args.Set("t", RecordValue::FromSigned(0));
	args.Set("n", RecordValue::FromSigned(0));
	return tmpl.Render(args);
}

/**
	@brief Renders as many time-aligned rows as every queue has records for

	Consumed records are removed from the front of each queue; leftovers stay for the next call.

	@param queues	Processed records, one queue per channel slot (same order as the constructor's channel list)

	@return Number of rows rendered
 */
size_t CSVRenderer::FormatRows(vector< deque<ProcessedRecord> >& queues)
{
	if(queues.size() != m_channels.size())
	{
		throw FormatError(
			string("CSVRenderer: got ") + to_string(queues.size()) + " queues for " +
			to_string(m_channels.size()) + " channels");
	}
	if(queues.empty())
		return 0;

	size_t nrows = queues[0].size();
	for(auto& q : queues)
		nrows = min(nrows, q.size());

	FormatArgs args;
	args.Set("T", m_startString);
	args.Set("d", RecordValue::FromFloat(m_timestep));

	for(size_t i=0; i<nrows; i++)
	{
		m_rowCount ++;
		args.Set("n", RecordValue::FromSigned(m_rowCount));
		args.Set("t", RecordValue::FromFloat((m_rowCount - 1) * m_timestep));

		for(size_t slot=0; slot<queues.size(); slot++)
		{
			args.Set(string("ch") + to_string(m_channels[slot] + 1), queues[slot].front());
			queues[slot].pop_front();
		}

		m_output += m_rowTemplate.Render(args);
	}
	return nrows;
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Output

/**
	@brief Returns the rendered text and clears the buffer
 */
string CSVRenderer::TakeOutput()
{
	string ret;
	ret.swap(m_output);
	return ret;
}

/**
	@brief Appends the rendered text to a file and clears the buffer

	@return True on success, false if the file couldn't be written (buffer is kept)
 */
bool CSVRenderer::DumpCSV(const string& path)
{
	FILE* fp = fopen(path.c_str(), "ab");
	if(!fp)
	{
		LogError("Failed to open file \"%s\" for writing\n", path.c_str());
		return false;
	}

	bool ok = (fwrite(m_output.c_str(), 1, m_output.length(), fp) == m_output.length());
	if(fclose(fp) != 0)
		ok = false;

	if(!ok)
	{
		LogError("Failed to write %zu bytes to \"%s\"\n", m_output.length(), path.c_str());
		return false;
	}

	m_output.clear();
	return true;
}
