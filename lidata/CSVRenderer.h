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
	@brief Declaration of CSVRenderer
 */

#ifndef CSVRenderer_h
#define CSVRenderer_h

/**
	@brief Renders processed records as CSV text using a pair of format templates.

	Header templates may use {T} (capture start date, local time), {d} (time step), {t} and {n} (both zero).
	Row templates may use {n} (1-based row number), {t} (time of the row, starting at zero), {d}, {T}, and
	{ch1} .. {ch8} for the record of each physical channel.

	Output accumulates in memory until it is written out with DumpCSV() or pulled with TakeOutput().
 */
class CSVRenderer
{
public:
	CSVRenderer(
		const std::string& rowTemplate,
		double timestep,
		uint64_t startTime,
		const std::vector<size_t>& channels);

	static std::string FormatHeader(const std::string& headerTemplate, uint64_t startTime, double timestep);
	static std::string FormatStartTime(uint64_t startTime);

	size_t FormatRows(std::vector< std::deque<ProcessedRecord> >& queues);

	void AppendOutput(const std::string& text)
	{ m_output += text; }

	std::string TakeOutput();

	bool DumpCSV(const std::string& path);

	const std::string& GetOutput() const
	{ return m_output; }

	///@brief Number of rows rendered so far
	size_t GetRowCount() const
	{ return m_rowCount; }

	double GetTimestep() const
	{ return m_timestep; }

protected:
	FormatTemplate m_rowTemplate;
	double m_timestep;
	std::string m_startString;

	///@brief Physical channel number for each queue slot
	std::vector<size_t> m_channels;

	size_t m_rowCount;
	std::string m_output;
};

#endif
