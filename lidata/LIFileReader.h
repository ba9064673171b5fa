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
	@brief Declaration of LIFileReader
 */

#ifndef LIFileReader_h
#define LIFileReader_h

/**
	@brief Reads an LI capture file one time-aligned record at a time, or converts it to CSV.

	@code
	LIFileReader reader;
	if(!reader.Open("capture.li"))
		return;
	for(auto& row : reader)
		...
	@endcode
 */
class LIFileReader
{
public:
	LIFileReader();
	virtual ~LIFileReader();

	bool Open(const std::string& path);
	void Close();

	bool IsOpen() const
	{ return m_fp != NULL; }

	std::optional< std::vector<ProcessedRecord> > ReadRecord();
	std::vector< std::vector<ProcessedRecord> > ReadAll();

	bool ToCSV(const std::string& path);
	static bool ConvertToCSV(const std::string& inpath, const std::string& outpath);

	const LIFileHeader& GetHeader() const
	{ return m_header; }

	const std::vector<std::string>& GetHeaders() const
	{ return m_columnHeaders; }

	size_t GetChannelCount() const
	{ return m_header.m_channels.size(); }

	uint8_t GetInstrument() const
	{ return m_header.m_instrument; }

	uint16_t GetInstrumentVersion() const
	{ return m_header.m_instrumentVersion; }

	double GetTimestep() const
	{ return m_header.m_timestep; }

	uint64_t GetStartTime() const
	{ return m_header.m_startTime; }

	const std::vector<double>& GetCalibration() const
	{ return m_header.m_calibration; }

	/**
		@brief Input iterator over the records of a file. Advancing it reads from the file.
	 */
	class iterator
	{
	public:
		typedef std::input_iterator_tag iterator_category;
		typedef std::vector<ProcessedRecord> value_type;
		typedef ptrdiff_t difference_type;
		typedef const value_type* pointer;
		typedef const value_type& reference;

		iterator()
			: m_reader(NULL)
		{}

		explicit iterator(LIFileReader* reader)
			: m_reader(reader)
		{ Advance(); }

		reference operator*() const
		{ return m_current; }

		pointer operator->() const
		{ return &m_current; }

		iterator& operator++()
		{
			Advance();
			return *this;
		}

		bool operator==(const iterator& rhs) const
		{ return m_reader == rhs.m_reader; }

		bool operator!=(const iterator& rhs) const
		{ return m_reader != rhs.m_reader; }

	protected:
		void Advance()
		{
			auto rec = m_reader->ReadRecord();
			if(rec)
				m_current = *rec;
			else
				m_reader = NULL;
		}

		LIFileReader* m_reader;
		value_type m_current;
	};

	iterator begin()
	{ return iterator(this); }

	iterator end()
	{ return iterator(); }

protected:
	std::optional<size_t> ReadChunk();

	FILE* m_fp;
	std::string m_path;

	LIFileHeader m_header;
	std::vector<std::string> m_columnHeaders;
	std::unique_ptr<LIDataParser> m_parser;
};

#endif
