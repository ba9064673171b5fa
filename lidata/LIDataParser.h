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
	@brief Declaration of LIDataParser
 */

#ifndef LIDataParser_h
#define LIDataParser_h

class CaptureConfig;

/**
	@brief Turns raw per-channel instrument data into processed records and CSV text.

	Owns the binary layout, one processing expression per active channel, the bitstream decoder, and a queue of
	processed records per channel. Channels are addressed by physical channel number.

	Different channels may be fed from different threads; CSV rendering locks every channel.
 */
class LIDataParser
{
public:
	LIDataParser(
		const std::vector<size_t>& channels,
		const std::string& layout,
		const std::vector<std::string>& processing,
		const std::string& csvFormat,
		const std::string& csvHeader,
		double timestep,
		uint64_t startTime,
		const std::vector<double>& calibration);
	explicit LIDataParser(const CaptureConfig& config);
	virtual ~LIDataParser();

	void Parse(const uint8_t* data, size_t len, size_t channel);

	void Parse(const std::vector<uint8_t>& data, size_t channel)
	{ Parse(data.data(), data.size(), channel); }

	void SetCoefficient(size_t channel, double calibration);

	std::vector<ProcessedRecord> GetProcessed(size_t channel);
	std::vector<ProcessedRecord> TakeProcessed(size_t channel);
	size_t GetPendingCount(size_t channel);
	std::optional<ProcessedRecord> PopRecord(size_t channel);
	size_t GetMinPendingCount();

	void ClearProcessed();
	void ClearProcessed(size_t n);

	size_t FormatRecords();
	bool DumpCSV(const std::string& path);
	std::string TakeCSV();

	bool HasChannel(size_t channel) const;
	size_t GetSlot(size_t channel) const;

	const std::vector<size_t>& GetChannels() const
	{ return m_channels; }

	const BinaryLayout& GetLayout() const
	{ return m_layout; }

	ProcessingExpression GetExpression(size_t channel);

	BitstreamDecoder& GetDecoder()
	{ return *m_decoder; }

	size_t GetResyncCount(size_t channel)
	{ return m_decoder->GetResyncCount(GetSlot(channel)); }

	void Reset();

protected:
	void Init(
		const std::string& layout,
		const std::vector<std::string>& processing,
		const std::vector<double>& calibration);

	///@brief Physical channel number of each slot
	std::vector<size_t> m_channels;

	BinaryLayout m_layout;

	///@brief Processing expression of each slot
	std::vector<ProcessingExpression> m_expressions;

	std::unique_ptr<BitstreamDecoder> m_decoder;

	///@brief Processed records waiting for the consumer, one queue per slot
	std::vector< std::deque<ProcessedRecord> > m_processed;

	///@brief Lock for the expression and processed queue of each slot
	std::vector< std::unique_ptr<std::mutex> > m_mutexes;

	CSVRenderer m_renderer;
};

#endif
