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
	@brief Declaration of StreamFrameAssembler
 */

#ifndef StreamFrameAssembler_h
#define StreamFrameAssembler_h

/**
	@brief Processed samples decoded from one stream frame
 */
class StreamSamples
{
public:
	StreamSamples()
		: m_channel(0)
		, m_startIndex(0)
	{}

	///@brief 1-based physical channel number
	int m_channel;

	///@brief Sample index of the first record in the frame
	uint64_t m_startIndex;

	std::vector<ProcessedRecord> m_samples;
};

/**
	@brief Decodes frames of the live network data stream into processed samples.

	Each frame carries the calibration coefficient in effect when it was captured, which is applied before its
	payload is decoded. Bits left over at the end of a frame carry over to the next frame of the same channel.
 */
class StreamFrameAssembler
{
public:
	explicit StreamFrameAssembler(const CaptureConfig& config);
	virtual ~StreamFrameAssembler();

	StreamSamples ProcessFrame(const StreamFrame& frame);
	StreamSamples GetSamples(StreamFrameQueue& queue, unsigned int timeoutMs);

	uint64_t GetSampleCount(int channel);

	LIDataParser& GetParser()
	{ return m_parser; }

	///@brief Signal emitted with the decoded samples of every frame
	sigc::signal<void(const StreamSamples&)> signal_samplesReady()
	{ return m_samplesReadySignal; }

protected:
	LIDataParser m_parser;

	///@brief Samples decoded so far, indexed by 1-based channel number
	std::map<int, uint64_t> m_sampleCounts;

	sigc::signal<void(const StreamSamples&)> m_samplesReadySignal;
};

#endif
