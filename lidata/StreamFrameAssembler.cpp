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
	@brief Implementation of StreamFrameAssembler
 */

#include "lidata.h"

using namespace std;

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Construction / destruction

/**
	@brief Creates an assembler for a capture

	@throws FormatError if the layout or a processing expression in the config is invalid
 */
StreamFrameAssembler::StreamFrameAssembler(const CaptureConfig& config)
	: m_parser(config)
{
}

StreamFrameAssembler::~StreamFrameAssembler()
{
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Frame processing

/**
	@brief Decodes one frame

	@throws StreamEndedException if the frame is the end of stream marker
	@throws FormatError if the frame is for a channel that isn't part of the capture
 */
StreamSamples StreamFrameAssembler::ProcessFrame(const StreamFrame& frame)
{
	if(frame.IsEndOfStream())
	{
		LogDebug("End of stream \"%s\"\n", frame.m_tag.c_str());
		throw StreamEndedException(string("Data stream \"") + frame.m_tag + "\" complete");
	}

	size_t physical = frame.m_channel - 1;
	if(!m_parser.HasChannel(physical))
	{
		throw FormatError(
			string("Stream frame for channel ") + to_string(frame.m_channel) + ", which isn't being captured");
	}

	m_parser.SetCoefficient(physical, frame.m_calibration);
	m_parser.Parse(frame.m_payload, physical);

	StreamSamples ret;
	ret.m_channel = frame.m_channel;
	ret.m_startIndex = frame.m_startIndex;
	ret.m_samples = m_parser.TakeProcessed(physical);

	m_sampleCounts[frame.m_channel] += ret.m_samples.size();

	LogTrace("Frame \"%s\": channel %d, index %" PRIu64 ", %zu bytes, %zu samples\n",
		frame.m_tag.c_str(),
		frame.m_channel,
		frame.m_startIndex,
		frame.m_payload.size(),
		ret.m_samples.size());

	m_samplesReadySignal.emit(ret);
	return ret;
}

/**
	@brief Waits for the next frame on a queue and decodes it

	@throws StreamTimeoutException if no frame arrives within timeoutMs
	@throws StreamEndedException if the frame is the end of stream marker
 */
StreamSamples StreamFrameAssembler::GetSamples(StreamFrameQueue& queue, unsigned int timeoutMs)
{
	auto frame = queue.Pop(timeoutMs);
	if(!frame)
		throw StreamTimeoutException(string("No stream data received within ") + to_string(timeoutMs) + " ms");
	return ProcessFrame(*frame);
}

///@brief Number of samples decoded so far for a 1-based channel number
uint64_t StreamFrameAssembler::GetSampleCount(int channel)
{
	auto it = m_sampleCounts.find(channel);
	if(it == m_sampleCounts.end())
		return 0;
	return it->second;
}
