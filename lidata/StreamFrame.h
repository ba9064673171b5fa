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
	@brief Declaration of StreamFrame
 */

#ifndef StreamFrame_h
#define StreamFrame_h

/**
	@brief One frame of the instrument's live network data stream.

	The frame header is a little endian u16 tag length, the tag, an i32 channel number, a u64 sample index of the
	first record in the payload, and the f64 calibration coefficient in effect. The payload is raw instrument data
	in the capture's binary layout.

	Channel numbers are 1-based physical channel numbers. A frame with a channel of zero or less marks the end of
	the stream.
 */
class StreamFrame
{
public:
	StreamFrame()
		: m_channel(0)
		, m_startIndex(0)
		, m_calibration(0)
	{}

	StreamFrame(
		const std::string& tag,
		int32_t channel,
		uint64_t startIndex,
		double calibration,
		const std::vector<uint8_t>& payload)
		: m_tag(tag)
		, m_channel(channel)
		, m_startIndex(startIndex)
		, m_calibration(calibration)
		, m_payload(payload)
	{}

	static StreamFrame Parse(const std::vector<uint8_t>& header, const std::vector<uint8_t>& payload);
	std::vector<uint8_t> SerializeHeader() const;

	static StreamFrame EndOfStream(const std::string& tag)
	{ return StreamFrame(tag, 0, 0, 0, std::vector<uint8_t>()); }

	bool IsEndOfStream() const
	{ return m_channel <= 0; }

	std::string m_tag;
	int32_t m_channel;
	uint64_t m_startIndex;
	double m_calibration;
	std::vector<uint8_t> m_payload;
};

#endif
