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
	@brief Declaration of LIFileHeader
 */

#ifndef LIFileHeader_h
#define LIFileHeader_h

///@brief Magic number at the start of every LI file
#define LI_MAGIC "LI"

///@brief Version byte following the magic number
#define LI_VERSION '1'

///@brief Length of magic, version and header length fields
#define LI_PREAMBLE_LENGTH 5

/**
	@brief Header of an LI capture file.

	On disk the file starts with "LI1" and a little endian u16 giving the length of the header body that follows.
	Two revisions of the body exist, told apart by which one consumes exactly the declared length:

	REV_LEGACY:  u8 channel count, u8 instrument, u16 instrument version, f32 timestep, u64 start time,
	             f64 calibration[count], then length-prefixed layout, processing, CSV format and CSV header strings.
	             The single processing string may hold per-channel expressions separated by '|'.

	REV_CURRENT: u8 channel bitmask, u8 instrument, u16 instrument version, f64 timestep, u64 start time,
	             f64 calibration[popcount], layout, one processing string per active channel, CSV format and header.

	All strings are prefixed with a little endian u16 length.
 */
class LIFileHeader : public CaptureConfig
{
public:

	enum Revision
	{
		REV_LEGACY,
		REV_CURRENT
	};

	LIFileHeader()
		: m_revision(REV_CURRENT)
	{}

	explicit LIFileHeader(const CaptureConfig& config)
		: CaptureConfig(config)
		, m_revision(REV_CURRENT)
	{}

	std::vector<uint8_t> Serialize(Revision rev = REV_CURRENT) const;
	static LIFileHeader Parse(const uint8_t* data, size_t len);

	uint8_t GetChannelMask() const;
	static std::vector<size_t> ChannelsFromMask(uint8_t mask);

	void LogSummary() const;

	///@brief Revision the header was read as
	Revision m_revision;

protected:
	static bool TryParse(const uint8_t* data, size_t len, Revision rev, LIFileHeader& out);
	static void AppendString(std::vector<uint8_t>& buf, const std::string& str, const char* what);
};

#endif
