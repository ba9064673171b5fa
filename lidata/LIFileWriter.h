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
	@brief Declaration of LIFileWriter
 */

#ifndef LIFileWriter_h
#define LIFileWriter_h

/**
	@brief Writes an LI capture file: the header, then raw data chunks as they arrive from the instrument.

	Each chunk is a u8 physical channel number, a little endian u16 length, and the raw payload.
 */
class LIFileWriter
{
public:
	LIFileWriter();
	virtual ~LIFileWriter();

	bool Create(
		const std::string& path,
		const LIFileHeader& header,
		LIFileHeader::Revision rev = LIFileHeader::REV_CURRENT);

	bool Create(
		const std::string& path,
		uint8_t instrument,
		uint16_t instrumentVersion,
		uint8_t channelFlags,
		const std::string& layout,
		const std::vector<std::string>& processing,
		const std::string& csvFormat,
		const std::string& csvHeader,
		const std::vector<double>& calibration,
		double timestep,
		uint64_t startTime);

	bool Append(const uint8_t* data, size_t len, size_t channel);

	bool Append(const std::vector<uint8_t>& data, size_t channel)
	{ return Append(data.data(), data.size(), channel); }

	void Finalize();

	bool IsOpen() const
	{ return m_fp != NULL; }

protected:
	FILE* m_fp;
	std::string m_path;

	///@brief Physical channels declared in the header
	std::vector<size_t> m_channels;
};

#endif
