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
	@brief Declaration of CaptureConfig
 */

#ifndef CaptureConfig_h
#define CaptureConfig_h

/**
	@brief Description of one capture session: what the instrument sends and how to turn it into CSV.

	This is everything an LI file header carries, and is stored on disk as YAML:

	@code
	capture:
	  instrument: 1
	  instrument_version: 1
	  channels: [0, 1]
	  timestep: 0.001
	  start_time: 1600000000
	  calibration: [1.0, 1.0]
	format:
	  binary_layout: "<s24:p8"
	  processing: ["*C", "*C"]
	  csv_format: "{t},{ch1},{ch2}\r\n"
	  csv_header: "Time,Channel 1,Channel 2\r\n"
	@endcode

	Channels are physical channel numbers (0-7).
 */
class CaptureConfig
{
public:
	CaptureConfig();
	virtual ~CaptureConfig();

	bool Load(const std::string& path);
	bool Load(const YAML::Node& node);
	bool Save(const std::string& path) const;

	YAML::Node SerializeConfiguration() const;

	size_t GetChannelCount() const
	{ return m_channels.size(); }

	std::string GetProcessing(size_t slot) const;
	double GetCalibration(size_t slot) const;

	std::vector<std::string> GetColumnHeaders() const;

	///@brief Instrument type identifier
	uint8_t m_instrument;

	///@brief Instrument firmware / hardware version
	uint16_t m_instrumentVersion;

	///@brief Physical channel numbers of the active channels, in ascending order
	std::vector<size_t> m_channels;

	///@brief Time between samples, in seconds
	double m_timestep;

	///@brief Capture start time (Unix timestamp)
	uint64_t m_startTime;

	///@brief Calibration coefficient of each active channel
	std::vector<double> m_calibration;

	std::string m_layout;

	///@brief Processing expression of each active channel (a single entry applies to all of them)
	std::vector<std::string> m_processing;

	std::string m_csvFormat;
	std::string m_csvHeader;

protected:
	bool LoadSettings(const YAML::Node& node);
};

#endif
