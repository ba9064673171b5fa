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
	@brief Implementation of CaptureConfig
 */

#include "lidata.h"

using namespace std;

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Construction / destruction

CaptureConfig::CaptureConfig()
	: m_instrument(0)
	, m_instrumentVersion(0)
	, m_timestep(0)
	, m_startTime(0)
{
}

CaptureConfig::~CaptureConfig()
{
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Accessors

/**
	@brief Gets the processing expression for one active channel

	A single expression applies to every channel; channels without one are left unprocessed.
 */
string CaptureConfig::GetProcessing(size_t slot) const
{
	if(m_processing.size() == 1)
		return m_processing[0];
	if(slot < m_processing.size())
		return m_processing[slot];
	return "";
}

/**
	@brief Gets the calibration coefficient for one active channel (zero if none was given)
 */
double CaptureConfig::GetCalibration(size_t slot) const
{
	if(slot < m_calibration.size())
		return m_calibration[slot];
	return 0;
}

/**
	@brief Gets the column names from the CSV header template

	These are the comma separated fields of the last non-empty line.
 */
vector<string> CaptureConfig::GetColumnHeaders() const
{
	string last;
	for(auto& line : split(m_csvHeader, '\n'))
	{
		auto trimmed = Trim(line);
		if(!trimmed.empty())
			last = trimmed;
	}

	vector<string> ret;
	if(last.empty())
		return ret;
	for(auto& col : split(last, ','))
		ret.push_back(Trim(col));
	return ret;
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Serialization

/**
	@brief Loads a configuration from a YAML file

	@return True on success, false if the file couldn't be read or is malformed
 */
bool CaptureConfig::Load(const string& path)
{
	try
	{
		auto docs = YAML::LoadAllFromFile(path);
		if(docs.empty())
		{
			LogError("Capture config \"%s\" is empty\n", path.c_str());
			return false;
		}
		if(!Load(docs[0]))
			return false;
	}
	catch(const YAML::BadFile& ex)
	{
		LogError("Unable to open capture config \"%s\"\n", path.c_str());
		return false;
	}
	catch(const YAML::Exception& ex)
	{
		LogError("Failed to parse capture config \"%s\": %s\n", path.c_str(), ex.what());
		return false;
	}

	return true;
}

/**
	@brief Loads a configuration from a YAML node

	@return True on success, false if a value is out of range or of the wrong type
 */
bool CaptureConfig::Load(const YAML::Node& node)
{
	//Clear out any previous state
	*this = CaptureConfig();

	try
	{
		if(!LoadSettings(node))
			return false;
	}
	catch(const YAML::Exception& ex)
	{
		LogError("Malformed capture config: %s\n", ex.what());
		return false;
	}

	//Sanity check
	for(size_t i=0; i<m_channels.size(); i++)
	{
		if(m_channels[i] > 7)
		{
			LogError("Channel %zu is out of range (must be 0-7)\n", m_channels[i]);
			return false;
		}
		if( (i > 0) && (m_channels[i] <= m_channels[i-1]) )
		{
			LogError("Channel list must be in ascending order without duplicates\n");
			return false;
		}
	}

	return true;
}

/**
	@brief Reads the capture and format sections of a config

	@return False if a value is out of range

	@throws YAML::Exception if a value is of the wrong type
 */
bool CaptureConfig::LoadSettings(const YAML::Node& node)
{
	auto capture = node["capture"];
	for(auto it : capture)
	{
		auto name = it.first.as<string>();
		if(name == "instrument")
		{
			auto instrument = it.second.as<unsigned int>();
			if(instrument > UINT8_MAX)
			{
				LogError("Instrument type %u is out of range (must be 0-255)\n", instrument);
				return false;
			}
			m_instrument = instrument;
		}
		else if(name == "instrument_version")
		{
			auto version = it.second.as<unsigned int>();
			if(version > UINT16_MAX)
			{
				LogError("Instrument version %u is out of range (must be 0-65535)\n", version);
				return false;
			}
			m_instrumentVersion = version;
		}
		else if(name == "timestep")
			m_timestep = it.second.as<double>();
		else if(name == "start_time")
			m_startTime = it.second.as<uint64_t>();
		else if(name == "channels")
		{
			for(auto ch : it.second)
				m_channels.push_back(ch.as<size_t>());
		}
		else if(name == "calibration")
		{
			for(auto cal : it.second)
				m_calibration.push_back(cal.as<double>());
		}
		else
			LogWarning("Unrecognized capture setting \"%s\"\n", name.c_str());
	}

	auto format = node["format"];
	for(auto it : format)
	{
		auto name = it.first.as<string>();
		if(name == "binary_layout")
			m_layout = it.second.as<string>();
		else if(name == "csv_format")
			m_csvFormat = it.second.as<string>();
		else if(name == "csv_header")
			m_csvHeader = it.second.as<string>();
		else if(name == "processing")
		{
			if(it.second.IsSequence())
			{
				for(auto p : it.second)
					m_processing.push_back(p.as<string>());
			}
			else
				m_processing.push_back(it.second.as<string>());
		}
		else
			LogWarning("Unrecognized format setting \"%s\"\n", name.c_str());
	}

	return true;
}

/**
	@brief Serializes the configuration to a YAML node
 */
YAML::Node CaptureConfig::SerializeConfiguration() const
{
	YAML::Node node;

	YAML::Node capture;
	capture["instrument"] = static_cast<unsigned int>(m_instrument);
	capture["instrument_version"] = static_cast<unsigned int>(m_instrumentVersion);
	capture["timestep"] = m_timestep;
	capture["start_time"] = m_startTime;
	for(auto ch : m_channels)
		capture["channels"].push_back(ch);
	for(auto cal : m_calibration)
		capture["calibration"].push_back(cal);
	node["capture"] = capture;

	YAML::Node format;
	format["binary_layout"] = m_layout;
	for(auto& p : m_processing)
		format["processing"].push_back(p);
	format["csv_format"] = m_csvFormat;
	format["csv_header"] = m_csvHeader;
	node["format"] = format;

	return node;
}

/**
	@brief Writes the configuration to a YAML file

	@return True on success, false if the file couldn't be written
 */
bool CaptureConfig::Save(const string& path) const
{
	YAML::Emitter out;
	out << SerializeConfiguration();

	FILE* fp = fopen(path.c_str(), "w");
	if(!fp)
	{
		LogError("Failed to open file \"%s\" for writing\n", path.c_str());
		return false;
	}

	bool ok = (fwrite(out.c_str(), 1, out.size(), fp) == out.size());
	if(fclose(fp) != 0)
		ok = false;
	if(!ok)
	{
		LogError("Failed to write capture config \"%s\"\n", path.c_str());
		return false;
	}
	return true;
}
