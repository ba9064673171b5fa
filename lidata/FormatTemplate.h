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
	@brief Declaration of FormatTemplate and FormatArgs
 */

#ifndef FormatTemplate_h
#define FormatTemplate_h

/**
	@brief Named values available to a FormatTemplate
 */
class FormatArgs
{
public:
	void Set(const std::string& name, const ProcessedRecord& rec)
	{ m_records[name] = rec; }

	void Set(const std::string& name, const RecordValue& value)
	{ m_records[name] = ProcessedRecord{value}; }

	void Set(const std::string& name, const std::string& str)
	{ m_strings[name] = str; }

	void Remove(const std::string& name)
	{
		m_records.erase(name);
		m_strings.erase(name);
	}

	const ProcessedRecord* GetRecord(const std::string& name) const
	{
		auto it = m_records.find(name);
		if(it == m_records.end())
			return NULL;
		return &it->second;
	}

	const std::string* GetString(const std::string& name) const
	{
		auto it = m_strings.find(name);
		if(it == m_strings.end())
			return NULL;
		return &it->second;
	}

protected:
	std::map<std::string, ProcessedRecord> m_records;
	std::map<std::string, std::string> m_strings;
};

/**
	@brief Parsed format specification of a single replacement field ([[fill]align][sign][#][0][width][.precision][type])
 */
class FormatSpec
{
public:
	FormatSpec()
		: m_fill(' ')
		, m_align('\0')
		, m_sign('-')
		, m_alternate(false)
		, m_width(0)
		, m_precision(-1)
		, m_type('\0')
	{}

	static FormatSpec Parse(const std::string& spec);

	char m_fill;
	char m_align;
	char m_sign;
	bool m_alternate;
	size_t m_width;
	int m_precision;
	char m_type;
};

/**
	@brief A text template with replacement fields, used for CSV rows and headers.

	Replacement fields are written {name}, {name[index]}, {name:spec} or {name[index]:spec}; literal braces are
	doubled. For example "{t:.3f},{ch1[0]:.8e},{ch1[1]}\r\n".

	Names which aren't bound at render time expand to nothing, so a template mentioning both channels can be used
	with a capture containing only one of them.
 */
class FormatTemplate
{
public:
	FormatTemplate()
	{}

	explicit FormatTemplate(const std::string& text);

	std::string Render(const FormatArgs& args) const;

	const std::string& GetText() const
	{ return m_text; }

	static std::string FormatValue(const RecordValue& value, const FormatSpec& spec);
	static std::string FormatString(const std::string& str, const FormatSpec& spec);

protected:
	static std::string Pad(const std::string& body, const FormatSpec& spec, char defaultAlign);

	/**
		@brief One piece of the template: either literal text or a replacement field
	 */
	class Segment
	{
	public:
		Segment()
			: m_isField(false)
		{}

		bool m_isField;

		///@brief Literal text, or the name of the field
		std::string m_text;

		std::optional<size_t> m_index;
		FormatSpec m_spec;
	};

	std::string m_text;
	std::vector<Segment> m_segments;
};

#endif
