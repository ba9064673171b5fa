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
	@brief Implementation of BitstreamDecoder
 */

#include "lidata.h"

using namespace std;

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Construction / destruction

BitstreamDecoder::BitstreamDecoder(const BinaryLayout& layout, size_t nchannels)
	: m_layout(layout)
{
	if(m_layout.size() == 0)
		throw FormatError("Can't decode with an empty binary layout");

	for(size_t i=0; i<nchannels; i++)
		m_channels.push_back(make_unique<ChannelState>());
}

BitstreamDecoder::~BitstreamDecoder()
{
}

BitstreamDecoder::ChannelState& BitstreamDecoder::GetChannel(size_t channel)
{
	if(channel >= m_channels.size())
		throw out_of_range(string("BitstreamDecoder: no channel ") + to_string(channel));
	return *m_channels[channel];
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Accessors

/**
	@brief Moves all completed records for a channel out of the decoder
 */
vector<RawRecord> BitstreamDecoder::TakeRecords(size_t channel)
{
	auto& state = GetChannel(channel);
	lock_guard<mutex> lock(state.m_mutex);

	vector<RawRecord> ret;
	ret.swap(state.m_records);
	return ret;
}

size_t BitstreamDecoder::GetPendingRecordCount(size_t channel)
{
	auto& state = GetChannel(channel);
	lock_guard<mutex> lock(state.m_mutex);
	return state.m_records.size();
}

size_t BitstreamDecoder::GetResidualBitCount(size_t channel)
{
	auto& state = GetChannel(channel);
	lock_guard<mutex> lock(state.m_mutex);
	return state.GetResidualBits();
}

size_t BitstreamDecoder::GetResyncCount(size_t channel)
{
	auto& state = GetChannel(channel);
	lock_guard<mutex> lock(state.m_mutex);
	return state.m_resyncCount;
}

/**
	@brief Discards buffered bits and any partial record for a channel.

	Completed records are kept.
 */
void BitstreamDecoder::Reset(size_t channel)
{
	auto& state = GetChannel(channel);
	lock_guard<mutex> lock(state.m_mutex);

	if(state.GetResidualBits() || !state.m_current.empty())
	{
		LogTrace("Channel %zu: discarding %zu residual bits and %zu partial fields\n",
			channel, state.GetResidualBits(), state.m_current.size());
	}

	state.m_cache.clear();
	state.m_bitOffset = 0;
	state.m_skipBits = 0;
	state.m_fieldIndex = 0;
	state.m_current.clear();
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Decoding

/**
	@brief Reads up to 64 bits from the cache without consuming them

	@param state	Channel state
	@param nbits	Number of bits to read (caller must ensure they're available)

	@return The bits, right aligned, with the first bit in the stream as the LSB
 */
uint64_t BitstreamDecoder::PeekBits(const ChannelState& state, size_t nbits) const
{
	uint64_t ret = 0;
	size_t pos = state.m_bitOffset;
	size_t got = 0;
	while(got < nbits)
	{
		uint8_t b = state.m_cache[pos / 8];
		size_t bitInByte = pos % 8;
		size_t take = min(8 - bitInByte, nbits - got);

		uint64_t chunk = (b >> bitInByte) & ( (1u << take) - 1);
		ret |= (chunk << got);

		got += take;
		pos += take;
	}
	return ret;
}

/**
	@brief Converts the raw bits of one field to a value
 */
RecordValue BitstreamDecoder::DecodeField(const FieldDescriptor& field, uint64_t bits) const
{
	switch(field.m_kind)
	{
		case FieldDescriptor::KIND_SIGNED:
			{
				//Sign extend
				auto width = field.m_bitWidth;
				if( (width < 64) && (bits & (1ULL << (width - 1))) )
					bits |= ~field.GetMask();
				return RecordValue::FromSigned(static_cast<int64_t>(bits));
			}

		case FieldDescriptor::KIND_FLOAT:
			if(field.m_bitWidth == 32)
			{
				uint32_t tmp = static_cast<uint32_t>(bits);
				float f;
				memcpy(&f, &tmp, sizeof(f));
				return RecordValue::FromFloat(f);
			}
			else
			{
				double d;
				memcpy(&d, &bits, sizeof(d));
				return RecordValue::FromFloat(d);
			}

		case FieldDescriptor::KIND_BOOL:
			return RecordValue::FromBool(bits != 0);

		case FieldDescriptor::KIND_UNSIGNED:
		case FieldDescriptor::KIND_PADDING:
		default:
			return RecordValue::FromUnsigned(bits);
	}
}

/**
	@brief Moves the in-progress record to the completed list and rewinds the field cursor
 */
void BitstreamDecoder::CompleteRecord(ChannelState& state)
{
	if(!state.m_current.empty())
	{
		state.m_records.push_back(state.m_current);
		state.m_current.clear();
	}
	state.m_fieldIndex = 0;
}

/**
	@brief Appends new data for a channel and decodes as many records as possible

	@param data		Raw bytes from the instrument
	@param len		Number of bytes
	@param channel	Channel index
 */
void BitstreamDecoder::Feed(const uint8_t* data, size_t len, size_t channel)
{
	auto& state = GetChannel(channel);
	size_t resyncs = 0;
	{
		lock_guard<mutex> lock(state.m_mutex);

		state.m_cache.insert(state.m_cache.end(), data, data + len);

		auto nfields = m_layout.size();
		while(true)
		{
			//Finish dropping bytes from an earlier literal mismatch
			if(state.m_skipBits)
			{
				size_t n = min(state.m_skipBits, state.GetResidualBits());
				state.m_bitOffset += n;
				state.m_skipBits -= n;
				if(state.m_skipBits)
					break;
			}

			if(state.m_fieldIndex >= nfields)
				CompleteRecord(state);

			//Wait for more data if we don't have the whole field
			auto& field = m_layout[state.m_fieldIndex];
			if(state.GetResidualBits() < field.m_bitWidth)
				break;

			uint64_t bits = PeekBits(state, field.m_bitWidth);
			if(!field.MatchesLiteral(bits))
			{
				LogDebug("Channel %zu: literal mismatch in field %zu (got 0x%s), dropping one byte to resync\n",
					channel,
					state.m_fieldIndex,
					to_string_hex(bits).c_str());

				state.m_current.clear();
				state.m_fieldIndex = 0;
				state.m_skipBits = 8;
				state.m_resyncCount ++;
				resyncs ++;
				continue;
			}

			if(field.IsOutput())
				state.m_current.push_back(DecodeField(field, bits));
			state.m_bitOffset += field.m_bitWidth;
			state.m_fieldIndex ++;
		}

		//Don't wait for the next call to hand over a record that just finished
		if(state.m_fieldIndex >= nfields)
			CompleteRecord(state);

		//Drop fully consumed bytes from the front of the cache
		size_t nbytes = state.m_bitOffset / 8;
		state.m_cache.erase(state.m_cache.begin(), state.m_cache.begin() + nbytes);
		state.m_bitOffset -= nbytes*8;
	}

	for(size_t i=0; i<resyncs; i++)
		m_resyncSignal.emit(channel);
}
