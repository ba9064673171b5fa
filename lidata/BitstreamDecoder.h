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
	@brief Declaration of BitstreamDecoder
 */

#ifndef BitstreamDecoder_h
#define BitstreamDecoder_h

/**
	@brief Incremental decoder turning raw instrument bytes into records, one independent state per channel.

	Data may arrive split at arbitrary byte boundaries: bits that don't yet make up a whole field stay buffered
	until the next call to Feed(), and a record that straddles two calls is resumed where it left off.

	Fields are little endian and packed LSB first within each byte.

	When a literal (sync marker) field doesn't match, the partial record is thrown away, one byte is skipped
	starting at the mismatched field, and parsing restarts at the first field of the layout.
	This recovers byte-granular corruption; a stream whose bit phase has slipped by less than a byte will keep
	mismatching until the slip is corrected upstream.

	Each channel has its own lock, so different channels may be fed from different threads.
 */
class BitstreamDecoder
{
public:
	BitstreamDecoder(const BinaryLayout& layout, size_t nchannels);
	virtual ~BitstreamDecoder();

	void Feed(const uint8_t* data, size_t len, size_t channel);

	void Feed(const std::vector<uint8_t>& data, size_t channel)
	{ Feed(data.data(), data.size(), channel); }

	std::vector<RawRecord> TakeRecords(size_t channel);

	size_t GetPendingRecordCount(size_t channel);
	size_t GetResidualBitCount(size_t channel);
	size_t GetResyncCount(size_t channel);

	void Reset(size_t channel);

	size_t GetChannelCount() const
	{ return m_channels.size(); }

	const BinaryLayout& GetLayout() const
	{ return m_layout; }

	/**
		@brief Signal emitted (with the channel index) every time a literal mismatch forces a resync.

		Emitted after the channel lock is released, so handlers may call back into the decoder.
	 */
	sigc::signal<void(size_t)> signal_resync()
	{ return m_resyncSignal; }

protected:

	/**
		@brief Parse state for one channel
	 */
	class ChannelState
	{
	public:
		ChannelState()
			: m_bitOffset(0)
			, m_skipBits(0)
			, m_fieldIndex(0)
			, m_resyncCount(0)
		{}

		///@brief Number of buffered bits not yet consumed
		size_t GetResidualBits() const
		{ return m_cache.size()*8 - m_bitOffset; }

		///@brief Raw bytes not yet fully consumed
		std::vector<uint8_t> m_cache;

		///@brief Index of the next unconsumed bit in m_cache (LSB first)
		size_t m_bitOffset;

		///@brief Bits still to be dropped for an in-progress resync
		size_t m_skipBits;

		///@brief Index of the next field to parse
		size_t m_fieldIndex;

		///@brief Fields of the record being assembled
		RawRecord m_current;

		///@brief Completed records waiting for the consumer
		std::vector<RawRecord> m_records;

		size_t m_resyncCount;

		std::mutex m_mutex;
	};

	ChannelState& GetChannel(size_t channel);

	uint64_t PeekBits(const ChannelState& state, size_t nbits) const;
	RecordValue DecodeField(const FieldDescriptor& field, uint64_t bits) const;
	void CompleteRecord(ChannelState& state);

	///@brief The record layout, shared by all channels
	BinaryLayout m_layout;

	///@brief Per-channel parse state, indexed by channel
	std::vector< std::unique_ptr<ChannelState> > m_channels;

	sigc::signal<void(size_t)> m_resyncSignal;
};

#endif
