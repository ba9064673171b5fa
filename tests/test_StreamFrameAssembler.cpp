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
	@brief Tests for StreamFrame, StreamFrameQueue and StreamFrameAssembler
 */

#include "TestHelpers.h"

using namespace std;

static CaptureConfig MakeStreamConfig()
{
	CaptureConfig config;
	config.m_channels = {0, 1};
	config.m_calibration = {1, 1};
	config.m_timestep = 1e-3;
	config.m_layout = "<s16";
	config.m_processing = {"*C"};
	return config;
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Frame headers

TEST(StreamFrame, HeaderBytes)
{
	StreamFrame frame("ab", 1, 2, 1.0, {0x11, 0x22});

	vector<uint8_t> expected =
	{
		0x02, 0x00, 'a', 'b',
		0x01, 0x00, 0x00, 0x00,
		0x02, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
		0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0xf0, 0x3f
	};
	EXPECT_EQ(frame.SerializeHeader(), expected);

	auto parsed = StreamFrame::Parse(expected, {0x11, 0x22});
	EXPECT_EQ(parsed.m_tag, "ab");
	EXPECT_EQ(parsed.m_channel, 1);
	EXPECT_EQ(parsed.m_startIndex, 2u);
	EXPECT_EQ(parsed.m_calibration, 1.0);
	EXPECT_EQ(parsed.m_payload, (vector<uint8_t>{0x11, 0x22}));
	EXPECT_FALSE(parsed.IsEndOfStream());
}

TEST(StreamFrame, NegativeChannelAndLargeIndex)
{
	StreamFrame frame("", -1, 0x0123456789abcdefULL, -2.5, {});
	auto parsed = StreamFrame::Parse(frame.SerializeHeader(), {});
	EXPECT_EQ(parsed.m_tag, "");
	EXPECT_EQ(parsed.m_channel, -1);
	EXPECT_EQ(parsed.m_startIndex, 0x0123456789abcdefULL);
	EXPECT_EQ(parsed.m_calibration, -2.5);
	EXPECT_TRUE(parsed.IsEndOfStream());
}

TEST(StreamFrame, MalformedHeaders)
{
	EXPECT_THROW(StreamFrame::Parse({0x01}, {}), FormatError);

	auto header = StreamFrame("tag", 1, 0, 1, {}).SerializeHeader();
	auto shorter = header;
	shorter.pop_back();
	EXPECT_THROW(StreamFrame::Parse(shorter, {}), FormatError);

	auto longer = header;
	longer.push_back(0);
	EXPECT_THROW(StreamFrame::Parse(longer, {}), FormatError);
}

TEST(StreamFrame, EndOfStream)
{
	auto frame = StreamFrame::EndOfStream("done");
	EXPECT_TRUE(frame.IsEndOfStream());
	EXPECT_EQ(frame.m_tag, "done");
	EXPECT_TRUE(frame.m_payload.empty());
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Queue

TEST(StreamFrameQueue, FifoOrder)
{
	StreamFrameQueue queue;
	EXPECT_FALSE(queue.TryPop().has_value());

	queue.Push(StreamFrame("a", 1, 0, 1, {}));
	queue.Push(StreamFrame("b", 1, 0, 1, {}));
	EXPECT_EQ(queue.size(), 2u);

	EXPECT_EQ(queue.Pop(0)->m_tag, "a");
	EXPECT_EQ(queue.TryPop()->m_tag, "b");
	EXPECT_FALSE(queue.Pop(5).has_value());

	queue.Push(StreamFrame("c", 1, 0, 1, {}));
	queue.Clear();
	EXPECT_EQ(queue.size(), 0u);
}

TEST(StreamFrameQueue, PopWakesOnPush)
{
	StreamFrameQueue queue;

	thread producer([&queue]()
		{
			this_thread::sleep_for(chrono::milliseconds(20));
			queue.Push(StreamFrame("late", 1, 0, 1, {}));
		});

	auto start = chrono::steady_clock::now();
	auto frame = queue.Pop(10000);
	auto elapsed = chrono::steady_clock::now() - start;
	producer.join();

	ASSERT_TRUE(frame.has_value());
	EXPECT_EQ(frame->m_tag, "late");
	EXPECT_LT(elapsed, chrono::seconds(5));
	EXPECT_EQ(queue.size(), 0u);
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Assembly

TEST(StreamFrameAssembler, AppliesFrameCalibration)
{
	StreamFrameAssembler assembler(MakeStreamConfig());

	auto samples = assembler.ProcessFrame(StreamFrame("data", 1, 0, 0.5, {0x04, 0x00, 0xfe, 0xff}));
	EXPECT_EQ(samples.m_channel, 1);
	EXPECT_EQ(samples.m_startIndex, 0u);
	EXPECT_EQ(samples.m_samples, (vector<ProcessedRecord>{ ProcessedRecord{F(2)}, ProcessedRecord{F(-1)} }));

	//Calibration changes from one frame to the next
	samples = assembler.ProcessFrame(StreamFrame("data", 2, 0, 3, {0x04, 0x00}));
	EXPECT_EQ(samples.m_channel, 2);
	EXPECT_EQ(samples.m_samples, vector<ProcessedRecord>{ProcessedRecord{F(12)}});

	EXPECT_EQ(assembler.GetSampleCount(1), 2u);
	EXPECT_EQ(assembler.GetSampleCount(2), 1u);
	EXPECT_EQ(assembler.GetSampleCount(3), 0u);
}

TEST(StreamFrameAssembler, RecordSplitAcrossFrames)
{
	StreamFrameAssembler assembler(MakeStreamConfig());

	auto samples = assembler.ProcessFrame(StreamFrame("data", 1, 0, 1, {0x01, 0x00, 0x02}));
	EXPECT_EQ(samples.m_samples, vector<ProcessedRecord>{ProcessedRecord{F(1)}});

	//Other channels don't disturb the carried over byte
	assembler.ProcessFrame(StreamFrame("data", 2, 0, 1, {0x07}));

	samples = assembler.ProcessFrame(StreamFrame("data", 1, 2, 1, {0x00}));
	EXPECT_EQ(samples.m_startIndex, 2u);
	EXPECT_EQ(samples.m_samples, vector<ProcessedRecord>{ProcessedRecord{F(2)}});
	EXPECT_EQ(assembler.GetSampleCount(1), 2u);
	EXPECT_EQ(assembler.GetSampleCount(2), 0u);
}

TEST(StreamFrameAssembler, EndOfStream)
{
	StreamFrameAssembler assembler(MakeStreamConfig());
	EXPECT_THROW(assembler.ProcessFrame(StreamFrame::EndOfStream("data")), StreamEndedException);
	EXPECT_THROW(assembler.ProcessFrame(StreamFrame("data", -3, 0, 1, {0x01, 0x00})), StreamEndedException);
}

TEST(StreamFrameAssembler, UnknownChannel)
{
	StreamFrameAssembler assembler(MakeStreamConfig());
	EXPECT_THROW(assembler.ProcessFrame(StreamFrame("data", 3, 0, 1, {0x01, 0x00})), FormatError);
	EXPECT_THROW(assembler.ProcessFrame(StreamFrame("data", 200, 0, 1, {0x01, 0x00})), FormatError);
}

TEST(StreamFrameAssembler, BadConfig)
{
	auto config = MakeStreamConfig();
	config.m_processing = {"*Q"};
	EXPECT_THROW(StreamFrameAssembler assembler(config), FormatError);
}

TEST(StreamFrameAssembler, Timeout)
{
	StreamFrameAssembler assembler(MakeStreamConfig());
	StreamFrameQueue queue;
	EXPECT_THROW(assembler.GetSamples(queue, 10), StreamTimeoutException);
}

TEST(StreamFrameAssembler, ProducerThread)
{
	StreamFrameAssembler assembler(MakeStreamConfig());
	StreamFrameQueue queue;

	size_t notified = 0;
	assembler.signal_samplesReady().connect(
		[&notified](const StreamSamples& samples)
		{ notified += samples.m_samples.size(); });

	thread producer([&queue]()
		{
			for(uint64_t i=0; i<10; i++)
			{
				queue.Push(StreamFrame("data", 1, i, 1, {static_cast<uint8_t>(i), 0x00}));
				this_thread::sleep_for(chrono::milliseconds(1));
			}
			queue.Push(StreamFrame::EndOfStream("data"));
		});

	vector<int64_t> values;
	try
	{
		while(true)
		{
			auto samples = assembler.GetSamples(queue, 5000);
			for(auto& s : samples.m_samples)
				values.push_back(llround(s.GetScalar().GetFloat()));
		}
	}
	catch(const StreamEndedException&)
	{
	}
	producer.join();

	EXPECT_EQ(values, (vector<int64_t>{0, 1, 2, 3, 4, 5, 6, 7, 8, 9}));
	EXPECT_EQ(notified, 10u);
	EXPECT_EQ(assembler.GetSampleCount(1), 10u);
}
