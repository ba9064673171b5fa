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
	@brief Tests for LIFileHeader, LIFileWriter and LIFileReader
 */

#include "TestHelpers.h"

using namespace std;

static const vector<uint8_t> g_legacyEmptyHeader =
{
	'L', 'I', '1', 0x20, 0x00,
	0x01, 0x01, 0x01, 0x00,
	0x00, 0x00, 0x80, 0x3f,
	0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
	0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0xf0, 0x3f,
	0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00
};

static const vector<uint8_t> g_legacyStringHeader =
{
	'L', 'I', '1', 0x24, 0x00,
	0x01, 0x01, 0x01, 0x00,
	0x00, 0x00, 0x80, 0x3f,
	0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
	0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0xf0, 0x3f,
	0x01, 0x00, 'A', 0x01, 0x00, 'B', 0x01, 0x00, 'C', 0x01, 0x00, 'D'
};

static LIFileHeader MakeHeader(
	const string& layout,
	const string& proc,
	const string& fmt,
	const string& hdr,
	vector<size_t> channels = {0},
	vector<double> cal = {1})
{
	LIFileHeader header;
	header.m_instrument = 1;
	header.m_instrumentVersion = 1;
	header.m_channels = channels;
	header.m_timestep = 1;
	header.m_startTime = 0;
	header.m_calibration = cal;
	header.m_layout = layout;
	header.m_processing = {proc};
	header.m_csvFormat = fmt;
	header.m_csvHeader = hdr;
	return header;
}

static const vector<uint8_t> g_sampleRecord = {0x01, 0x00, 0x00, 0x00, 0x00, 0x00, 0x80, 0xbf};

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Header encoding

TEST(LIFileHeader, LegacyBytes)
{
	EXPECT_EQ(MakeHeader("", "", "", "").Serialize(LIFileHeader::REV_LEGACY), g_legacyEmptyHeader);
	EXPECT_EQ(MakeHeader("A", "B", "C", "D").Serialize(LIFileHeader::REV_LEGACY), g_legacyStringHeader);
}

TEST(LIFileHeader, ParsesLegacy)
{
	auto& bytes = g_legacyStringHeader;
	auto header = LIFileHeader::Parse(&bytes[LI_PREAMBLE_LENGTH], bytes.size() - LI_PREAMBLE_LENGTH);

	EXPECT_EQ(header.m_revision, LIFileHeader::REV_LEGACY);
	EXPECT_EQ(header.m_instrument, 1);
	EXPECT_EQ(header.m_instrumentVersion, 1);
	EXPECT_EQ(header.m_channels, vector<size_t>{0});
	EXPECT_EQ(header.m_timestep, 1.0);
	EXPECT_EQ(header.m_startTime, 0u);
	EXPECT_EQ(header.m_calibration, vector<double>{1.0});
	EXPECT_EQ(header.m_layout, "A");
	EXPECT_EQ(header.m_processing, vector<string>{"B"});
	EXPECT_EQ(header.m_csvFormat, "C");
	EXPECT_EQ(header.m_csvHeader, "D");
}

TEST(LIFileHeader, CurrentRevisionRoundTrip)
{
	auto header = MakeHeader("<s24:p8", "", "{t},{ch1},{ch3}\r\n", "Time,A,B\r\n", {0, 2}, {0.5, 2.0});
	header.m_processing = {"*C", "*C/2"};
	header.m_timestep = 1e-9;
	header.m_startTime = 1600000000;

	auto bytes = header.Serialize();
	ASSERT_EQ(ReadLE16(&bytes[3]), bytes.size() - LI_PREAMBLE_LENGTH);
	EXPECT_EQ(bytes[LI_PREAMBLE_LENGTH], 0x05);

	auto parsed = LIFileHeader::Parse(&bytes[LI_PREAMBLE_LENGTH], bytes.size() - LI_PREAMBLE_LENGTH);
	EXPECT_EQ(parsed.m_revision, LIFileHeader::REV_CURRENT);
	EXPECT_EQ(parsed.m_channels, header.m_channels);
	EXPECT_EQ(parsed.m_timestep, 1e-9);
	EXPECT_EQ(parsed.m_startTime, 1600000000u);
	EXPECT_EQ(parsed.m_calibration, header.m_calibration);
	EXPECT_EQ(parsed.m_processing, header.m_processing);
	EXPECT_EQ(parsed.m_csvFormat, header.m_csvFormat);
	EXPECT_EQ(parsed.m_csvHeader, header.m_csvHeader);
}

TEST(LIFileHeader, LegacyPerChannelProcessing)
{
	auto header = MakeHeader("<s32", "", "", "", {0, 1}, {1, 1});
	header.m_processing = {"*2", "*3"};

	auto bytes = header.Serialize(LIFileHeader::REV_LEGACY);
	auto parsed = LIFileHeader::Parse(&bytes[LI_PREAMBLE_LENGTH], bytes.size() - LI_PREAMBLE_LENGTH);
	EXPECT_EQ(parsed.m_revision, LIFileHeader::REV_LEGACY);
	EXPECT_EQ(parsed.m_processing, (vector<string>{"*2", "*3"}));
	EXPECT_EQ(parsed.m_timestep, 1.0);
}

TEST(LIFileHeader, SerializeErrors)
{
	//Legacy headers can only count channels from zero
	EXPECT_THROW(MakeHeader("<u8", "", "", "", {1}).Serialize(LIFileHeader::REV_LEGACY), FormatError);
	EXPECT_THROW(MakeHeader("<u8", "", "", "", {8}).Serialize(), FormatError);
	EXPECT_THROW(MakeHeader(string(70000, 'u'), "", "", "").Serialize(), FormatError);

	//Strings that fit individually, but not together
	EXPECT_THROW(MakeHeader(string(40000, 'u'), "", string(40000, 'x'), "").Serialize(), FormatError);
}

TEST(LIFileHeader, MissingCalibrationWrittenAsZero)
{
	auto bytes = MakeHeader("<u8", "", "", "", {0, 1}, {1.0}).Serialize();
	auto parsed = LIFileHeader::Parse(&bytes[LI_PREAMBLE_LENGTH], bytes.size() - LI_PREAMBLE_LENGTH);
	EXPECT_EQ(parsed.m_calibration, (vector<double>{1.0, 0.0}));
}

TEST(LIFileHeader, ColumnHeaders)
{
	auto header = MakeHeader("<u8", "", "", "% Capture data\r\n% more\r\nTime, Ch1 ,Ch2\r\n\r\n");
	EXPECT_EQ(header.GetColumnHeaders(), (vector<string>{"Time", "Ch1", "Ch2"}));
	EXPECT_TRUE(MakeHeader("<u8", "", "", "").GetColumnHeaders().empty());
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Writing

TEST(LIFileWriter, LegacyFileBytes)
{
	auto path = TempPath("legacy.li");

	LIFileWriter writer;
	ASSERT_TRUE(writer.Create(path, MakeHeader("", "", "", ""), LIFileHeader::REV_LEGACY));
	ASSERT_TRUE(writer.Append({0x00, 0x00, 0x00, 0x00}, 0));
	writer.Finalize();
	writer.Finalize();
	EXPECT_FALSE(writer.IsOpen());

	auto expected = g_legacyEmptyHeader;
	vector<uint8_t> chunk = {0x00, 0x04, 0x00, 0x00, 0x00, 0x00, 0x00};
	expected.insert(expected.end(), chunk.begin(), chunk.end());
	EXPECT_EQ(ReadFileBytes(path), expected);
}

TEST(LIFileWriter, SplitsLargePayloads)
{
	auto path = TempPath("large.li");
	vector<uint8_t> data(70000);
	for(size_t i=0; i<data.size(); i++)
		data[i] = i & 0xff;

	auto header = MakeHeader("<u8", "", "{ch1}\n", "");
	{
		LIFileWriter writer;
		ASSERT_TRUE(writer.Create(path, header));
		ASSERT_TRUE(writer.Append(data, 0));
	}

	auto hdrlen = header.Serialize().size();
	auto bytes = ReadFileBytes(path);
	ASSERT_EQ(bytes.size(), hdrlen + 3 + 65535 + 3 + (70000 - 65535));
	EXPECT_EQ(ReadLE16(&bytes[hdrlen + 1]), 65535);

	LIFileReader reader;
	ASSERT_TRUE(reader.Open(path));
	auto recs = reader.ReadAll();
	ASSERT_EQ(recs.size(), data.size());
	EXPECT_EQ(recs[65536][0], ProcessedRecord{U(0)});
	EXPECT_EQ(recs[69999][0], ProcessedRecord{U(69999 & 0xff)});
}

TEST(LIFileWriter, LongFormCreate)
{
	auto path = TempPath("longform.li");

	LIFileWriter writer;
	ASSERT_TRUE(writer.Create(path, 3, 7, 0x06, "<s32", {"*C"}, "{ch2},{ch3}\n", "B,C\n", {2, 3}, 0.25, 12345));
	ASSERT_TRUE(writer.Append({0x01, 0x00, 0x00, 0x00}, 1));
	ASSERT_TRUE(writer.Append({0x01, 0x00, 0x00, 0x00}, 2));
	EXPECT_THROW(writer.Append({0x01}, 0), FormatError);
	writer.Finalize();

	LIFileReader reader;
	ASSERT_TRUE(reader.Open(path));
	EXPECT_EQ(reader.GetInstrument(), 3);
	EXPECT_EQ(reader.GetInstrumentVersion(), 7);
	EXPECT_EQ(reader.GetChannelCount(), 2u);
	EXPECT_EQ(reader.GetTimestep(), 0.25);
	EXPECT_EQ(reader.GetStartTime(), 12345u);
	EXPECT_EQ(reader.GetCalibration(), (vector<double>{2, 3}));
	EXPECT_EQ(reader.GetHeaders(), (vector<string>{"B", "C"}));
	EXPECT_EQ(reader.GetHeader().m_channels, (vector<size_t>{1, 2}));

	auto rec = reader.ReadRecord();
	ASSERT_TRUE(rec.has_value());
	EXPECT_EQ(*rec, (vector<ProcessedRecord>{ ProcessedRecord{F(2)}, ProcessedRecord{F(3)} }));
	EXPECT_FALSE(reader.ReadRecord().has_value());
}

TEST(LIFileWriter, CreateFailsOnBadPath)
{
	LIFileWriter writer;
	EXPECT_FALSE(writer.Create("/nonexistent-directory/x.li", MakeHeader("<u8", "", "", "")));
	EXPECT_FALSE(writer.IsOpen());
	EXPECT_FALSE(writer.Append({0x01}, 0));
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Reading

TEST(LIFileReader, RoundTrip)
{
	auto path = TempPath("roundtrip.li");
	auto header = MakeHeader("<s32:f32", "+1+1-2:-1-1+2", "{ch1[0]}\r\n", "Header");
	{
		LIFileWriter writer;
		ASSERT_TRUE(writer.Create(path, header));

		//Two records, then a partial one
		vector<uint8_t> data = g_sampleRecord;
		data.insert(data.end(), g_sampleRecord.begin(), g_sampleRecord.end());
		data.insert(data.end(), {0x00, 0x80, 0xbf});
		ASSERT_TRUE(writer.Append(data, 0));
	}

	LIFileReader reader;
	ASSERT_TRUE(reader.Open(path));
	EXPECT_EQ(reader.GetHeader().m_layout, "<s32:f32");
	EXPECT_EQ(reader.GetHeader().m_processing, vector<string>{"+1+1-2:-1-1+2"});
	EXPECT_EQ(reader.GetHeader().m_csvFormat, "{ch1[0]}\r\n");
	EXPECT_EQ(reader.GetHeader().m_csvHeader, "Header");

	vector< vector<ProcessedRecord> > expected =
	{
		{ ProcessedRecord{S(1), F(-1.0)} },
		{ ProcessedRecord{S(1), F(-1.0)} }
	};
	EXPECT_EQ(reader.ReadAll(), expected);
}

TEST(LIFileReader, ReadsLegacyFile)
{
	auto path = TempPath("legacyread.li");
	auto bytes = MakeHeader("<s32", "", "{ch1}\n", "").Serialize(LIFileHeader::REV_LEGACY);
	vector<uint8_t> chunk = {0x00, 0x04, 0x00, 0xff, 0xff, 0xff, 0xff};
	bytes.insert(bytes.end(), chunk.begin(), chunk.end());
	ASSERT_TRUE(WriteFileBytes(path, bytes));

	LIFileReader reader;
	ASSERT_TRUE(reader.Open(path));
	EXPECT_EQ(reader.GetHeader().m_revision, LIFileHeader::REV_LEGACY);
	EXPECT_EQ(reader.ReadAll(), (vector< vector<ProcessedRecord> >{ { ProcessedRecord{S(-1)} } }));
}

TEST(LIFileReader, Iteration)
{
	auto path = TempPath("iterate.li");
	{
		LIFileWriter writer;
		ASSERT_TRUE(writer.Create(path, MakeHeader("<u8", "*2", "", "")));
		ASSERT_TRUE(writer.Append({1, 2}, 0));
		ASSERT_TRUE(writer.Append({3}, 0));
	}

	LIFileReader reader;
	ASSERT_TRUE(reader.Open(path));
	vector<int64_t> values;
	for(auto& row : reader)
		values.push_back(row[0].GetScalar().GetSigned());
	EXPECT_EQ(values, (vector<int64_t>{2, 4, 6}));
}

TEST(LIFileReader, UnevenChannelsDropTrailingSample)
{
	auto path = TempPath("uneven.li");
	{
		LIFileWriter writer;
		ASSERT_TRUE(writer.Create(path, MakeHeader("<u8", "", "", "", {0, 1}, {1, 1})));
		ASSERT_TRUE(writer.Append({1, 2}, 0));
		ASSERT_TRUE(writer.Append({10}, 1));
	}

	LIFileReader reader;
	ASSERT_TRUE(reader.Open(path));
	auto rec = reader.ReadRecord();
	ASSERT_TRUE(rec.has_value());
	EXPECT_EQ(*rec, (vector<ProcessedRecord>{ ProcessedRecord{U(1)}, ProcessedRecord{U(10)} }));
	EXPECT_FALSE(reader.ReadRecord().has_value());
}

TEST(LIFileReader, MissingFile)
{
	LIFileReader reader;
	EXPECT_FALSE(reader.Open("/nonexistent-directory/missing.li"));
	EXPECT_FALSE(reader.IsOpen());
	EXPECT_FALSE(reader.ReadRecord().has_value());
}

TEST(LIFileReader, EmptyLayoutIsFormatError)
{
	auto path = TempPath("emptylayout.li");
	ASSERT_TRUE(WriteFileBytes(path, g_legacyEmptyHeader));

	LIFileReader reader;
	EXPECT_THROW(reader.Open(path), FormatError);
	EXPECT_FALSE(reader.IsOpen());
}

TEST(LIFileReader, BadMagic)
{
	auto path = TempPath("badmagic.li");
	auto bytes = MakeHeader("<u8", "", "", "").Serialize();
	bytes[0] = 'X';
	ASSERT_TRUE(WriteFileBytes(path, bytes));

	LIFileReader reader;
	EXPECT_THROW(reader.Open(path), CorruptFileError);

	ASSERT_TRUE(WriteFileBytes(path, {'L'}));
	EXPECT_THROW(reader.Open(path), CorruptFileError);
}

TEST(LIFileReader, BadVersion)
{
	auto path = TempPath("badversion.li");
	auto bytes = MakeHeader("<u8", "", "", "").Serialize();
	bytes[2] = '2';
	ASSERT_TRUE(WriteFileBytes(path, bytes));

	LIFileReader reader;
	EXPECT_THROW(reader.Open(path), UnsupportedVersionError);
}

TEST(LIFileReader, HeaderLengthMismatch)
{
	auto path = TempPath("badlength.li");
	LIFileReader reader;

	//Declared length one byte longer than the content, with a spare byte to read
	auto longer = MakeHeader("<u8", "", "", "").Serialize();
	longer[3] ++;
	longer.push_back(0);
	ASSERT_TRUE(WriteFileBytes(path, longer));
	EXPECT_THROW(reader.Open(path), CorruptFileError);

	//Declared length one byte short
	auto shorter = MakeHeader("<u8", "", "", "").Serialize();
	shorter[3] --;
	ASSERT_TRUE(WriteFileBytes(path, shorter));
	EXPECT_THROW(reader.Open(path), CorruptFileError);

	//File ends inside the header
	auto truncated = MakeHeader("<u8", "", "", "").Serialize();
	truncated.resize(truncated.size() - 2);
	ASSERT_TRUE(WriteFileBytes(path, truncated));
	EXPECT_THROW(reader.Open(path), CorruptFileError);
}

TEST(LIFileReader, TruncatedChunk)
{
	auto path = TempPath("truncated.li");
	auto bytes = MakeHeader("<u8", "", "", "").Serialize();
	vector<uint8_t> chunk = {0x00, 0x0a, 0x00, 0x01, 0x02, 0x03, 0x04};
	bytes.insert(bytes.end(), chunk.begin(), chunk.end());
	ASSERT_TRUE(WriteFileBytes(path, bytes));

	LIFileReader reader;
	ASSERT_TRUE(reader.Open(path));
	EXPECT_THROW(reader.ReadRecord(), CorruptFileError);

	//Partial chunk header
	bytes = MakeHeader("<u8", "", "", "").Serialize();
	bytes.push_back(0x00);
	bytes.push_back(0x01);
	ASSERT_TRUE(WriteFileBytes(path, bytes));
	ASSERT_TRUE(reader.Open(path));
	EXPECT_THROW(reader.ReadRecord(), CorruptFileError);
}

TEST(LIFileReader, ChunkForInactiveChannel)
{
	auto path = TempPath("inactive.li");
	auto bytes = MakeHeader("<u8", "", "", "").Serialize();
	vector<uint8_t> chunk = {0x03, 0x01, 0x00, 0x01};
	bytes.insert(bytes.end(), chunk.begin(), chunk.end());
	ASSERT_TRUE(WriteFileBytes(path, bytes));

	LIFileReader reader;
	ASSERT_TRUE(reader.Open(path));
	EXPECT_THROW(reader.ReadRecord(), CorruptFileError);
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// CSV conversion

TEST(LIFileReader, TwoChannelCSV)
{
	auto inpath = TempPath("twochannel.li");
	auto outpath = TempPath("twochannel.csv");

	//Only one calibration coefficient for two channels
	auto header = MakeHeader(
		"<s32:f32",
		"*-1e2:*1e-1",
		"{ch1[0]},{ch1[1]}\r\n{ch2[0]},{ch2[1]}\r\n",
		"",
		{0, 1},
		{1.0});
	{
		LIFileWriter writer;
		ASSERT_TRUE(writer.Create(inpath, header));
		ASSERT_TRUE(writer.Append(g_sampleRecord, 0));
		ASSERT_TRUE(writer.Append(g_sampleRecord, 1));
	}

	//Stale output is replaced, not appended to
	ASSERT_TRUE(WriteFileBytes(outpath, {'o', 'l', 'd'}));

	ASSERT_TRUE(LIFileReader::ConvertToCSV(inpath, outpath));
	EXPECT_EQ(ReadFileText(outpath), "-100,-0.1\r\n-100,-0.1\r\n");
}

TEST(LIFileReader, CSVWithHeaderAndTime)
{
	auto inpath = TempPath("timed.li");
	auto outpath = TempPath("timed.csv");

	auto header = MakeHeader("<u8", "", "{t},{ch1}\r\n", "% test\r\nTime,Value\r\n");
	header.m_timestep = 0.5;
	{
		LIFileWriter writer;
		ASSERT_TRUE(writer.Create(inpath, header));
		ASSERT_TRUE(writer.Append({5}, 0));
		ASSERT_TRUE(writer.Append({6, 7}, 0));
	}

	LIFileReader reader;
	ASSERT_TRUE(reader.Open(inpath));
	EXPECT_EQ(reader.GetHeaders(), (vector<string>{"Time", "Value"}));
	ASSERT_TRUE(reader.ToCSV(outpath));
	EXPECT_EQ(ReadFileText(outpath), "% test\r\nTime,Value\r\n0,5\r\n0.5,6\r\n1,7\r\n");
}

TEST(LIFileReader, CSVToBadPath)
{
	auto inpath = TempPath("badcsv.li");
	{
		LIFileWriter writer;
		ASSERT_TRUE(writer.Create(inpath, MakeHeader("<u8", "", "{ch1}\n", "")));
	}
	EXPECT_FALSE(LIFileReader::ConvertToCSV(inpath, "/nonexistent-directory/out.csv"));
}
