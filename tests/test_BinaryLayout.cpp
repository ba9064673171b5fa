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
	@brief Tests for BinaryLayout
 */

#include "TestHelpers.h"

using namespace std;

TEST(BinaryLayout, ParsesFieldTypes)
{
	auto layout = BinaryLayout::Parse("<b1:u6:s9:f32:f64:p4");
	ASSERT_EQ(layout.size(), 6u);

	EXPECT_EQ(layout[0].m_kind, FieldDescriptor::KIND_BOOL);
	EXPECT_EQ(layout[1].m_kind, FieldDescriptor::KIND_UNSIGNED);
	EXPECT_EQ(layout[1].m_bitWidth, 6u);
	EXPECT_EQ(layout[2].m_kind, FieldDescriptor::KIND_SIGNED);
	EXPECT_EQ(layout[2].m_bitWidth, 9u);
	EXPECT_EQ(layout[3].m_kind, FieldDescriptor::KIND_FLOAT);
	EXPECT_EQ(layout[4].m_bitWidth, 64u);
	EXPECT_EQ(layout[5].m_kind, FieldDescriptor::KIND_PADDING);

	EXPECT_EQ(layout.GetRecordBitLength(), 1u + 6 + 9 + 32 + 64 + 4);
	EXPECT_EQ(layout.GetOutputFieldCount(), 5u);
}

TEST(BinaryLayout, EndianMarkerIsOptional)
{
	EXPECT_EQ(BinaryLayout::Parse("u8:s8").ToString(), BinaryLayout::Parse("<u8:s8").ToString());
}

TEST(BinaryLayout, Literals)
{
	auto layout = BinaryLayout::Parse("<p8,0xFF:u8,17:p2,3:s8,-1:u4,0b101:u6,0o17");
	ASSERT_EQ(layout.size(), 6u);

	EXPECT_EQ(*layout[0].m_literal, 0xffu);
	EXPECT_FALSE(layout[0].IsOutput());
	EXPECT_EQ(*layout[1].m_literal, 17u);
	EXPECT_TRUE(layout[1].IsOutput());
	EXPECT_EQ(*layout[2].m_literal, 3u);
	EXPECT_EQ(*layout[3].m_literal, 0xffu);
	EXPECT_EQ(*layout[4].m_literal, 5u);
	EXPECT_EQ(*layout[5].m_literal, 15u);

	EXPECT_TRUE(layout[0].MatchesLiteral(0xff));
	EXPECT_FALSE(layout[0].MatchesLiteral(0xfe));
}

TEST(BinaryLayout, PaddingWithoutLiteral)
{
	auto layout = BinaryLayout::Parse("<p1:u6:p1");
	EXPECT_FALSE(layout[0].IsLiteral());
	EXPECT_EQ(layout.GetOutputFieldCount(), 1u);
	EXPECT_EQ(layout.GetRecordBitLength(), 8u);
}

TEST(BinaryLayout, NegativeLiteralLimits)
{
	EXPECT_EQ(*BinaryLayout::Parse("s8,-128")[0].m_literal, 0x80u);
	EXPECT_THROW(BinaryLayout::Parse("s8,-129"), FormatError);
	EXPECT_EQ(*BinaryLayout::Parse("u64,-1")[0].m_literal, UINT64_MAX);
}

TEST(BinaryLayout, Rejects)
{
	const char* bad[] =
	{
		"",
		">u8",
		"<u8:>s8",
		"u0",
		"u65",
		"f16",
		"f8",
		"b2",
		"r8",
		"x8",
		"u",
		"u8:",
		"u8x",
		"u8,",
		"u8,256",
		"u4,0x10",
		"u8,abc",
		"u8,0x",
		"u\xb2",
		"\xe9\xff",
	};

	for(auto s : bad)
		EXPECT_THROW(BinaryLayout::Parse(s), FormatError) << "\"" << s << "\"";
}

TEST(BinaryLayout, ToString)
{
	EXPECT_EQ(BinaryLayout::Parse("p8,0xFF : u8").ToString(), "<p8,0xff:u8");
	EXPECT_EQ(BinaryLayout::Parse("<s24:b1:p7").ToString(), "<s24:b1:p7");
}
