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
	@brief Tests for CSVRenderer
 */

#include "TestHelpers.h"

using namespace std;

TEST(CSVRenderer, HeaderBindings)
{
	EXPECT_EQ(CSVRenderer::FormatHeader("% dt {d}, n={n}, t={t}\r\n", 0, 0.5), "% dt 0.5, n=0, t=0\r\n");
	EXPECT_EQ(CSVRenderer::FormatHeader("", 0, 1), "");
}

TEST(CSVRenderer, HeaderStartTime)
{
	setenv("TZ", "UTC", 1);
	tzset();
	EXPECT_EQ(CSVRenderer::FormatHeader("Start: {T}\r\n", 0, 1), "Start: Thu Jan  1 00:00:00 1970\r\n");
}

TEST(CSVRenderer, RowsAreTimeAligned)
{
	CSVRenderer renderer("{n},{t},{ch1},{ch2}\r\n", 0.5, 0, {0, 1});

	vector< deque<ProcessedRecord> > queues(2);
	queues[0] = { ProcessedRecord{S(1)}, ProcessedRecord{S(2)}, ProcessedRecord{S(3)} };
	queues[1] = { ProcessedRecord{S(10)}, ProcessedRecord{S(20)} };

	EXPECT_EQ(renderer.FormatRows(queues), 2u);
	EXPECT_EQ(renderer.TakeOutput(), "1,0,1,10\r\n2,0.5,2,20\r\n");
	EXPECT_EQ(renderer.GetOutput(), "");

	//Leftover stays queued until its partner arrives
	ASSERT_EQ(queues[0].size(), 1u);
	EXPECT_TRUE(queues[1].empty());

	queues[1].push_back(ProcessedRecord{S(30)});
	EXPECT_EQ(renderer.FormatRows(queues), 1u);
	EXPECT_EQ(renderer.TakeOutput(), "3,1,3,30\r\n");
	EXPECT_EQ(renderer.GetRowCount(), 3u);
}

TEST(CSVRenderer, SingleChannelBindsItsOwnName)
{
	//Only physical channel 1 is active, so only {ch2} is bound
	CSVRenderer renderer("[{ch1}][{ch2}]\n", 1, 0, {1});

	vector< deque<ProcessedRecord> > queues(1);
	queues[0] = { ProcessedRecord{F(-0.25)} };
	renderer.FormatRows(queues);
	EXPECT_EQ(renderer.TakeOutput(), "[][-0.25]\n");
}

TEST(CSVRenderer, QueueCountMismatch)
{
	CSVRenderer renderer("{ch1}\n", 1, 0, {0, 1});
	vector< deque<ProcessedRecord> > queues(1);
	EXPECT_THROW(renderer.FormatRows(queues), FormatError);
}

TEST(CSVRenderer, DumpAppends)
{
	auto path = TempPath("dump.csv");
	remove(path.c_str());

	CSVRenderer renderer("{ch1}\n", 1, 0, {0});
	renderer.AppendOutput("head\n");
	ASSERT_TRUE(renderer.DumpCSV(path));
	EXPECT_EQ(renderer.GetOutput(), "");

	vector< deque<ProcessedRecord> > queues(1);
	queues[0] = { ProcessedRecord{S(5)} };
	renderer.FormatRows(queues);
	ASSERT_TRUE(renderer.DumpCSV(path));

	EXPECT_EQ(ReadFileText(path), "head\n5\n");
}

TEST(CSVRenderer, DumpToBadPathFails)
{
	CSVRenderer renderer("{ch1}\n", 1, 0, {0});
	renderer.AppendOutput("x");
	EXPECT_FALSE(renderer.DumpCSV("/nonexistent-directory/out.csv"));
	EXPECT_EQ(renderer.GetOutput(), "x");
}
