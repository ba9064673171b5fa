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
	@brief Tests for ProcessingExpression
 */

#include "TestHelpers.h"

using namespace std;

TEST(ProcessingExpression, ParsesClauses)
{
	auto expr = ProcessingExpression::Parse("*C/2.5e3:f", 4);
	ASSERT_EQ(expr.GetFieldCount(), 2u);

	auto& first = expr.GetOps(0);
	ASSERT_EQ(first.size(), 2u);
	EXPECT_EQ(first[0].m_op, ProcessingOp::OP_MUL);
	EXPECT_TRUE(first[0].m_isCalibration);
	EXPECT_EQ(*first[0].m_operand, F(4));
	EXPECT_EQ(first[1].m_op, ProcessingOp::OP_DIV);
	EXPECT_EQ(*first[1].m_operand, F(2500));

	auto& second = expr.GetOps(1);
	ASSERT_EQ(second.size(), 1u);
	EXPECT_EQ(second[0].m_op, ProcessingOp::OP_FLOOR);
	EXPECT_FALSE(second[0].m_operand.has_value());

	//Fields beyond the expression aren't processed
	EXPECT_TRUE(expr.GetOps(2).empty());
}

TEST(ProcessingExpression, OperandForms)
{
	auto expr = ProcessingExpression::Parse("+0x1F:*-2:/1e-1:-0.25:^2", 0);
	EXPECT_EQ(*expr.GetOps(0)[0].m_operand, S(31));
	EXPECT_TRUE(expr.GetOps(0)[0].m_operand->IsIntegral());
	EXPECT_EQ(*expr.GetOps(1)[0].m_operand, S(-2));
	EXPECT_EQ(*expr.GetOps(2)[0].m_operand, F(0.1));
	EXPECT_TRUE(expr.GetOps(2)[0].m_operand->IsFloat());
	EXPECT_EQ(*expr.GetOps(3)[0].m_operand, F(0.25));
	EXPECT_EQ(expr.GetOps(3)[0].m_op, ProcessingOp::OP_SUB);
}

TEST(ProcessingExpression, EmptyClausesAreIdentity)
{
	auto expr = ProcessingExpression::Parse(":", 0);
	EXPECT_EQ(expr.GetFieldCount(), 2u);
	EXPECT_TRUE(expr.GetOps(0).empty());
	EXPECT_TRUE(expr.GetOps(1).empty());
	EXPECT_EQ(ProcessingExpression::Parse("", 0).GetFieldCount(), 1u);
}

TEST(ProcessingExpression, UnaryOperatorsIgnoreOperand)
{
	auto expr = ProcessingExpression::Parse("s2f", 0);
	ASSERT_EQ(expr.GetOps(0).size(), 2u);
	EXPECT_EQ(expr.GetOps(0)[0].m_op, ProcessingOp::OP_SQRT);
	EXPECT_FALSE(expr.GetOps(0)[0].m_operand.has_value());
	EXPECT_EQ(expr.GetOps(0)[1].m_op, ProcessingOp::OP_FLOOR);
}

TEST(ProcessingExpression, WhitespaceIgnored)
{
	auto expr = ProcessingExpression::Parse(" * 2 + 1 ", 0);
	ASSERT_EQ(expr.GetOps(0).size(), 2u);
	EXPECT_EQ(*expr.GetOps(0)[1].m_operand, S(1));
}

TEST(ProcessingExpression, Rejects)
{
	const char* bad[] =
	{
		"*",
		"*:+1",
		"+1*",
		"x",
		"*2x",
		"&",
		"^",
		"*0x",
		"*1.2.3",
		"*\xff",
		"\xa0*2",
		"*2\xe9",
	};

	for(auto s : bad)
		EXPECT_THROW(ProcessingExpression::Parse(s, 1), FormatError) << "\"" << s << "\"";
}

TEST(ProcessingExpression, SetCoefficientOnlyTouchesCalibration)
{
	auto expr = ProcessingExpression::Parse("*C+3:*2*C", 1);
	expr.SetCoefficient(0.5);

	EXPECT_EQ(expr.GetCalibration(), 0.5);
	EXPECT_EQ(*expr.GetOps(0)[0].m_operand, F(0.5));
	EXPECT_EQ(*expr.GetOps(0)[1].m_operand, S(3));
	EXPECT_EQ(*expr.GetOps(1)[0].m_operand, S(2));
	EXPECT_EQ(*expr.GetOps(1)[1].m_operand, F(0.5));
}

TEST(ProcessingExpression, ValidateRejectsBitwiseAndOnFloat)
{
	auto ints = BinaryLayout::Parse("<s32:u8");
	auto floats = BinaryLayout::Parse("<f32");

	EXPECT_NO_THROW(ProcessingExpression::Parse("&0xFF:&1", 1).Validate(ints));
	EXPECT_THROW(ProcessingExpression::Parse("&1", 1).Validate(floats), FormatError);
	EXPECT_THROW(ProcessingExpression::Parse("*1.5&1", 1).Validate(ints), FormatError);
	EXPECT_THROW(ProcessingExpression::Parse("s&1", 1).Validate(ints), FormatError);
	EXPECT_THROW(ProcessingExpression::Parse("*C&1", 1).Validate(ints), FormatError);

	//Floor turns the value back into an integer
	EXPECT_NO_THROW(ProcessingExpression::Parse("f&0", 1).Validate(floats));
}

TEST(ProcessingExpression, ValidateAllowsSurplusClauses)
{
	EXPECT_NO_THROW(ProcessingExpression::Parse("*1:*2:*3", 1).Validate(BinaryLayout::Parse("<s32")));
}

TEST(ProcessingExpression, ToString)
{
	EXPECT_EQ(ProcessingExpression::Parse("*C/2.0:f", 1).ToString(), "*C/2.0:f");
	EXPECT_EQ(ProcessingExpression::Parse("+0x10:-1e1", 1).ToString(), "+16:-10.0");
}
