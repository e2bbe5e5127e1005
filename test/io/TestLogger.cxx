// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "io/Logger.hxx"
#include "util/ScopeExit.hxx"

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>

using std::string_view_literals::operator""sv;

TEST(Logger, Level)
{
	const unsigned old_level = GetLogLevel();
	AtScopeExit(old_level) { SetLogLevel(old_level); };

	SetLogLevel(2);
	EXPECT_EQ(GetLogLevel(), 2U);
	EXPECT_TRUE(CheckLogLevel(1));
	EXPECT_TRUE(CheckLogLevel(2));
	EXPECT_FALSE(CheckLogLevel(3));

	const Logger logger{"test"};

	testing::internal::CaptureStderr();
	logger(3, "hidden");
	logger(2, "a", 42);
	logger(1, "b", "c", std::string{"d"});
	EXPECT_EQ(testing::internal::GetCapturedStderr(),
		  "[test] a42\n"
		  "[test] bcd\n");
}

TEST(Logger, Fmt)
{
	const LLogger logger{"fmt"};

	testing::internal::CaptureStderr();
	logger.Fmt(1, "{} + {} = {}"sv, 1, 2, 3);
	logger.Fmt(5, "hidden {}"sv, 0);
	EXPECT_EQ(testing::internal::GetCapturedStderr(),
		  "[fmt] 1 + 2 = 3\n");
}

TEST(Logger, Exception)
{
	const Logger logger{"test"};

	std::exception_ptr ep;
	try {
		try {
			throw std::runtime_error{"inner"};
		} catch (...) {
			std::throw_with_nested(std::runtime_error{"outer"});
		}
	} catch (...) {
		ep = std::current_exception();
	}

	testing::internal::CaptureStderr();
	logger(1, "Failed: ", ep);
	EXPECT_EQ(testing::internal::GetCapturedStderr(),
		  "[test] Failed: outer; inner\n");
}

TEST(Logger, Free)
{
	testing::internal::CaptureStderr();
	LogConcat(1, "concat"sv, "x=", 1U);
	LogFmt(1, "fmt"sv, "y={}"sv, "z");
	EXPECT_EQ(testing::internal::GetCapturedStderr(),
		  "[concat] x=1\n"
		  "[fmt] y=z\n");
}
