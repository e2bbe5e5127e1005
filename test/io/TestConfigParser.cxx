// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "io/config/ConfigParser.hxx"
#include "io/config/LineParser.hxx"
#include "util/ScopeExit.hxx"

#include <gtest/gtest.h>

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include <stdlib.h>
#include <string.h>

class MyConfigParser final
	: public ConfigParser, public std::vector<std::string> {
public:
	void ParseLine(LineParser &line) override {
		const char *value = line.ExpectValueAndEnd();
		emplace_back(value);
	}
};

/**
 * Collects "group NAME {" blocks; lines inside a block are prefixed
 * with the block name.
 */
class MyNestedConfigParser final
	: public NestedConfigParser, public std::vector<std::string> {
	class Group final : public ConfigParser {
		MyNestedConfigParser &parent;
		const std::string name;

	public:
		Group(MyNestedConfigParser &_parent, const char *_name)
			:parent(_parent), name(_name) {}

		void ParseLine(LineParser &line) override {
			const char *value = line.ExpectValueAndEnd();
			parent.emplace_back(name + "/" + value);
		}

		void Finish() override {
			parent.emplace_back(name + "/end");
		}
	};

protected:
	void ParseLine2(LineParser &line) override {
		if (line.SkipWord("group")) {
			const char *name = line.ExpectValue();
			line.ExpectSymbolAndEol('{');
			SetChild(std::make_unique<Group>(*this, name));
		} else
			emplace_back(line.ExpectValueAndEnd());
	}
};

static void
ParseConfigFile(ConfigParser &parser, const char *const*lines)
{
	while (*lines != nullptr) {
		char *line = strdup(*lines++);
		AtScopeExit(line) { free(line); };

		LineParser line_parser(line);
		if (!parser.PreParseLine(line_parser))
			parser.ParseLine(line_parser);
	}

	parser.Finish();
}

TEST(ConfigParser, Values)
{
	static constexpr const char *lines[] = {
		"foo",
		"  'bar'  ",
		"\"with space\"",
		"a-b.c:d",
		nullptr
	};

	MyConfigParser parser;
	ParseConfigFile(parser, lines);

	ASSERT_EQ(parser.size(), 4U);
	EXPECT_EQ(parser[0], "foo");
	EXPECT_EQ(parser[1], "bar");
	EXPECT_EQ(parser[2], "with space");
	EXPECT_EQ(parser[3], "a-b.c:d");
}

TEST(ConfigParser, Comments)
{
	static constexpr const char *lines[] = {
		"# comment",
		"",
		"   ",
		"foo",
		"  # indented comment",
		nullptr
	};

	MyConfigParser parser;
	CommentConfigParser parser2(parser);
	ParseConfigFile(parser2, lines);

	ASSERT_EQ(parser.size(), 1U);
	EXPECT_EQ(parser[0], "foo");
}

TEST(ConfigParser, Errors)
{
	static constexpr const char *trailing[] = {
		"foo bar",
		nullptr
	};

	MyConfigParser parser;
	EXPECT_THROW(ParseConfigFile(parser, trailing), LineParser::Error);

	static constexpr const char *unterminated[] = {
		"\"foo",
		nullptr
	};

	EXPECT_THROW(ParseConfigFile(parser, unterminated), LineParser::Error);
}

TEST(ConfigParser, Nested)
{
	static constexpr const char *lines[] = {
		"foo",
		"group a {",
		"  # comment",
		"  x",
		"  y",
		"}",
		"group \"b\" {",
		"}",
		"bar",
		nullptr
	};

	MyNestedConfigParser parser;
	CommentConfigParser parser2(parser);
	ParseConfigFile(parser2, lines);

	EXPECT_EQ(static_cast<const std::vector<std::string> &>(parser),
		  (std::vector<std::string>{
			  "foo",
			  "a/x", "a/y", "a/end",
			  "b/end",
			  "bar",
		  }));
}

TEST(ConfigParser, BlockNotClosed)
{
	static constexpr const char *lines[] = {
		"group a {",
		"  x",
		nullptr
	};

	MyNestedConfigParser parser;
	EXPECT_THROW(ParseConfigFile(parser, lines), LineParser::Error);
}

TEST(ConfigParser, GarbageAfterBrace)
{
	static constexpr const char *lines[] = {
		"group a { x",
		nullptr
	};

	MyNestedConfigParser parser;
	EXPECT_THROW(ParseConfigFile(parser, lines), LineParser::Error);
}
