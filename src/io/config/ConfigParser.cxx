// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "ConfigParser.hxx"
#include "LineParser.hxx"
#include "util/ScopeExit.hxx"

#include <fmt/core.h>

#include <exception>
#include <system_error>

#include <assert.h>
#include <errno.h>
#include <stdio.h>
#include <stdlib.h>

using std::string_view_literals::operator""sv;

bool
ConfigParser::PreParseLine(LineParser &)
{
	return false;
}

bool
NestedConfigParser::PreParseLine(LineParser &line)
{
	if (child) {
		if (child->PreParseLine(line))
			return true;

		if (line.SkipSymbol('}')) {
			line.ExpectEnd();
			child->Finish();
			FinishChild(std::move(child));
			child.reset();
			return true;
		}
	}

	return ConfigParser::PreParseLine(line);
}

void
NestedConfigParser::ParseLine(LineParser &line)
{
	if (child)
		child->ParseLine(line);
	else
		ParseLine2(line);
}

void
NestedConfigParser::Finish()
{
	if (child)
		throw LineParser::Error("Block not closed at end of file");

	ConfigParser::Finish();
}

void
NestedConfigParser::SetChild(std::unique_ptr<ConfigParser> &&_child)
{
	assert(!child);

	child = std::move(_child);
}

bool
CommentConfigParser::PreParseLine(LineParser &line)
{
	if (child.PreParseLine(line))
		return true;

	if (line.front() == '#' || line.IsEnd())
		/* ignore empty lines and comments */
		return true;

	return ConfigParser::PreParseLine(line);
}

void
CommentConfigParser::ParseLine(LineParser &line)
{
	child.ParseLine(line);
}

void
CommentConfigParser::Finish()
{
	child.Finish();
	ConfigParser::Finish();
}

void
ParseConfigFile(const std::filesystem::path &path, ConfigParser &parser)
{
	FILE *file = fopen(path.c_str(), "r");
	if (file == nullptr)
		throw std::system_error(errno, std::system_category(),
					fmt::format("Failed to open {}"sv,
						    path.native()));

	AtScopeExit(file) { fclose(file); };

	char *buffer = nullptr;
	size_t buffer_size = 0;
	AtScopeExit(&buffer) { free(buffer); };

	unsigned i = 1;
	while (getline(&buffer, &buffer_size, file) >= 0) {
		LineParser line_parser(buffer);

		try {
			if (!parser.PreParseLine(line_parser))
				parser.ParseLine(line_parser);
		} catch (...) {
			std::throw_with_nested(LineParser::Error{fmt::format("{}:{}"sv,
									     path.native(), i)});
		}

		++i;
	}

	if (ferror(file))
		throw std::system_error(errno, std::system_category(),
					fmt::format("Failed to read {}"sv,
						    path.native()));

	parser.Finish();
}
