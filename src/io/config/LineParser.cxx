// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "LineParser.hxx"

#include <string>

#include <stdlib.h>
#include <string.h>

LineParser::LineParser(char *_p) noexcept
	:p(_p)
{
	Strip();

	/* strip trailing whitespace */
	char *end = p + strlen(p);
	while (end > p && IsWhitespace(end[-1]))
		--end;
	*end = 0;
}

void
LineParser::Strip() noexcept
{
	while (IsWhitespace(*p))
		++p;
}

void
LineParser::ExpectWhitespace()
{
	if (!IsWhitespace(front()))
		throw Error("Syntax error");

	++p;
	Strip();
}

void
LineParser::ExpectEnd()
{
	if (!IsEnd())
		throw Error(std::string("Unexpected tokens at end of line: ") + p);
}

void
LineParser::ExpectSymbol(char symbol)
{
	if (front() != symbol)
		throw Error(std::string("'") + symbol + "' expected");

	++p;
	Strip();
}

void
LineParser::ExpectSymbolAndEol(char symbol)
{
	ExpectSymbol(symbol);

	if (!IsEnd())
		throw Error(std::string("Unexpected tokens after '")
			    + symbol + "': " + p);
}

bool
LineParser::SkipWord(const char *word) noexcept
{
	const size_t length = strlen(word);
	if (strncmp(p, word, length) != 0)
		return false;

	if (p[length] != 0 && !IsWhitespace(p[length]))
		return false;

	p += length;
	Strip();
	return true;
}

const char *
LineParser::NextWord() noexcept
{
	if (!IsWordChar(front()))
		return nullptr;

	const char *result = p;
	do {
		++p;
	} while (IsWordChar(front()));

	if (IsWhitespace(front())) {
		*p++ = 0;
		Strip();
	} else if (!IsEnd()) {
		/* the caller will have to deal with the next token;
		   leave it intact */
		return nullptr;
	}

	return result;
}

inline char *
LineParser::NextUnquotedValue() noexcept
{
	char *result = p;
	while (IsUnquotedChar(front()))
		++p;

	if (IsWhitespace(front())) {
		*p++ = 0;
		Strip();
	} else if (!IsEnd())
		return nullptr;

	return result;
}

inline char *
LineParser::NextQuotedValue(char stop) noexcept
{
	char *result = p;
	char *end = strchr(p, stop);
	if (end == nullptr)
		return nullptr;

	*end = 0;
	p = end + 1;
	Strip();
	return result;
}

char *
LineParser::NextValue() noexcept
{
	if (IsEnd())
		return nullptr;

	const char ch = front();
	if (IsQuote(ch)) {
		++p;
		return NextQuotedValue(ch);
	}

	if (!IsUnquotedChar(ch))
		return nullptr;

	return NextUnquotedValue();
}

bool
LineParser::NextBool()
{
	const char *value = NextValue();
	if (value == nullptr)
		throw Error("yes/no expected");

	if (strcmp(value, "yes") == 0)
		return true;
	else if (strcmp(value, "no") == 0)
		return false;
	else
		throw Error("yes/no expected");
}

unsigned
LineParser::NextUnsigned()
{
	const char *string = NextValue();
	if (string == nullptr)
		throw Error("Non-negative integer expected");

	char *endptr;
	unsigned long l = strtoul(string, &endptr, 10);
	if (endptr == string || *endptr != 0 || *string == '-')
		throw Error("Non-negative integer expected");

	if (l > 0xffffffffUL)
		throw Error("Number is too large");

	return (unsigned)l;
}

unsigned
LineParser::NextPositiveInteger()
{
	const unsigned value = NextUnsigned();
	if (value == 0)
		throw Error("Positive integer expected");

	return value;
}

const char *
LineParser::ExpectWord()
{
	const char *value = NextWord();
	if (value == nullptr)
		throw Error("Word expected");

	return value;
}

char *
LineParser::ExpectValue()
{
	char *value = NextValue();
	if (value == nullptr || *value == 0)
		throw Error("Value expected");

	return value;
}

char *
LineParser::ExpectValueAndEnd()
{
	char *value = ExpectValue();
	ExpectEnd();
	return value;
}
