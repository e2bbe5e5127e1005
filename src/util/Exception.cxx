// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "Exception.hxx"

static void
AppendNestedMessage(std::string &result, std::exception_ptr ep,
		    const char *fallback, const char *separator) noexcept;

static void
AppendNestedMessage(std::string &result, const std::exception &e,
		    const char *fallback, const char *separator) noexcept
{
	try {
		std::rethrow_if_nested(e);
	} catch (const std::exception &nested) {
		result += separator;
		result += nested.what();
		AppendNestedMessage(result, nested, fallback, separator);
	} catch (const std::nested_exception &ne) {
		AppendNestedMessage(result, ne.nested_ptr(),
				    fallback, separator);
	} catch (...) {
		result += separator;
		result += fallback;
	}
}

static void
AppendNestedMessage(std::string &result, std::exception_ptr ep,
		    const char *fallback, const char *separator) noexcept
{
	if (!ep)
		return;

	try {
		std::rethrow_exception(ep);
	} catch (const std::exception &e) {
		result += separator;
		result += e.what();
		AppendNestedMessage(result, e, fallback, separator);
	} catch (...) {
		result += separator;
		result += fallback;
	}
}

std::string
GetFullMessage(const std::exception &e,
	       const char *fallback, const char *separator) noexcept
{
	std::string result = e.what();
	AppendNestedMessage(result, e, fallback, separator);
	return result;
}

std::string
GetFullMessage(std::exception_ptr ep,
	       const char *fallback, const char *separator) noexcept
{
	if (!ep)
		return fallback;

	try {
		std::rethrow_exception(ep);
	} catch (const std::exception &e) {
		return GetFullMessage(e, fallback, separator);
	} catch (const char *s) {
		return s;
	} catch (...) {
		return fallback;
	}
}
