// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "DispatchConfig.hxx"
#include "io/config/LineParser.hxx"

#include <fmt/core.h>

#include <chrono>
#include <string_view>

using std::string_view_literals::operator""sv;

const ThreadedCallbackConfig *
DispatchConfig::Find(std::string_view name) const noexcept
{
	auto i = dispatchers.find(name);
	if (i == dispatchers.end())
		return nullptr;

	return &i->second;
}

ThreadedCallbackConfig
DispatchConfig::Get(std::string_view name) const noexcept
{
	if (const auto *c = Find(name))
		return *c;

	ThreadedCallbackConfig c;
	c.name = name;
	return c;
}

void
DispatchConfigParser::Dispatcher::ParseLine(LineParser &line)
{
	const std::string_view word = line.ExpectWord();

	if (word == "shutdown_timeout"sv) {
		config.shutdown_timeout =
			std::chrono::milliseconds{line.NextPositiveInteger()};
		line.ExpectEnd();
	} else if (word == "fork_hook"sv) {
		config.fork_hook = line.NextBool();
		line.ExpectEnd();
	} else
		throw LineParser::Error{fmt::format("Unknown option: {}"sv, word)};
}

void
DispatchConfigParser::Dispatcher::Finish()
{
	auto &map = parent.config.dispatchers;
	std::string name = config.name;
	map.emplace(std::move(name), std::move(config));

	ConfigParser::Finish();
}

void
DispatchConfigParser::ParseLine2(LineParser &line)
{
	const std::string_view word = line.ExpectWord();

	if (word == "log_level"sv) {
		config.log_level = line.NextUnsigned();
		line.ExpectEnd();
	} else if (word == "dispatcher"sv) {
		const char *name = line.ExpectValue();
		line.ExpectSymbolAndEol('{');

		if (config.Find(name) != nullptr)
			throw LineParser::Error{fmt::format("Duplicate dispatcher name: {}"sv, name)};

		SetChild(std::make_unique<Dispatcher>(*this, name));
	} else
		throw LineParser::Error{fmt::format("Unknown option: {}"sv, word)};
}

void
LoadDispatchConfig(const std::filesystem::path &path,
		   DispatchConfig &config)
{
	DispatchConfigParser parser(config);
	CommentConfigParser parser2(parser);
	ParseConfigFile(path, parser2);
}
