// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include "ThreadedCallbackConfig.hxx"
#include "io/config/ConfigParser.hxx"

#include <filesystem>
#include <functional> // for std::less
#include <map>
#include <string>
#include <string_view>

struct DispatchConfig {
	unsigned log_level = 1;

	std::map<std::string, ThreadedCallbackConfig, std::less<>> dispatchers;

	/**
	 * Look up a "dispatcher" block.
	 *
	 * @return nullptr if there is no such block
	 */
	[[gnu::pure]]
	const ThreadedCallbackConfig *Find(std::string_view name) const noexcept;

	/**
	 * Like Find(), but return a default configuration with the
	 * given name if there is no such block.
	 */
	ThreadedCallbackConfig Get(std::string_view name) const noexcept;
};

/**
 * Parser for the dispatcher configuration file:
 *
 *     log_level 5
 *     dispatcher "events" {
 *       shutdown_timeout 2500
 *       fork_hook yes
 *     }
 *
 * "shutdown_timeout" is in milliseconds.
 */
class DispatchConfigParser final : public NestedConfigParser {
	DispatchConfig &config;

	class Dispatcher final : public ConfigParser {
		DispatchConfigParser &parent;
		ThreadedCallbackConfig config;

	public:
		Dispatcher(DispatchConfigParser &_parent,
			   const char *_name)
			:parent(_parent)
		{
			config.name = _name;
		}

		/* virtual methods from class ConfigParser */
		void ParseLine(LineParser &line) override;
		void Finish() override;
	};

public:
	explicit DispatchConfigParser(DispatchConfig &_config) noexcept
		:config(_config) {}

protected:
	/* virtual methods from class NestedConfigParser */
	void ParseLine2(LineParser &line) override;
};

/**
 * Load and parse the given file.  Throws on error.
 */
void
LoadDispatchConfig(const std::filesystem::path &path,
		   DispatchConfig &config);
