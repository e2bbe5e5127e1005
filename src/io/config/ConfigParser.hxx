// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include <filesystem>
#include <memory>

class LineParser;

class ConfigParser {
public:
	virtual ~ConfigParser() noexcept = default;

	virtual bool PreParseLine(LineParser &line);
	virtual void ParseLine(LineParser &line) = 0;
	virtual void Finish() {}
};

/**
 * A #ConfigParser which can dynamically forward method calls to a
 * nested #ConfigParser instance.
 */
class NestedConfigParser : public ConfigParser {
	std::unique_ptr<ConfigParser> child;

public:
	/* virtual methods from class ConfigParser */
	bool PreParseLine(LineParser &line) override;
	void ParseLine(LineParser &line) final;
	void Finish() override;

protected:
	void SetChild(std::unique_ptr<ConfigParser> &&_child);
	virtual void ParseLine2(LineParser &line) = 0;

	/**
	 * This virtual method gets called after the given child
	 * parser has finished, before it gets destructed.  This
	 * method gets the chance to do additional checks or take over
	 * ownership.
	 */
	virtual void FinishChild(std::unique_ptr<ConfigParser> &&) {}
};

/**
 * A #ConfigParser which ignores lines starting with '#'.
 */
class CommentConfigParser final : public ConfigParser {
	ConfigParser &child;

public:
	explicit CommentConfigParser(ConfigParser &_child)
		:child(_child) {}

	/* virtual methods from class ConfigParser */
	bool PreParseLine(LineParser &line) override;
	void ParseLine(LineParser &line) final;
	void Finish() override;
};

/**
 * Feed all lines of the given file into the parser and call
 * ConfigParser::Finish().  Errors are rethrown nested inside an
 * exception which describes the file name and line number.
 */
void
ParseConfigFile(const std::filesystem::path &path, ConfigParser &parser);
