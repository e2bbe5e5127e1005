// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

/*
 * Reads lines from stdin and prints them from a #ThreadedCallback.
 * Special lines: "fail" makes the callback throw, "fork" forks the
 * process, "pause" and "resume" call the fork hooks manually.
 */

#include "thread/ThreadedCallback.hxx"
#include "thread/DispatchConfig.hxx"
#include "util/PrintException.hxx"

#include <chrono>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <thread>

#include <errno.h>
#include <stdio.h>
#include <stdlib.h>
#include <sys/wait.h>
#include <unistd.h>

using std::string_view_literals::operator""sv;

using LineCallback = ThreadedCallback<std::string>;

static void
PrintLine(std::string line)
{
	if (line == "fail"sv)
		throw std::runtime_error{"Callback was asked to fail"};

	printf("[%d] %s\n", (int)getpid(), line.c_str());
	fflush(stdout);
}

/**
 * Wait until the worker has dequeued everything.
 */
static void
WaitDrained(const LineCallback &callback) noexcept
{
	while (callback.GetPendingCount() > 0)
		std::this_thread::sleep_for(std::chrono::milliseconds{10});
}

static void
Fork(LineCallback &callback, bool fork_hook)
{
	const pid_t pid = fork();
	if (pid < 0)
		throw std::system_error(errno, std::system_category(),
					"fork() failed");

	if (pid == 0) {
		if (!fork_hook)
			callback.ReopenAfterFork();

		callback("hello from the child");
		WaitDrained(callback);
		callback.Shutdown();
		_exit(EXIT_SUCCESS);
	}

	int status;
	if (waitpid(pid, &status, 0) < 0)
		throw std::system_error(errno, std::system_category(),
					"waitpid() failed");

	callback(WIFEXITED(status) && WEXITSTATUS(status) == EXIT_SUCCESS
		 ? "child exited successfully"
		 : "child failed");
}

static void
HandleLine(LineCallback &callback, bool fork_hook, std::string_view line)
{
	if (line == "fork"sv)
		Fork(callback, fork_hook);
	else if (line == "pause"sv)
		callback.PauseBeforeForkInParent();
	else if (line == "resume"sv)
		callback.ResumeAfterForkInParent();
	else
		callback(std::string{line});
}

int
main(int argc, char **argv) noexcept
try {
	if (argc > 2) {
		fprintf(stderr, "usage: run-threaded-callback [CONFIG]\n");
		return EXIT_FAILURE;
	}

	DispatchConfig config;
	if (argc == 2)
		LoadDispatchConfig(argv[1], config);

	SetLogLevel(config.log_level);

	const auto callback_config = config.Get("demo");
	LineCallback callback{callback_config, PrintLine};

	char buffer[1024];
	while (fgets(buffer, sizeof(buffer), stdin) != nullptr) {
		std::string_view line{buffer};
		while (!line.empty() && (line.back() == '\n' || line.back() == '\r'))
			line.remove_suffix(1);

		try {
			HandleLine(callback, callback_config.fork_hook, line);
		} catch (const std::logic_error &e) {
			/* misuse of "resume" is not fatal for this demo */
			PrintException(e);
		}
	}

	WaitDrained(callback);
	callback.Shutdown();
	return EXIT_SUCCESS;
} catch (...) {
	PrintException(std::current_exception());
	return EXIT_FAILURE;
}
