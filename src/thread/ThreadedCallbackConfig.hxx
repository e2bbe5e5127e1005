// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include "CallbackThread.hxx"

#include <string>

struct ThreadedCallbackConfig {
	/**
	 * Used as logger domain.
	 */
	std::string name;

	/**
	 * How long to wait for the worker in the destructor.
	 */
	CallbackThread::Duration shutdown_timeout =
		CallbackThread::DEFAULT_SHUTDOWN_TIMEOUT;

	/**
	 * Register a #ForkHook?
	 */
	bool fork_hook = false;
};
