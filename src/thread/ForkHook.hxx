// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include "util/IntrusiveList.hxx"

class CallbackThread;

/**
 * Registers a #CallbackThread with process-wide pthread_atfork()
 * handlers which pause its worker before fork() and resume it
 * afterwards in the parent and in the child.
 *
 * Register each #CallbackThread at most once.
 */
class ForkHook final : public IntrusiveListHook {
	CallbackThread &thread;

	/**
	 * Was the worker paused by Prepare()?
	 */
	bool paused = false;

public:
	/**
	 * Throws std::system_error if pthread_atfork() fails.
	 */
	explicit ForkHook(CallbackThread &_thread);
	~ForkHook() noexcept;

	ForkHook(const ForkHook &) = delete;
	ForkHook &operator=(const ForkHook &) = delete;

	/**
	 * Pause all registered workers and lock the registry.  This
	 * is the pthread_atfork() "prepare" handler, but it may be
	 * called directly by a host which forks in a way which does
	 * not run those handlers (e.g. clone()).  Must be followed by
	 * ParentAll() or ChildAll().
	 */
	static void PrepareAll() noexcept;

	/**
	 * Resume the workers paused by PrepareAll() and unlock the
	 * registry.
	 */
	static void ParentAll() noexcept;

	/**
	 * Like ParentAll(), but for the forked child: all running
	 * dispatchers get a new worker with an empty queue (see
	 * CallbackThread::ResumeAfterForkInChild() and
	 * CallbackThread::ReopenAfterFork()).
	 */
	static void ChildAll() noexcept;

private:
	void Prepare() noexcept;
	void Parent();
	void Child();
};
