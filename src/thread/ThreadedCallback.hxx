// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include "CallbackThread.hxx"
#include "ThreadedCallbackConfig.hxx"
#include "ForkHook.hxx"

#include <cassert>
#include <functional>
#include <optional>
#include <string_view>
#include <tuple>
#include <utility>

/**
 * Wraps a callback function; Call() returns immediately and the
 * callback gets invoked with the same arguments in a separate
 * thread.  Invocations are delivered one at a time, in the order of
 * the Call() calls.
 *
 * The arguments are copied into the queue, so they must not refer
 * to objects which may be gone by the time the callback runs.
 */
template<typename... Args>
class ThreadedCallback {
public:
	using Callback = std::function<void(Args...)>;

private:
	const Callback callback;

	const CallbackThread::Duration shutdown_timeout;

	CallbackThread thread;

	std::optional<ForkHook> fork_hook;

public:
	ThreadedCallback(std::string_view name, Callback _callback)
		:callback(std::move(_callback)),
		 shutdown_timeout(CallbackThread::DEFAULT_SHUTDOWN_TIMEOUT),
		 thread(name)
	{
		assert(callback);
	}

	ThreadedCallback(const ThreadedCallbackConfig &config,
			 Callback _callback)
		:callback(std::move(_callback)),
		 shutdown_timeout(config.shutdown_timeout),
		 thread(config.name)
	{
		assert(callback);

		if (config.fork_hook)
			fork_hook.emplace(thread);
	}

	~ThreadedCallback() noexcept {
		fork_hook.reset();
		thread.Shutdown(shutdown_timeout);
	}

	ThreadedCallback(const ThreadedCallback &) = delete;
	ThreadedCallback &operator=(const ThreadedCallback &) = delete;

	const CallbackThread &GetThread() const noexcept {
		return thread;
	}

	std::string_view GetName() const noexcept {
		return thread.GetName();
	}

	/**
	 * Queue an invocation of the callback.  Never waits for the
	 * callback, and never reports its outcome.
	 */
	void Call(Args... args) {
		thread.Enqueue([this, t = std::make_tuple(std::move(args)...)]() mutable {
			std::apply(callback, std::move(t));
		});
	}

	void operator()(Args... args) {
		Call(std::move(args)...);
	}

	bool IsRunning() const noexcept {
		return thread.IsRunning();
	}

	CallbackThread::State GetState() const noexcept {
		return thread.GetState();
	}

	bool IsWorkerAlive() const noexcept {
		return thread.IsWorkerAlive();
	}

	std::size_t GetPendingCount() const noexcept {
		return thread.GetPendingCount();
	}

	void Shutdown(CallbackThread::Duration timeout) noexcept {
		thread.Shutdown(timeout);
	}

	/**
	 * Shut down with the configured timeout.
	 */
	void Shutdown() noexcept {
		thread.Shutdown(shutdown_timeout);
	}

	void PauseBeforeForkInParent() noexcept {
		thread.PauseBeforeForkInParent();
	}

	void ResumeAfterForkInParent() {
		thread.ResumeAfterForkInParent();
	}

	void ResumeAfterForkInChild() {
		thread.ResumeAfterForkInChild();
	}

	void ReopenAfterFork() {
		thread.ReopenAfterFork();
	}
};
