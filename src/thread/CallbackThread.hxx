// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include "io/Logger.hxx"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>

#include <sys/types.h>
#include <unistd.h>

/**
 * A queue plus one worker thread which invokes queued callbacks in
 * the order they were submitted.  Producers (e.g. an I/O thread)
 * never wait for a callback to finish.
 *
 * Exceptions thrown by a callback are logged and do not stop the
 * worker.  There is no return value and no delivery guarantee; this
 * is only useful for background processing.
 *
 * The class does not intercept fork(); the host is expected to call
 * PauseBeforeForkInParent() before forking, ResumeAfterForkInParent()
 * in the parent afterwards and ReopenAfterFork() in the child (see
 * #ForkHook).  A forked child never delivers invocations which were
 * queued in the parent; the first call on this object in the child
 * discards them, and it must not race with other calls.
 *
 * A worker which forks inside a callback does not continue as a
 * worker in the child process.
 */
class CallbackThread {
public:
	using Invocation = std::function<void()>;
	using Duration = std::chrono::steady_clock::duration;

	static constexpr Duration DEFAULT_SHUTDOWN_TIMEOUT =
		std::chrono::seconds{5};

	enum class State {
		RUNNING,

		/**
		 * The worker was stopped by PauseBeforeForkInParent();
		 * the queue is retained.
		 */
		PAUSED,

		/**
		 * Terminal; the queue will never be drained again.
		 */
		SHUTDOWN,
	};

private:
	const Logger logger;

	/**
	 * Protects all fields below.
	 */
	mutable std::mutex mutex;

	/**
	 * Signalled when an invocation is queued, when the state
	 * changes and when the worker exits.
	 */
	std::condition_variable cond;

	std::deque<Invocation> queue;

	State state = State::RUNNING;

	/**
	 * The current worker.  Not joinable after the worker was
	 * joined by PauseBeforeForkInParent().
	 */
	std::thread thread;

	/**
	 * The id of #thread, which (unlike #thread) is only modified
	 * while holding the lock.
	 */
	std::thread::id worker_id;

	/**
	 * The process which owns the queue.  If this differs from
	 * getpid(), then we're in a forked child and everything
	 * inherited from the parent needs to be discarded.
	 */
	std::atomic<pid_t> owner_pid{getpid()};

	/**
	 * The process which started #thread; 0 if there is no worker
	 * handle.  If this differs from getpid(), then we're in a
	 * forked child and #thread refers to a thread which does not
	 * exist in this process.
	 */
	std::atomic<pid_t> thread_pid{0};

	/**
	 * Is the worker loop still running?  Cleared by the worker
	 * right before it returns.
	 */
	bool worker_running = false;

public:
	/**
	 * Start the worker thread.
	 *
	 * Throws std::system_error if the thread could not be
	 * created.
	 *
	 * @param name a name used as logger domain
	 */
	explicit CallbackThread(std::string_view name);

	/**
	 * Calls Shutdown() and then waits (without a timeout) for the
	 * worker to finish.
	 */
	~CallbackThread() noexcept;

	CallbackThread(const CallbackThread &) = delete;
	CallbackThread &operator=(const CallbackThread &) = delete;

	std::string_view GetName() const noexcept {
		return logger.GetDomain();
	}

	/**
	 * Append an invocation to the queue and wake up the worker.
	 * This never waits for a callback.
	 *
	 * This may be called after Shutdown(), but the invocation
	 * will never be executed.
	 */
	void Enqueue(Invocation &&invocation);

	State GetState() const noexcept;

	bool IsRunning() const noexcept {
		return GetState() == State::RUNNING;
	}

	/**
	 * Is there a live worker thread in this process?  The answer
	 * may be outdated by the time the caller looks at it.
	 */
	bool IsWorkerAlive() const noexcept;

	/**
	 * The number of invocations which have not yet been
	 * dequeued by the worker.
	 */
	std::size_t GetPendingCount() const noexcept;

	/**
	 * Stop the worker; invocations which are still queued will
	 * never be executed.  Waits up to the given duration for the
	 * worker to exit; if it does not (because a callback hangs),
	 * an error is logged and this method returns anyway.
	 *
	 * Calling this more than once is allowed; all but the first
	 * call return immediately.
	 */
	void Shutdown(Duration timeout=DEFAULT_SHUTDOWN_TIMEOUT) noexcept;

	/**
	 * Stop the worker but keep the queue, so it can be drained
	 * after ResumeAfterForkInParent().  Waits (without a timeout)
	 * until the worker has exited, i.e. until the current
	 * callback (if any) has returned.
	 *
	 * If no worker is alive, this is a no-op and the state stays
	 * #State::RUNNING.  If another thread is already pausing,
	 * this waits until that one has joined the worker.
	 *
	 * Calling this from inside a callback is a no-op, because the
	 * worker cannot join itself.
	 */
	void PauseBeforeForkInParent() noexcept;

	/**
	 * Restart the worker after PauseBeforeForkInParent().  The
	 * new worker continues with the invocations which were queued
	 * before the pause.
	 *
	 * Throws std::logic_error if the state is not #State::PAUSED
	 * or if there is still a worker; throws std::system_error if
	 * the thread could not be created.
	 */
	void ResumeAfterForkInParent();

	/**
	 * Like ResumeAfterForkInParent(), but for the forked child:
	 * the invocations queued in the parent are discarded and the
	 * new worker only runs what the child enqueues.
	 */
	void ResumeAfterForkInChild();

	/**
	 * Start a new worker if the state is #State::RUNNING but there
	 * is no worker in this process; this is what a forked child
	 * needs to do, because fork() does not duplicate the
	 * worker.  In all other cases, this is a no-op.
	 *
	 * Throws std::system_error if the thread could not be
	 * created.
	 */
	void ReopenAfterFork();

private:
	/**
	 * Caller must hold the lock.
	 */
	bool IsWorkerAliveLocked() const noexcept {
		return worker_running && thread_pid.load() == getpid();
	}

	/**
	 * Caller must hold the lock.
	 */
	void SpawnWorker();

	/**
	 * If we're in a forked child and haven't yet cleaned up,
	 * call ForgetParent().
	 */
	void CheckForked() const noexcept {
		if (owner_pid.load() != getpid())
			/* discarding the parent's state is not a
			   logical modification */
			const_cast<CallbackThread *>(this)->ForgetParent();
	}

	/**
	 * Discard the worker handle and the queue inherited from the
	 * parent process.  Only to be called in a forked child.
	 */
	void ForgetParent() noexcept;

	/**
	 * Caller must hold the lock.
	 */
	bool IsInsideWorker() const noexcept {
		return worker_id == std::this_thread::get_id();
	}

	/**
	 * Caller must hold the lock.
	 */
	void Resume();

	void Run() noexcept;

	/**
	 * @return false if a callback has forked and this is the
	 * child process
	 */
	bool RunLoop(pid_t pid);

	void Invoke(Invocation &invocation);
};

[[gnu::const]]
const char *
ToString(CallbackThread::State state) noexcept;
