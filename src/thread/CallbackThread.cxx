// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "CallbackThread.hxx"

#include <fmt/core.h>

#include <memory> // for std::construct_at()
#include <new> // for std::bad_alloc
#include <stdexcept>

using std::string_view_literals::operator""sv;

const char *
ToString(CallbackThread::State state) noexcept
{
	switch (state) {
	case CallbackThread::State::RUNNING:
		return "running";

	case CallbackThread::State::PAUSED:
		return "paused";

	case CallbackThread::State::SHUTDOWN:
		return "shutdown";
	}

	return "?";
}

CallbackThread::CallbackThread(std::string_view name)
	:logger(name)
{
	logger(5, "starting");

	const std::scoped_lock lock{mutex};
	SpawnWorker();
}

CallbackThread::~CallbackThread() noexcept
{
	Shutdown();

	if (thread_pid.load() != 0)
		/* the worker did not exit within the shutdown timeout;
		   we can't destroy the object while it still runs */
		thread.join();
}

void
CallbackThread::Enqueue(Invocation &&invocation)
{
	CheckForked();

	const std::scoped_lock lock{mutex};
	queue.emplace_back(std::move(invocation));
	cond.notify_one();
}

CallbackThread::State
CallbackThread::GetState() const noexcept
{
	CheckForked();

	const std::scoped_lock lock{mutex};
	return state;
}

bool
CallbackThread::IsWorkerAlive() const noexcept
{
	CheckForked();

	const std::scoped_lock lock{mutex};
	return IsWorkerAliveLocked();
}

std::size_t
CallbackThread::GetPendingCount() const noexcept
{
	CheckForked();

	const std::scoped_lock lock{mutex};
	return queue.size();
}

void
CallbackThread::Shutdown(Duration timeout) noexcept
{
	logger(5, "shutdown");

	CheckForked();

	std::unique_lock lock{mutex};

	if (state == State::SHUTDOWN)
		return;

	/* if the state is PAUSED, PauseBeforeForkInParent() owns the
	   worker handle and will join it */
	const bool was_running = state == State::RUNNING;

	state = State::SHUTDOWN;
	cond.notify_all();

	if (!was_running || !IsWorkerAliveLocked() || IsInsideWorker())
		return;

	if (!cond.wait_for(lock, timeout, [this]{ return !worker_running; })) {
		const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(timeout);
		logger.Fmt(1, "Timed out after {}ms waiting for the dispatch thread"sv,
			   ms.count());
		return;
	}

	/* the worker has left its loop and doesn't need the lock
	   anymore */
	thread.join();
	thread_pid = 0;
	worker_id = {};
}

void
CallbackThread::PauseBeforeForkInParent() noexcept
{
	CheckForked();

	std::unique_lock lock{mutex};

	if (IsInsideWorker()) {
		/* probably fork() inside a callback */
		logger(2, "Cannot pause the dispatch thread from inside a callback");
		return;
	}

	if (state == State::PAUSED) {
		/* somebody else may still be joining the worker */
		cond.wait(lock, [this]{ return thread_pid.load() == 0; });
		return;
	}

	if (!IsWorkerAliveLocked() || state != State::RUNNING)
		return;

	state = State::PAUSED;
	cond.notify_all();
	lock.unlock();

	logger(5, "joining dispatch thread");

	/* without the lock, because the worker needs it to observe
	   the new state */
	thread.join();

	lock.lock();
	thread_pid = 0;
	worker_id = {};
	cond.notify_all();
}

void
CallbackThread::ResumeAfterForkInParent()
{
	logger(5, "resume");

	CheckForked();

	const std::scoped_lock lock{mutex};
	Resume();
}

void
CallbackThread::ResumeAfterForkInChild()
{
	logger(5, "resume in child");

	CheckForked();

	const std::scoped_lock lock{mutex};
	Resume();
}

void
CallbackThread::Resume()
{
	if (state != State::PAUSED)
		throw std::logic_error{fmt::format("Cannot resume dispatch thread in state '{}'"sv,
						   ToString(state))};

	if (thread_pid.load() != 0)
		throw std::logic_error{"Cannot resume: dispatch thread still exists"};

	state = State::RUNNING;
	SpawnWorker();
}

void
CallbackThread::ReopenAfterFork()
{
	logger(5, "reopen");

	CheckForked();

	const std::scoped_lock lock{mutex};

	if (state != State::RUNNING) {
		logger(5, "not reopening in state ", ToString(state));
		return;
	}

	if (IsWorkerAliveLocked()) {
		logger(5, "dispatch thread is still alive");
		return;
	}

	SpawnWorker();
}

void
CallbackThread::SpawnWorker()
{
	thread = std::thread{&CallbackThread::Run, this};
	worker_id = thread.get_id();
	thread_pid = getpid();
	worker_running = true;
}

void
CallbackThread::ForgetParent() noexcept
{
	logger(5, "forked: discarding the parent's dispatch thread and queue");

	/* the worker (and whoever held the lock at the time of the
	   fork) exists only in the parent; the old objects may be
	   locked or have waiters which will never wake up, and their
	   destructors must not run */
	std::construct_at(&mutex);
	std::construct_at(&cond);
	std::construct_at(&thread);

	worker_id = {};
	thread_pid = 0;
	worker_running = false;

	/* these are delivered by the parent */
	queue.clear();

	owner_pid = getpid();
}

inline void
CallbackThread::Invoke(Invocation &invocation)
try {
	invocation();
} catch (const std::bad_alloc &) {
	/* out of memory is not recoverable; let it terminate the
	   process */
	throw;
} catch (...) {
	logger(1, "Callback failed: ", std::current_exception());
}

bool
CallbackThread::RunLoop(const pid_t pid)
{
	while (true) {
		Invocation invocation;

		{
			std::unique_lock lock{mutex};
			cond.wait(lock, [this]{
				return !queue.empty() || state != State::RUNNING;
			});

			if (state != State::RUNNING) {
				/* items still in the queue are left
				   for the next worker (PAUSED) or
				   abandoned (SHUTDOWN) */
				logger(2, "state is ", ToString(state),
				       ", returning");
				return true;
			}

			invocation = std::move(queue.front());
			queue.pop_front();
		}

		Invoke(invocation);

		if (getpid() != pid)
			/* the callback has forked and this is the
			   child process; the object belongs to the
			   child's new worker (if any) now */
			return false;
	}
}

void
CallbackThread::Run() noexcept
{
	if (!RunLoop(getpid())) {
		logger(5, "forked inside a callback, leaving the dispatch thread");
		return;
	}

	const std::scoped_lock lock{mutex};
	worker_running = false;
	cond.notify_all();

	logger(5, "dispatch thread returning");
}
