// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "ForkHook.hxx"
#include "CallbackThread.hxx"
#include "io/Logger.hxx"

#include <mutex>
#include <system_error>

#include <pthread.h>

static const LLogger fork_logger{"fork"};

class ForkHookContainer {
	std::mutex mutex;

	IntrusiveList<ForkHook> list;

public:
	void Add(ForkHook &h) noexcept {
		const std::scoped_lock lock{mutex};
		list.push_back(h);
	}

	void Remove(ForkHook &h) noexcept {
		const std::scoped_lock lock{mutex};
		list.erase(h);
	}

	/**
	 * Lock the container and invoke the function on each item.
	 * The lock is not released; call Unlock() after the fork.
	 */
	template<typename F>
	void LockAndForEach(F &&f) noexcept {
		mutex.lock();

		for (auto &i : list)
			f(i);
	}

	/**
	 * Invoke the function on each item and then release the lock
	 * obtained by LockAndForEach().
	 */
	template<typename F>
	void ForEachAndUnlock(F &&f) noexcept {
		for (auto &i : list) {
			try {
				f(i);
			} catch (...) {
				fork_logger(1, "Failed to restart dispatch thread after fork: ",
					    std::current_exception());
			}
		}

		mutex.unlock();
	}
};

static ForkHookContainer fork_hook_container;

static std::once_flag fork_handlers_installed;

static void
InstallForkHandlers()
{
	int error = pthread_atfork(ForkHook::PrepareAll,
				   ForkHook::ParentAll,
				   ForkHook::ChildAll);
	if (error != 0)
		throw std::system_error(error, std::system_category(),
					"pthread_atfork() failed");
}

ForkHook::ForkHook(CallbackThread &_thread)
	:thread(_thread)
{
	std::call_once(fork_handlers_installed, InstallForkHandlers);
	fork_hook_container.Add(*this);
}

ForkHook::~ForkHook() noexcept
{
	fork_hook_container.Remove(*this);
}

inline void
ForkHook::Prepare() noexcept
{
	const bool was_running = thread.IsRunning();
	thread.PauseBeforeForkInParent();
	paused = was_running &&
		thread.GetState() == CallbackThread::State::PAUSED;
}

inline void
ForkHook::Parent()
{
	if (paused) {
		paused = false;
		thread.ResumeAfterForkInParent();
	}
}

inline void
ForkHook::Child()
{
	if (paused) {
		paused = false;
		thread.ResumeAfterForkInChild();
	} else
		/* not paused because it was not running or because
		   fork() was called from inside a callback */
		thread.ReopenAfterFork();
}

void
ForkHook::PrepareAll() noexcept
{
	fork_logger(5, "pausing dispatch threads before fork");

	fork_hook_container.LockAndForEach([](ForkHook &h){
		h.Prepare();
	});
}

void
ForkHook::ParentAll() noexcept
{
	fork_hook_container.ForEachAndUnlock([](ForkHook &h){
		h.Parent();
	});
}

void
ForkHook::ChildAll() noexcept
{
	fork_hook_container.ForEachAndUnlock([](ForkHook &h){
		h.Child();
	});
}
