// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#pragma once

#include <cstddef>
#include <iterator>
#include <type_traits>

struct IntrusiveListHook {
	IntrusiveListHook *next = nullptr, *prev = nullptr;

	bool is_linked() const noexcept {
		return next != nullptr;
	}

	void unlink() noexcept {
		next->prev = prev;
		prev->next = next;
		next = prev = nullptr;
	}
};

/**
 * A doubly linked list which does not allocate; the items derive
 * from #IntrusiveListHook.  The caller owns the items.
 */
template<typename T>
class IntrusiveList {
	IntrusiveListHook head{&head, &head};

	static constexpr T *Cast(IntrusiveListHook *hook) noexcept {
		static_assert(std::is_base_of_v<IntrusiveListHook, T>);
		return static_cast<T *>(hook);
	}

public:
	IntrusiveList() = default;

	IntrusiveList(const IntrusiveList &) = delete;
	IntrusiveList &operator=(const IntrusiveList &) = delete;

	constexpr bool empty() const noexcept {
		return head.next == &head;
	}

	std::size_t size() const noexcept {
		std::size_t n = 0;
		for (auto *i = head.next; i != &head; i = i->next)
			++n;
		return n;
	}

	T &front() noexcept {
		return *Cast(head.next);
	}

	class iterator final {
		friend IntrusiveList;

		IntrusiveListHook *cursor;

		constexpr iterator(IntrusiveListHook *_cursor) noexcept
			:cursor(_cursor) {}

	public:
		using iterator_category = std::forward_iterator_tag;
		using value_type = T;
		using difference_type = std::ptrdiff_t;
		using pointer = T *;
		using reference = T &;

		iterator() = default;

		constexpr bool operator==(const iterator &other) const noexcept {
			return cursor == other.cursor;
		}

		constexpr bool operator!=(const iterator &other) const noexcept {
			return !(*this == other);
		}

		constexpr T &operator*() const noexcept {
			return *Cast(cursor);
		}

		constexpr T *operator->() const noexcept {
			return Cast(cursor);
		}

		iterator &operator++() noexcept {
			cursor = cursor->next;
			return *this;
		}
	};

	constexpr iterator begin() noexcept {
		return {head.next};
	}

	constexpr iterator end() noexcept {
		return {&head};
	}

	void push_back(T &t) noexcept {
		head.prev->next = &t;
		t.prev = head.prev;
		head.prev = &t;
		t.next = &head;
	}

	void erase(T &t) noexcept {
		t.unlink();
	}
};
