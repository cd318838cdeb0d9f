#ifndef SIGIL_STACK_BANK_HPP
#define SIGIL_STACK_BANK_HPP

#include <cstddef>
#include <deque>
#include <map>
#include <utility>
#include <vector>

#include "outcome.hpp"

namespace sigil {

// Index 0 is reserved: it is never created, pops and peeks on it curse and
// pushes onto it are dropped.
template<typename Number>
struct StackBank {
	using Stack = std::vector<Number>;

	void push(std::size_t index, Number value) {
		if (index == 0) return;
		m_stacks[index].push_back(std::move(value));
	}

	auto pop(std::size_t index) -> Outcome<Number> {
		if (index == 0) return {Number::zero(), true};
		auto& stack = m_stacks[index];
		if (stack.empty()) return {Number::zero(), true};
		Number value = std::move(stack.back());
		stack.pop_back();
		return {std::move(value), false};
	}

	auto peek(std::size_t index) -> Outcome<Number> {
		if (index == 0) return {Number::zero(), true};
		const auto& stack = m_stacks[index];
		if (stack.empty()) return {Number::zero(), true};
		return {stack.back(), false};
	}

	auto peek_sign(std::size_t index) -> Outcome<int> {
		auto top = peek(index);
		return {top.value.sign(), top.cursed};
	}

	// nullptr when the stack was never referenced
	const Stack* find(std::size_t index) const {
		auto it = m_stacks.find(index);
		if (it == m_stacks.end()) return nullptr;
		return &it->second;
	}

	std::size_t size(std::size_t index) const {
		const auto* stack = find(index);
		return stack == nullptr ? 0 : stack->size();
	}

	const std::map<std::size_t, Stack>& stacks() const { return m_stacks; }

 private:
	std::map<std::size_t, Stack> m_stacks {};
};

template<typename Number>
struct ValueQueue {
	void enqueue(Number value) { m_items.push_back(std::move(value)); }

	auto dequeue() -> Outcome<Number> {
		if (m_items.empty()) return {Number::zero(), true};
		Number value = std::move(m_items.front());
		m_items.pop_front();
		return {std::move(value), false};
	}

	std::size_t size() const { return m_items.size(); }
	bool empty() const { return m_items.empty(); }

	const std::deque<Number>& items() const { return m_items; }

 private:
	std::deque<Number> m_items {};
};

} // namespace sigil

#endif
