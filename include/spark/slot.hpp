#pragma once

#include <optional>
#include <utility>
#include <vector>

#include "resolvable.hpp"

namespace spark {

// Compile-time parameter; its bound value is substituted
// wherever the slot is referenced
struct Slot : Resolvable {
	std::string name;
	std::optional <Value> default_value;

	Slot(const std::string &name_, const std::optional <Value> &default_value_ = std::nullopt)
			: name(name_), default_value(default_value_) {}

	std::string label() const override {
		return name;
	}

	std::string resolve(ResolutionContext &) override;
};

using slot_ref = std::shared_ptr <Slot>;
using slot_binding = std::pair <slot_ref, Value>;
using slot_bindings = std::vector <slot_binding>;

slot_ref slot(const std::string &, const std::optional <Value> & = std::nullopt);

// Dynamically scoped stack of slot bindings
struct SlotEnvironment {
	struct binding {
		const Slot *slot;
		Value value;
	};

	std::vector <binding> stack;

	// Returns the size to restore once the bindings go out of scope
	size_t push(const slot_bindings &);
	void restore(size_t);

	// Most recent binding first; the position in the stack is returned as well
	std::optional <std::pair <size_t, Value>> find(const Slot &) const;

	size_t size() const {
		return stack.size();
	}
};

// Bindings live exactly as long as the scope, including on unwinding
struct SlotScope {
	SlotEnvironment &env;
	size_t mark;

	SlotScope(SlotEnvironment &env_, const slot_bindings &bindings)
			: env(env_), mark(env_.push(bindings)) {}

	SlotScope(const SlotScope &) = delete;
	SlotScope &operator=(const SlotScope &) = delete;

	~SlotScope() {
		env.restore(mark);
	}
};

// Resolves an item under additional slot bindings
struct SlotBound : Resolvable {
	resolvable_ref inner;
	slot_bindings bindings;

	SlotBound(const resolvable_ref &inner_, const slot_bindings &bindings_)
			: inner(inner_), bindings(bindings_) {}

	std::string label() const override {
		return inner->label();
	}

	std::string resolve(ResolutionContext &) override;
};

resolvable_ref with(const resolvable_ref &, const slot_ref &, const Value &);

} // namespace spark
