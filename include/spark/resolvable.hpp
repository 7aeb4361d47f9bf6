#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <variant>

namespace spark {

class ResolutionContext;

// Anything that can place declarations into a resolution
// pass, and which is referred to by the text it resolves to
struct Resolvable {
	virtual ~Resolvable() = default;

	virtual std::string label() const = 0;
	virtual std::string resolve(ResolutionContext &) = 0;

	// Memoized items are resolved at most once per distinct slot state
	virtual bool memoized() const {
		return true;
	}
};

using resolvable_ref = std::shared_ptr <Resolvable>;

// Compile-time values held by externals and slots; literals compare
// by value, resolvables by identity
using Value = std::variant <bool, int32_t, uint32_t, float, resolvable_ref>;

std::string literal(const Value &);

// Name request for a single declaration, the name itself is
// allocated by the name registry of the pass
struct Identifier : Resolvable {
	uint64_t id;
	std::string hint;

	Identifier(const std::string & = "");

	std::string label() const override {
		return hint;
	}

	std::string resolve(ResolutionContext &) override;

	bool memoized() const override {
		return false;
	}
};

} // namespace spark
