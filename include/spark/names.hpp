#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <random>
#include <set>
#include <string>

#include "resolvable.hpp"

namespace spark {

// Turns an arbitrary label into a legal GLSL identifier
std::string sanitize(const std::string &);

bool reserved_word(const std::string &);

// Allocates names for identifiers within one resolution pass
struct NameRegistry {
	virtual ~NameRegistry() = default;

	// Idempotent for the same identifier
	std::string name_for(const Identifier &);

	// Marks a name as taken without assigning it
	void reserve(const std::string &);

	bool taken(const std::string &) const;
protected:
	std::set <std::string> used;
	std::map <uint64_t, std::string> assigned;

	// Proposes a fresh name for a sanitized hint
	virtual std::string fresh(const std::string &) = 0;
};

// Prefers the label itself, then label_1, label_2, ...
struct StrictNameRegistry : NameRegistry {
protected:
	std::map <std::string, uint32_t> counters;

	std::string fresh(const std::string &) override;
};

// Appends a random suffix to every label
struct RandomNameRegistry : NameRegistry {
	RandomNameRegistry(uint64_t seed = 0) : generator(seed) {}
protected:
	std::mt19937_64 generator;

	std::string fresh(const std::string &) override;
};

enum class NamingStrategy {
	strict,
	random,
};

std::unique_ptr <NameRegistry> make_registry(NamingStrategy, uint64_t = 0);

} // namespace spark
