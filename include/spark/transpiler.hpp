#pragma once

#include <string>
#include <vector>

namespace spark {

// Host-side function whose body is translated into shader code
struct HostFunction {
	std::string name;
	std::string source;
};

struct Transpilation {
	// Free variables of the body, in order of first appearance
	std::vector <std::string> external_names;
	std::vector <std::string> arg_names;

	// Braced shader body
	std::string body;
};

// Must be deterministic for the same host function
struct Transpiler {
	virtual ~Transpiler() = default;

	virtual Transpilation transpile(const HostFunction &) = 0;
};

} // namespace spark
