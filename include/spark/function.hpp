#pragma once

#include <optional>
#include <variant>
#include <vector>

#include <glm/glm.hpp>

#include "data.hpp"
#include "externals.hpp"
#include "slot.hpp"
#include "transpiler.hpp"

namespace spark {

// Either literal shader text starting at the parameter
// list, or a host function handed to the transpiler
using Implementation = std::variant <std::string, HostFunction>;

struct Varying {
	std::string name;
	data_ref type;
};

// Function shells; one per flavor of function
struct PlainShell {
	std::vector <data_ref> args;
	data_ref returns;
};

struct ComputeShell {
	glm::uvec3 workgroup_size;
};

struct VertexShell {
	std::vector <Varying> outputs;
};

struct FragmentShell {
	std::vector <Varying> inputs;
	std::vector <Varying> targets;
};

using Shell = std::variant <PlainShell, ComputeShell, VertexShell, FragmentShell>;

// Resolved signature handed to the function core
struct Signature {
	std::string attribute;
	std::string returns;
	std::vector <std::string> args;
};

// Linking and declaration logic common to every function
struct FunctionCore {
	std::string label;
	ExternalMap externals;
	Implementation implementation;
	std::optional <Transpilation> transpilation;

	FunctionCore(const Implementation &implementation_) : implementation(implementation_) {}

	void apply_externals(const ExternalMap &);
	void set_transpilation(const Transpilation &);

	// Declares the function and returns its identifier
	std::string resolve(ResolutionContext &, const Signature &);
private:
	const Transpilation &transpiled(ResolutionContext &);
};

struct Function : Resolvable, std::enable_shared_from_this <Function> {
	Shell shell;
	FunctionCore core;

	Function(const Shell &shell_, const Implementation &implementation)
			: shell(shell_), core(implementation) {}

	Function &named(const std::string &);
	Function &uses(const ExternalMap &);

	// Same function, resolved with the slot bound to the value
	resolvable_ref with(const slot_ref &, const Value &);

	std::string label() const override {
		return core.label;
	}

	std::string resolve(ResolutionContext &) override;

	// Varyings and targets declared by entry functions
	std::vector <std::string> interface_names() const;
};

using function_ref = std::shared_ptr <Function>;

function_ref fn(const std::vector <data_ref> &, const data_ref &, const Implementation &);
function_ref compute_fn(const glm::uvec3 &, const Implementation &);
function_ref vertex_fn(const std::vector <Varying> &, const Implementation &);
function_ref fragment_fn(const std::vector <Varying> &, const std::vector <Varying> &, const Implementation &);

} // namespace spark
