#include <fmt/format.h>
#include <fmt/ranges.h>

#include "common/error.hpp"
#include "spark/context.hpp"
#include "spark/function.hpp"

namespace spark {

MODULE(function);

static std::string trim(const std::string &s)
{
	static constexpr const char ws[] = " \t\n\r\f\v";
	size_t first = s.find_first_not_of(ws);
	if (first == std::string::npos)
		return "";

	size_t last = s.find_last_not_of(ws);
	return s.substr(first, last - first + 1);
}

// Function core
void FunctionCore::apply_externals(const ExternalMap &additions)
{
	spark::apply_externals(externals, additions);
}

void FunctionCore::set_transpilation(const Transpilation &transpilation_)
{
	transpilation = transpilation_;
}

const Transpilation &FunctionCore::transpiled(ResolutionContext &ctx)
{
	if (transpilation)
		return *transpilation;

	auto transpiler = ctx.transpiler();
	if (!transpiler) {
		SPARK_RAISE(Error, eMissingTranspiler,
			fmt::format("function '{}' is implemented by a host function, "
				"but no transpiler is configured", label));
	}

	transpilation = transpiler->transpile(std::get <HostFunction> (implementation));
	return *transpilation;
}

std::string FunctionCore::resolve(ResolutionContext &ctx, const Signature &signature)
{
	Identifier identifier(label);

	if (auto code = std::get_if <std::string> (&implementation)) {
		std::string name = ctx.resolve(identifier);
		std::string body = replace_externals(ctx, externals, trim(*code));

		ctx.add_declaration(fmt::format("{}{} {}{}\n",
			signature.attribute,
			signature.returns,
			name, body));

		return name;
	}

	auto &ast = transpiled(ctx);

	std::vector <std::string> missing;
	for (auto &external : ast.external_names) {
		if (!externals.contains(external))
			missing.push_back(external);
	}

	if (!missing.empty())
		SPARK_RAISE(MissingLinksError, label, missing);

	if (ast.arg_names.size() != signature.args.size()) {
		SPARK_RAISE(Error, eArgumentMismatch,
			fmt::format("function '{}' takes {} arguments, but its transpiled body names {}",
				label, signature.args.size(), ast.arg_names.size()));
	}

	std::vector <std::string> parameters;
	for (size_t i = 0; i < signature.args.size(); i++)
		parameters.push_back(signature.args[i] + " " + ast.arg_names[i]);

	std::string name = ctx.resolve(identifier);
	std::string body = replace_externals(ctx, externals, trim(ast.body));

	ctx.add_declaration(fmt::format("{}{} {}({})\n{}\n",
		signature.attribute,
		signature.returns,
		name,
		fmt::join(parameters, ", "),
		body));

	return name;
}

// Functions
Function &Function::named(const std::string &label)
{
	core.label = label;
	return *this;
}

Function &Function::uses(const ExternalMap &externals)
{
	core.apply_externals(externals);
	return *this;
}

resolvable_ref Function::with(const slot_ref &s, const Value &value)
{
	return spark::with(shared_from_this(), s, value);
}

std::vector <std::string> Function::interface_names() const
{
	std::vector <std::string> names;

	if (auto vertex = std::get_if <VertexShell> (&shell)) {
		for (auto &v : vertex->outputs)
			names.push_back(v.name);
	} else if (auto fragment = std::get_if <FragmentShell> (&shell)) {
		for (auto &v : fragment->inputs)
			names.push_back(v.name);
		for (auto &v : fragment->targets)
			names.push_back(v.name);
	}

	return names;
}

static std::string declare_interface(ResolutionContext &ctx, const std::vector <Varying> &varyings, const char *direction)
{
	std::string result;
	for (size_t i = 0; i < varyings.size(); i++) {
		auto &v = varyings[i];
		result += fmt::format("layout(location = {}) {} {};\n", i, direction, v.type->declare(ctx, v.name));
	}

	return result;
}

std::string Function::resolve(ResolutionContext &ctx)
{
	for (auto &name : interface_names())
		ctx.names().reserve(name);

	Signature signature;
	signature.returns = "void";

	switch (shell.index()) {

	case 0:
	{
		auto &plain = std::get <PlainShell> (shell);
		for (auto &arg : plain.args)
			signature.args.push_back(ctx.resolve(*arg));

		if (plain.returns)
			signature.returns = ctx.resolve(*plain.returns);
	} break;

	case 1:
	{
		auto &size = std::get <ComputeShell> (shell).workgroup_size;
		signature.attribute = fmt::format("layout(local_size_x = {}, local_size_y = {}, local_size_z = {}) in;\n",
			size.x, size.y, size.z);
	} break;

	case 2:
	{
		auto &vertex = std::get <VertexShell> (shell);
		std::string outputs = declare_interface(ctx, vertex.outputs, "out");
		if (!outputs.empty())
			ctx.add_declaration(outputs);
	} break;

	case 3:
	{
		auto &fragment = std::get <FragmentShell> (shell);
		std::string interface = declare_interface(ctx, fragment.inputs, "in")
			+ declare_interface(ctx, fragment.targets, "out");
		if (!interface.empty())
			ctx.add_declaration(interface);
	} break;

	default:
		SPARK_ABORT("unknown function shell #{}", shell.index());
	}

	return core.resolve(ctx, signature);
}

function_ref fn(const std::vector <data_ref> &args, const data_ref &returns, const Implementation &implementation)
{
	return std::make_shared <Function> (PlainShell { args, returns }, implementation);
}

function_ref compute_fn(const glm::uvec3 &workgroup_size, const Implementation &implementation)
{
	return std::make_shared <Function> (ComputeShell { workgroup_size }, implementation);
}

function_ref vertex_fn(const std::vector <Varying> &outputs, const Implementation &implementation)
{
	return std::make_shared <Function> (VertexShell { outputs }, implementation);
}

function_ref fragment_fn(const std::vector <Varying> &inputs, const std::vector <Varying> &targets, const Implementation &implementation)
{
	return std::make_shared <Function> (FragmentShell { inputs, targets }, implementation);
}

} // namespace spark
