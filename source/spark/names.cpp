#include <fmt/format.h>

#include "common/logging.hpp"
#include "spark/names.hpp"

namespace spark {

MODULE(names);

static const std::set <std::string> glsl_reserved {
	// Entry point of every generated module
	"main",

	// Keywords
	"attribute", "const", "uniform", "varying", "buffer", "shared",
	"coherent", "volatile", "restrict", "readonly", "writeonly",
	"layout", "centroid", "flat", "smooth", "noperspective", "patch",
	"sample", "break", "continue", "do", "for", "while", "switch",
	"case", "default", "if", "else", "subroutine", "in", "out", "inout",
	"true", "false", "invariant", "precise", "discard", "return",
	"lowp", "mediump", "highp", "precision", "struct", "void",

	// Types
	"bool", "int", "uint", "float", "double",
	"vec2", "vec3", "vec4", "ivec2", "ivec3", "ivec4",
	"uvec2", "uvec3", "uvec4", "bvec2", "bvec3", "bvec4",
	"mat2", "mat3", "mat4", "sampler2D", "image2D",

	// Reserved for future use
	"common", "partition", "active", "asm", "class", "union", "enum",
	"typedef", "template", "this", "resource", "goto", "inline",
	"noinline", "public", "static", "extern", "external", "interface",
	"long", "short", "half", "fixed", "unsigned", "superp", "input",
	"output", "filter", "sizeof", "cast", "namespace", "using",
};

bool reserved_word(const std::string &name)
{
	return glsl_reserved.contains(name);
}

std::string sanitize(const std::string &label)
{
	std::string result;
	for (char c : label) {
		bool legal = std::isalnum(static_cast <unsigned char> (c)) || c == '_';
		char r = legal ? c : '_';

		// Consecutive underscores are reserved in GLSL
		if (r == '_' && !result.empty() && result.back() == '_')
			continue;

		result += r;
	}

	if (!result.empty() && std::isdigit(static_cast <unsigned char> (result.front())))
		result = "_" + result;

	// The gl_ prefix belongs to built-in variables
	if (result.starts_with("gl_"))
		result = "u" + result;

	if (result == "_")
		return "";

	return result;
}

std::string NameRegistry::name_for(const Identifier &identifier)
{
	auto it = assigned.find(identifier.id);
	if (it != assigned.end())
		return it->second;

	std::string name = fresh(sanitize(identifier.hint));
	SPARK_ASSERT(!used.contains(name), "registry proposed a taken name \"{}\"", name);

	used.insert(name);
	assigned[identifier.id] = name;

	return name;
}

void NameRegistry::reserve(const std::string &name)
{
	used.insert(name);
}

bool NameRegistry::taken(const std::string &name) const
{
	return used.contains(name) || reserved_word(name);
}

std::string StrictNameRegistry::fresh(const std::string &base)
{
	if (!base.empty() && !taken(base))
		return base;

	// Unlabelled items are numbered _0, _1, ...
	std::string prefix = base.empty() ? "" : base;

	auto &counter = counters[prefix];
	if (!base.empty() && counter == 0)
		counter = 1;

	std::string name;
	do {
		name = fmt::format("{}_{}", prefix, counter++);
	} while (taken(name));

	return name;
}

std::string RandomNameRegistry::fresh(const std::string &base)
{
	static constexpr char alphabet[] = "abcdefghijklmnopqrstuvwxyz0123456789";

	std::string prefix = base.empty() ? "item" : base;
	std::uniform_int_distribution <size_t> pick(0, sizeof(alphabet) - 2);

	std::string name;
	do {
		std::string suffix;
		for (int i = 0; i < 6; i++)
			suffix += alphabet[pick(generator)];

		name = prefix + "_" + suffix;
	} while (taken(name));

	return name;
}

std::unique_ptr <NameRegistry> make_registry(NamingStrategy strategy, uint64_t seed)
{
	switch (strategy) {
	case NamingStrategy::strict:
		return std::make_unique <StrictNameRegistry> ();
	case NamingStrategy::random:
		return std::make_unique <RandomNameRegistry> (seed);
	default:
		break;
	}

	SPARK_ABORT("unknown naming strategy #{}", static_cast <int> (strategy));
}

} // namespace spark
