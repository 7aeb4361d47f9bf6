#include <cmath>

#include <fmt/format.h>

#include "common/error.hpp"
#include "spark/context.hpp"
#include "spark/resolvable.hpp"

namespace spark {

MODULE(resolvable);

std::string literal(const Value &value)
{
	if (auto b = std::get_if <bool> (&value))
		return *b ? "true" : "false";

	if (auto i = std::get_if <int32_t> (&value))
		return fmt::format("{}", *i);

	if (auto u = std::get_if <uint32_t> (&value))
		return fmt::format("{}u", *u);

	if (auto f = std::get_if <float> (&value)) {
		if (!std::isfinite(*f)) {
			SPARK_RAISE(Error, eInvalidLiteral,
				fmt::format("{} has no GLSL literal form", *f));
		}

		std::string s = fmt::format("{}", *f);
		if (s.find_first_of(".en") == std::string::npos)
			s += ".0";

		return s;
	}

	SPARK_ABORT("resolvables have no literal form");
}

Identifier::Identifier(const std::string &hint_) : hint(hint_)
{
	static uint64_t counter = 0;
	id = counter++;
}

std::string Identifier::resolve(ResolutionContext &ctx)
{
	return ctx.names().name_for(*this);
}

} // namespace spark
