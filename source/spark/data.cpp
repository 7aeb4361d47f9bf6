#include <fmt/format.h>

#include "common/error.hpp"
#include "spark/context.hpp"
#include "spark/data.hpp"

namespace spark {

MODULE(data);

static const char *tbl_scalar_glsl[] = {
	"bool",
	"int",
	"uint",
	"float",
};

static const char *tbl_scalar_label[] = {
	"bool",
	"i32",
	"u32",
	"f32",
};

static const char *tbl_vector_prefix[] = {
	"b",
	"i",
	"u",
	"",
};

static uint64_t round_up(uint64_t value, uint64_t alignment)
{
	return (value + alignment - 1) / alignment * alignment;
}

std::string DataType::declare(ResolutionContext &ctx, const std::string &name)
{
	return ctx.resolve(*this) + " " + name;
}

// Scalars
bool Scalar::same_as(const DataType &other) const
{
	auto s = dynamic_cast <const Scalar *> (&other);
	return s && s->scalar == scalar;
}

std::string Scalar::label() const
{
	return tbl_scalar_label[scalar];
}

std::string Scalar::resolve(ResolutionContext &)
{
	return tbl_scalar_glsl[scalar];
}

// Vectors
bool Vector::same_as(const DataType &other) const
{
	auto v = dynamic_cast <const Vector *> (&other);
	return v && v->component == component && v->count == count;
}

std::string Vector::label() const
{
	return fmt::format("vec{}{}", count, tbl_scalar_label[component][0]);
}

std::string Vector::resolve(ResolutionContext &)
{
	return fmt::format("{}vec{}", tbl_vector_prefix[component], count);
}

// Matrices
bool Matrix::same_as(const DataType &other) const
{
	auto m = dynamic_cast <const Matrix *> (&other);
	return m && m->order == order;
}

std::string Matrix::label() const
{
	return fmt::format("mat{}x{}f", order, order);
}

std::string Matrix::resolve(ResolutionContext &)
{
	return fmt::format("mat{}", order);
}

// Structures
std::vector <uint64_t> Struct::offsets() const
{
	std::vector <uint64_t> result;

	uint64_t offset = 0;
	for (auto &[_, type] : fields) {
		offset = round_up(offset, type->alignment());
		result.push_back(offset);
		offset += type->size();
	}

	return result;
}

uint64_t Struct::alignment() const
{
	uint64_t result = 4;
	for (auto &[_, type] : fields)
		result = std::max(result, type->alignment());

	return result;
}

uint64_t Struct::size() const
{
	if (fields.empty())
		return 0;

	uint64_t end = offsets().back() + fields.back().second->size();
	return round_up(end, alignment());
}

bool Struct::same_as(const DataType &other) const
{
	auto s = dynamic_cast <const Struct *> (&other);
	if (!s || s->fields.size() != fields.size())
		return false;

	for (size_t i = 0; i < fields.size(); i++) {
		if (fields[i].first != s->fields[i].first)
			return false;

		if (!fields[i].second->same_as(*s->fields[i].second))
			return false;
	}

	return true;
}

std::string Struct::resolve(ResolutionContext &ctx)
{
	Identifier identifier(name);
	std::string id = ctx.resolve(identifier);

	// Field types are declared first
	std::string body;
	for (auto &[field, type] : fields)
		body += fmt::format("    {};\n", type->declare(ctx, field));

	ctx.add_declaration(fmt::format("struct {} {{\n{}}};\n", id, body));

	return id;
}

// Arrays
uint64_t Array::stride() const
{
	return round_up(element->size(), element->alignment());
}

bool Array::same_as(const DataType &other) const
{
	auto a = dynamic_cast <const Array *> (&other);
	return a && a->count == count && element->same_as(*a->element);
}

std::string Array::label() const
{
	return fmt::format("array<{}, {}>", element->label(), count);
}

std::string Array::resolve(ResolutionContext &ctx)
{
	return fmt::format("{}[{}]", ctx.resolve(*element), count);
}

std::string Array::declare(ResolutionContext &ctx, const std::string &name)
{
	return element->declare(ctx, fmt::format("{}[{}]", name, count));
}

namespace data {

data_ref struct_of(const std::string &name, const std::vector <Struct::field> &fields)
{
	return std::make_shared <Struct> (name, fields);
}

data_ref array_of(const data_ref &element, uint32_t count)
{
	if (count == 0)
		SPARK_RAISE(UnsupportedDataShapeError, element->label() + "[]", "arrays must have a fixed element count");

	return std::make_shared <Array> (element, count);
}

} // namespace data

} // namespace spark
