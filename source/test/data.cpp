#include "util.hpp"

#include "common/error.hpp"
#include "spark/context.hpp"
#include "spark/data.hpp"

using namespace spark;

TEST(data, scalar_and_vector_layout)
{
	EXPECT_EQ(data::u32->size(), 4);
	EXPECT_EQ(data::u32->alignment(), 4);

	EXPECT_EQ(data::vec2f->size(), 8);
	EXPECT_EQ(data::vec2f->alignment(), 8);

	EXPECT_EQ(data::vec3f->size(), 12);
	EXPECT_EQ(data::vec3f->alignment(), 16);

	EXPECT_EQ(data::vec4i->size(), 16);
	EXPECT_EQ(data::vec4i->alignment(), 16);
}

TEST(data, matrix_layout)
{
	EXPECT_EQ(data::mat2f->size(), 16);
	EXPECT_EQ(data::mat2f->alignment(), 8);

	EXPECT_EQ(data::mat3f->size(), 48);
	EXPECT_EQ(data::mat4f->size(), 64);
	EXPECT_EQ(data::mat4f->alignment(), 16);
}

TEST(data, struct_layout)
{
	auto particle = data::struct_of("Particle", {
		{ "mass", data::f32 },
		{ "position", data::vec3f },
		{ "id", data::u32 },
	});

	auto structure = std::static_pointer_cast <Struct> (particle);
	EXPECT_EQ(structure->offsets(), (std::vector <uint64_t> { 0, 16, 28 }));
	EXPECT_EQ(particle->alignment(), 16);
	EXPECT_EQ(particle->size(), 32);
}

TEST(data, array_layout)
{
	auto positions = data::array_of(data::vec3f, 4);
	auto array = std::static_pointer_cast <Array> (positions);

	EXPECT_EQ(array->stride(), 16);
	EXPECT_EQ(positions->size(), 64);
	EXPECT_EQ(positions->alignment(), 16);
	EXPECT_EQ(positions->label(), "array<vec3f, 4>");
}

TEST(data, runtime_sized_arrays_are_rejected)
{
	EXPECT_THROW(data::array_of(data::u32, 0), UnsupportedDataShapeError);
}

TEST(data, structural_equality)
{
	auto a = data::struct_of("A", { { "x", data::f32 }, { "y", data::vec2f } });
	auto b = data::struct_of("A", { { "x", data::f32 }, { "y", data::vec2f } });
	auto c = data::struct_of("A", { { "x", data::f32 }, { "y", data::vec3f } });

	EXPECT_TRUE(a->same_as(*b));
	EXPECT_FALSE(a->same_as(*c));
	EXPECT_FALSE(data::u32->same_as(*data::i32));
	EXPECT_TRUE(data::array_of(data::u32, 3)->same_as(*data::array_of(data::u32, 3)));
}

TEST(data, glsl_spelling)
{
	StrictNameRegistry registry;
	BindingPlan plan;
	ResolutionContext ctx(registry, plan, nullptr, gpu::ShaderStage::compute);

	EXPECT_EQ(ctx.resolve(*data::boolean), "bool");
	EXPECT_EQ(ctx.resolve(*data::i32), "int");
	EXPECT_EQ(ctx.resolve(*data::vec3u), "uvec3");
	EXPECT_EQ(ctx.resolve(*data::vec4f), "vec4");
	EXPECT_EQ(ctx.resolve(*data::mat4f), "mat4");
	EXPECT_EQ(data::array_of(data::u32, 8)->declare(ctx, "counts"), "uint counts[8]");
	EXPECT_TRUE(ctx.declarations().empty());
}

TEST(data, struct_declaration)
{
	StrictNameRegistry registry;
	BindingPlan plan;
	ResolutionContext ctx(registry, plan, nullptr, gpu::ShaderStage::compute);

	auto particle = data::struct_of("Particle", {
		{ "position", data::vec3f },
		{ "mass", data::f32 },
	});

	EXPECT_EQ(ctx.resolve(*particle), "Particle");
	EXPECT_EQ(ctx.resolve(*particle), "Particle");

	ASSERT_EQ(ctx.declarations().size(), 1);
	check_shader_sources(ctx.declarations()[0], R"(
struct Particle {
    vec3 position;
    float mass;
};
)");
}
