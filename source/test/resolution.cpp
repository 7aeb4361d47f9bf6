#include "util.hpp"

#include "common/error.hpp"
#include "gpu/recording.hpp"
#include "spark/context.hpp"
#include "spark/root.hpp"

using namespace spark;

struct resolution : ::testing::Test {
	std::shared_ptr <gpu::RecordingDevice> device = std::make_shared <gpu::RecordingDevice> ();
	Root root { device };

	buffer_ref counts = root.create_buffer(data::array_of(data::u32, 4), gpu::BufferUsageFlags::storage, "counts");
	buffer_ref params = root.create_buffer(data::u32, gpu::BufferUsageFlags::uniform, "params");
	buffer_ref weights = root.create_buffer(data::array_of(data::f32, 4), gpu::BufferUsageFlags::storage, "weights");
};

TEST_F(resolution, catchall_only)
{
	auto main = compute_fn(glm::uvec3(64, 1, 1), "() { counts[0] = params; }");
	main->named("main").uses({
		{ "counts", as_mutable(counts) },
		{ "params", as_uniform(params) },
	});

	auto result = resolve(main);

	check_shader_sources(result.source(), R"(
#version 450

layout(set = 0, binding = 0, std430) buffer counts_block {
    uint counts[4];
};

layout(set = 0, binding = 1, std140) uniform params_block {
    uint params;
};

layout(local_size_x = 64, local_size_y = 1, local_size_z = 1) in;
void main_1() { counts[0] = params; }

void main()
{
    main_1();
}
)");

	ASSERT_TRUE(result.catchall.has_value());
	EXPECT_EQ(result.catchall->index, 0);
	ASSERT_EQ(result.layouts.size(), 1);

	auto &catchall = result.layouts[0];
	EXPECT_EQ(catchall->label, "catchall");
	ASSERT_EQ(catchall->entries.size(), 2);
	EXPECT_EQ(catchall->entries[0].first, "counts");
	EXPECT_EQ(catchall->entries[0].second.kind, eMutable);
	EXPECT_EQ(catchall->entries[0].second.visibility, gpu::ShaderStage::compute);
	EXPECT_EQ(catchall->entries[1].first, "params");
	EXPECT_EQ(catchall->entries[1].second.kind, eUniform);

	auto &group = result.catchall->group;
	EXPECT_EQ(group->layout, catchall);
	EXPECT_EQ(group->resources.at("counts"), counts);
	EXPECT_EQ(group->resources.at("params"), params);
}

TEST_F(resolution, three_bindables_share_one_group)
{
	auto main = compute_fn(glm::uvec3(1, 1, 1), "() { counts[0] = params + uint(weights[0]); }");
	main->named("accumulate").uses({
		{ "counts", as_mutable(counts) },
		{ "params", as_uniform(params) },
		{ "weights", as_readonly(weights) },
	});

	auto result = resolve(main);

	ASSERT_TRUE(result.catchall);
	EXPECT_EQ(result.catchall->index, 0);
	ASSERT_EQ(result.layouts.size(), 1);
	EXPECT_EQ(result.layouts[0]->entries.size(), 3);
	EXPECT_EQ(result.layouts[0]->binding_of("weights"), 2u);
}

TEST_F(resolution, explicit_layouts_come_first)
{
	auto simulation = bind_group_layout("simulation", {
		{ "counts", mutable_entry(counts->type) },
		{ "params", uniform_entry(data::u32) },
	});

	auto main = compute_fn(glm::uvec3(1, 1, 1), "() { counts[0] = params + uint(weights[0]); }");
	main->named("accumulate").uses({
		{ "counts", simulation->bound("counts") },
		{ "params", simulation->bound("params") },
		{ "weights", as_readonly(weights) },
	});

	auto result = resolve(main);

	check_shader_sources(result.source(), R"(
#version 450

layout(set = 0, binding = 0, std430) buffer counts_block {
    uint counts[4];
};

layout(set = 0, binding = 1, std140) uniform params_block {
    uint params;
};

layout(set = 1, binding = 0, std430) readonly buffer weights_block {
    float weights[4];
};

layout(local_size_x = 1, local_size_y = 1, local_size_z = 1) in;
void accumulate() { counts[0] = params + uint(weights[0]); }

void main()
{
    accumulate();
}
)");

	ASSERT_EQ(result.layouts.size(), 2);
	EXPECT_EQ(result.layouts[0], simulation);
	ASSERT_TRUE(result.catchall);
	EXPECT_EQ(result.catchall->index, 1);
	EXPECT_EQ(result.layouts[1]->entries.size(), 1);
}

TEST_F(resolution, block_names_do_not_collide)
{
	auto one = fn({}, data::u32, "() { return 1u; }");
	one->named("counts_block");

	auto main = compute_fn(glm::uvec3(1, 1, 1), "() { uint first = counts_block(); counts[0] = first; }");
	main->named("main").uses({
		{ "counts_block", one },
		{ "counts", as_mutable(counts) },
	});

	check_shader_sources(resolve(main).source(), R"(
#version 450

uint counts_block() { return 1u; }

layout(set = 0, binding = 0, std430) buffer counts_block_1 {
    uint counts[4];
};

layout(local_size_x = 1, local_size_y = 1, local_size_z = 1) in;
void main_1() { uint first = counts_block(); counts[0] = first; }

void main()
{
    main_1();
}
)");
}

TEST_F(resolution, no_bindables_no_catchall)
{
	auto main = compute_fn(glm::uvec3(1, 1, 1), "() { }");
	main->named("noop");

	auto result = resolve(main);

	EXPECT_FALSE(result.catchall);
	EXPECT_TRUE(result.layouts.empty());
}

TEST_F(resolution, pinned_layouts_keep_their_index)
{
	auto frame = bind_group_layout("frame", {
		{ "params", uniform_entry(data::u32) },
	});

	auto simulation = bind_group_layout("simulation", {
		{ "counts", mutable_entry(counts->type) },
	});

	auto main = compute_fn(glm::uvec3(1, 1, 1), "() { counts[0] = params; }");
	main->named("main").uses({
		{ "counts", simulation->bound("counts") },
		{ "params", frame->bound("params") },
	});

	auto result = resolve(main, {}, { frame });

	ASSERT_EQ(result.layouts.size(), 2);
	EXPECT_EQ(result.layouts[0], frame);
	EXPECT_EQ(result.layouts[1], simulation);
	EXPECT_NE(result.source().find("layout(set = 1, binding = 0, std430) buffer counts_block"), std::string::npos);
	EXPECT_NE(result.source().find("layout(set = 0, binding = 0, std140) uniform params_block"), std::string::npos);
}

TEST_F(resolution, dependencies_before_dependents)
{
	auto bump = fn({ data::u32 }, data::u32, "(uint x) { return x + 1u; }");
	bump->named("bump");

	auto twice = fn({ data::u32 }, data::u32, "(uint x) { return bump(bump(x)); }");
	twice->named("twice").uses({ { "bump", bump } });

	auto main = compute_fn(glm::uvec3(1, 1, 1), "() { counts[0] = twice(counts[0]) + bump(0u); }");
	main->named("main").uses({
		{ "counts", as_mutable(counts) },
		{ "twice", twice },
		{ "bump", bump },
	});

	auto source = resolve(main).source();

	size_t counts_at = source.find("counts_block");
	size_t bump_at = source.find("uint bump(uint x)");
	size_t twice_at = source.find("uint twice(uint x)");
	size_t main_at = source.find("void main_1()");

	ASSERT_NE(bump_at, std::string::npos);
	ASSERT_NE(twice_at, std::string::npos);
	EXPECT_LT(counts_at, bump_at);
	EXPECT_LT(bump_at, twice_at);
	EXPECT_LT(twice_at, main_at);

	// Shared dependencies are declared once
	EXPECT_EQ(source.find("uint bump(uint x)", bump_at + 1), std::string::npos);
}

TEST_F(resolution, deterministic)
{
	auto increment = slot("increment", uint32_t(1));

	auto step = fn({ data::u32 }, data::u32, "(uint x) { return x + increment; }");
	step->named("step").uses({ { "increment", increment } });

	auto main = compute_fn(glm::uvec3(64, 1, 1), "() { counts[0] = step(counts[0]) * params; }");
	main->named("main").uses({
		{ "counts", as_mutable(counts) },
		{ "params", as_uniform(params) },
		{ "step", step },
	});

	slot_bindings slots { { increment, uint32_t(3) } };

	auto first = resolve(main, {}, {}, slots);
	auto second = resolve(main, {}, {}, slots);

	EXPECT_EQ(first.source(), second.source());
	EXPECT_NE(first.source().find("return x + 3u;"), std::string::npos);

	// Random names are reproducible from the seed
	Options options;
	options.naming = NamingStrategy::random;
	options.naming_seed = 7;

	EXPECT_EQ(resolve(main, options).source(), resolve(main, options).source());
}

TEST_F(resolution, random_naming)
{
	auto main = compute_fn(glm::uvec3(1, 1, 1), "() { counts[0] = 1u; }");
	main->named("main").uses({ { "counts", as_mutable(counts) } });

	Options options;
	options.naming = NamingStrategy::random;

	auto source = resolve(main, options).source();
	EXPECT_EQ(source.find("buffer counts_block {"), std::string::npos);
	EXPECT_NE(source.find("layout(set = 0, binding = 0, std430) buffer counts_"), std::string::npos);
}

TEST_F(resolution, glsl_version)
{
	auto main = compute_fn(glm::uvec3(1, 1, 1), "() { }");
	main->named("noop");

	Options options;
	options.glsl_version = "460";

	EXPECT_EQ(resolve(main, options).source().rfind("#version 460\n\n", 0), 0);
}

TEST_F(resolution, unbound_slot_in_program)
{
	auto increment = slot("increment");

	auto main = compute_fn(glm::uvec3(1, 1, 1), "() { counts[0] = increment; }");
	main->named("main").uses({
		{ "counts", as_mutable(counts) },
		{ "increment", increment },
	});

	try {
		resolve(main);
		FAIL() << "unbound slots must be reported";
	} catch (const Error &e) {
		EXPECT_EQ(e.kind, eUnboundSlot);
	}

	auto result = resolve(main, {}, {}, { { increment, uint32_t(2) } });
	EXPECT_NE(result.source().find("counts[0] = 2u;"), std::string::npos);
}

TEST_F(resolution, render_program_shares_bindings)
{
	auto positions = root.create_buffer(data::array_of(data::vec2f, 3), gpu::BufferUsageFlags::vertex, "positions");

	auto vs = vertex_fn({ { "shade", data::f32 } },
		"() { shade = params; gl_Position = vec4(positions, 0.0, 1.0); }");
	vs->named("vs").uses({
		{ "params", as_uniform(params) },
		{ "positions", as_vertex(positions) },
	});

	auto fs = fragment_fn({ { "shade", data::f32 } }, { { "color", data::vec4f } },
		"() { color = vec4(shade * params); }");
	fs->named("fs").uses({ { "params", as_uniform(params) } });

	auto result = resolve_program({
		{ gpu::ShaderStage::vertex, vs },
		{ gpu::ShaderStage::fragment, fs },
	}, {}, {}, {}, nullptr);

	ASSERT_EQ(result.sources.size(), 2);
	ASSERT_TRUE(result.catchall);
	EXPECT_EQ(result.catchall->index, 0);

	auto &catchall = result.layouts[0];
	ASSERT_EQ(catchall->entries.size(), 1);
	EXPECT_EQ(catchall->entries[0].second.visibility,
		gpu::ShaderStage::vertex | gpu::ShaderStage::fragment);

	ASSERT_EQ(result.vertex_buffers.size(), 1);
	EXPECT_EQ(result.vertex_buffers[0].location, 0);
	EXPECT_NE(result.sources[0].find("layout(location = 0) in vec2 positions;"), std::string::npos);
	EXPECT_NE(result.sources[1].find("layout(set = 0, binding = 0, std140) uniform"), std::string::npos);
}
