#include "util.hpp"

#include "common/error.hpp"
#include "gpu/recording.hpp"
#include "spark/context.hpp"
#include "spark/function.hpp"
#include "spark/root.hpp"

using namespace spark;

struct buffer : ::testing::Test {
	std::shared_ptr <gpu::RecordingDevice> device = std::make_shared <gpu::RecordingDevice> ();
	Root root { device };
};

TEST_F(buffer, usages_are_memoized)
{
	auto counts = root.create_buffer(data::array_of(data::u32, 16),
		gpu::BufferUsageFlags::storage | gpu::BufferUsageFlags::uniform,
		"counts");

	EXPECT_EQ(as_mutable(counts), as_mutable(counts));
	EXPECT_EQ(as_readonly(counts), as_readonly(counts));
	EXPECT_EQ(as_uniform(counts), as_uniform(counts));
	EXPECT_NE(as_mutable(counts), as_readonly(counts));
}

TEST_F(buffer, vertex_usages_per_step_mode)
{
	auto positions = root.create_buffer(data::array_of(data::vec2f, 3),
		gpu::BufferUsageFlags::vertex, "positions");

	auto per_vertex = as_vertex(positions);
	auto per_instance = as_vertex(positions, gpu::VertexStepMode::instance);

	EXPECT_EQ(per_vertex, as_vertex(positions, gpu::VertexStepMode::vertex));
	EXPECT_NE(per_vertex, per_instance);
	EXPECT_EQ(per_instance->step_mode, gpu::VertexStepMode::instance);
}

TEST_F(buffer, usages_keep_their_buffer_alive)
{
	usage_ref usage;

	{
		auto counts = root.create_buffer(data::u32, gpu::BufferUsageFlags::storage, "counts");
		usage = as_mutable(counts);
	}

	EXPECT_EQ(usage->buffer->label, "counts");
}

TEST_F(buffer, unauthorized_usage)
{
	auto params = root.create_buffer(data::u32, gpu::BufferUsageFlags::uniform, "params");

	try {
		as_mutable(params);
		FAIL() << "storage usage must be authorized";
	} catch (const UnauthorizedUsageError &e) {
		EXPECT_EQ(e.kind, eUnauthorizedUsage);
		EXPECT_EQ(e.buffer, "params");
		EXPECT_EQ(e.usage, "mutable");
		EXPECT_NE(std::string(e.what()).find("'params'"), std::string::npos);
	}

	EXPECT_THROW(as_vertex(params), UnauthorizedUsageError);
	EXPECT_NO_THROW(as_uniform(params));
}

TEST_F(buffer, labels)
{
	auto counts = root.create_buffer(data::u32, gpu::BufferUsageFlags::storage, "counts");
	auto unnamed = root.create_buffer(data::u32, gpu::BufferUsageFlags::uniform);

	EXPECT_EQ(as_mutable(counts)->label(), "mutable:counts");
	EXPECT_EQ(as_readonly(counts)->label(), "readonly:counts");
	EXPECT_EQ(as_uniform(unnamed)->label(), "uniform:<unnamed>");
}

TEST_F(buffer, vertex_strides)
{
	auto scalars = root.create_buffer(data::f32, gpu::BufferUsageFlags::vertex);
	EXPECT_EQ(as_vertex(scalars)->stride(), 4);

	auto vertex = data::struct_of("Vertex", {
		{ "position", data::vec3f },
		{ "uv", data::vec2f },
	});

	auto vertices = root.create_buffer(data::array_of(vertex, 3), gpu::BufferUsageFlags::vertex);
	EXPECT_EQ(as_vertex(vertices)->stride(), vertex->size());

	auto points = root.create_buffer(data::array_of(data::vec2f, 10), gpu::BufferUsageFlags::vertex);
	EXPECT_EQ(as_vertex(points)->stride(), 8);

	auto layout = as_vertex(vertices)->vertex_layout(2);
	EXPECT_EQ(layout.stride, 32);
	ASSERT_EQ(layout.attributes.size(), 2);
	EXPECT_EQ(layout.attributes[0].location, 2);
	EXPECT_EQ(layout.attributes[0].offset, 0);
	EXPECT_EQ(layout.attributes[0].format, gpu::VertexFormat::float32x3);
	EXPECT_EQ(layout.attributes[1].location, 3);
	EXPECT_EQ(layout.attributes[1].offset, 16);
	EXPECT_EQ(layout.attributes[1].format, gpu::VertexFormat::float32x2);
}

TEST_F(buffer, unsupported_vertex_shapes)
{
	auto flags = gpu::BufferUsageFlags::vertex;

	auto booleans = root.create_buffer(data::array_of(data::boolean, 4), flags);
	EXPECT_THROW(as_vertex(booleans), UnsupportedDataShapeError);

	auto matrices = root.create_buffer(data::array_of(data::mat4f, 4), flags);
	EXPECT_THROW(as_vertex(matrices), UnsupportedDataShapeError);

	auto nested = root.create_buffer(data::array_of(data::array_of(data::f32, 2), 4), flags);
	EXPECT_THROW(as_vertex(nested), UnsupportedDataShapeError);

	auto flagged = data::struct_of("Flagged", { { "on", data::boolean } });
	auto structs = root.create_buffer(flagged, flags);
	EXPECT_THROW(as_vertex(structs), UnsupportedDataShapeError);
}

TEST_F(buffer, native_buffer_is_created_once)
{
	auto counts = root.create_buffer(data::array_of(data::u32, 4), gpu::BufferUsageFlags::storage, "counts");
	EXPECT_TRUE(device->buffers.empty());

	auto handle = counts->unwrap();
	EXPECT_EQ(counts->unwrap(), handle);
	ASSERT_EQ(device->buffers.size(), 1);

	auto &descriptor = device->buffers.at(handle).descriptor;
	EXPECT_EQ(descriptor.label, "counts");
	EXPECT_EQ(descriptor.size, 16);
	EXPECT_TRUE(has(descriptor.usage, gpu::BufferUsageFlags::storage));
}

TEST_F(buffer, write_and_read)
{
	auto counts = root.create_buffer(data::array_of(data::u32, 4), gpu::BufferUsageFlags::storage, "counts");

	counts->write(std::vector <uint32_t> { 1, 2, 3, 4 });
	EXPECT_EQ(counts->read <uint32_t> (), (std::vector <uint32_t> { 1, 2, 3, 4 }));

	uint32_t value = 9;
	counts->write(&value, sizeof(value), 8);
	EXPECT_EQ(counts->read <uint32_t> (), (std::vector <uint32_t> { 1, 2, 9, 4 }));
}

TEST_F(buffer, catchall_declarations)
{
	auto counts = root.create_buffer(data::array_of(data::u32, 4), gpu::BufferUsageFlags::storage, "counts");

	StrictNameRegistry registry;
	BindingPlan plan;
	ResolutionContext ctx(registry, plan, nullptr, gpu::ShaderStage::compute);

	auto usage = as_readonly(counts);
	EXPECT_EQ(ctx.resolve(*usage), "counts");
	EXPECT_EQ(ctx.resolve(*usage), "counts");

	ASSERT_EQ(plan.catchall.size(), 1);
	EXPECT_EQ(plan.catchall[0].usage, usage);
	EXPECT_EQ(plan.catchall[0].visibility, gpu::ShaderStage::compute);

	ASSERT_EQ(ctx.declarations().size(), 1);
	check_shader_sources(ctx.declarations()[0], R"(
layout(set = $catchall$, binding = 0, std430) readonly buffer counts_block {
    uint counts[4];
};
)");
}

TEST_F(buffer, vertex_declarations)
{
	auto vertex = data::struct_of("Vertex", {
		{ "position", data::vec3f },
		{ "uv", data::vec2f },
	});

	auto vertices = root.create_buffer(data::array_of(vertex, 3), gpu::BufferUsageFlags::vertex, "vertices");
	auto weights = root.create_buffer(data::array_of(data::f32, 3), gpu::BufferUsageFlags::vertex, "weights");

	StrictNameRegistry registry;
	BindingPlan plan;
	ResolutionContext ctx(registry, plan, nullptr, gpu::ShaderStage::vertex);

	EXPECT_EQ(ctx.resolve(*as_vertex(vertices)), "vertices");
	EXPECT_EQ(ctx.resolve(*as_vertex(weights)), "weights");

	ASSERT_EQ(plan.vertex_buffers.size(), 2);
	EXPECT_EQ(plan.vertex_buffers[0].location, 0);
	EXPECT_EQ(plan.vertex_buffers[1].location, 2);
	EXPECT_TRUE(plan.catchall.empty());

	auto &declarations = ctx.declarations();
	ASSERT_EQ(declarations.size(), 2);
	check_shader_sources(declarations[0], R"(
layout(location = 0) in vec3 vertices_position;
layout(location = 1) in vec2 vertices_uv;
)");
	check_shader_sources(declarations[1], "layout(location = 2) in float weights;");
}

TEST_F(buffer, vertex_member_access)
{
	auto vertex = data::struct_of("Vertex", {
		{ "position", data::vec2f },
		{ "uv", data::vec2f },
	});

	auto vertices = root.create_buffer(data::array_of(vertex, 3), gpu::BufferUsageFlags::vertex, "vertices");
	auto params = root.create_buffer(vertex, gpu::BufferUsageFlags::uniform, "params");

	auto vs = vertex_fn({}, "() { gl_Position = vec4(vertices.position * params.uv, 0.0, 1.0); }");
	vs->named("vs").uses({
		{ "vertices", as_vertex(vertices) },
		{ "params", as_uniform(params) },
	});

	StrictNameRegistry registry;
	BindingPlan plan;
	ResolutionContext ctx(registry, plan, nullptr, gpu::ShaderStage::vertex);

	EXPECT_EQ(ctx.resolve(*vs), "vs");
	check_shader_sources(ctx.declarations().back(),
		"void vs() { gl_Position = vec4(vertices_position * params.uv, 0.0, 1.0); }");
}

TEST_F(buffer, vertex_field_names_do_not_collide)
{
	auto vertex = data::struct_of("Vertex", {
		{ "position", data::vec2f },
		{ "uv", data::vec2f },
	});

	auto vertices = root.create_buffer(data::array_of(vertex, 3), gpu::BufferUsageFlags::vertex, "vertices");

	auto offset = fn({}, data::vec2f, "() { return vec2(0.5); }");
	offset->named("vertices_position");

	auto vs = vertex_fn({}, "() { gl_Position = vec4(vertices_position() + vertices.position, 0.0, 1.0); }");
	vs->named("vs").uses({
		{ "vertices_position", offset },
		{ "vertices", as_vertex(vertices) },
	});

	StrictNameRegistry registry;
	BindingPlan plan;
	ResolutionContext ctx(registry, plan, nullptr, gpu::ShaderStage::vertex);

	EXPECT_EQ(ctx.resolve(*vs), "vs");

	auto &declarations = ctx.declarations();
	ASSERT_EQ(declarations.size(), 3);
	check_shader_sources(declarations[0], "vec2 vertices_position() { return vec2(0.5); }");
	check_shader_sources(declarations[1], R"(
layout(location = 0) in vec2 vertices_position_1;
layout(location = 1) in vec2 vertices_uv;
)");
	check_shader_sources(declarations[2],
		"void vs() { gl_Position = vec4(vertices_position() + vertices_position_1, 0.0, 1.0); }");
}

TEST_F(buffer, out_of_range_access)
{
	auto counts = root.create_buffer(data::array_of(data::u32, 4), gpu::BufferUsageFlags::storage, "counts");

	std::vector <uint32_t> values { 1, 2, 3, 4, 5 };

	try {
		counts->write(values);
		FAIL() << "writing past the end of a buffer must throw";
	} catch (const Error &e) {
		EXPECT_EQ(e.kind, eOutOfBounds);
		EXPECT_NE(std::string(e.what()).find("'counts'"), std::string::npos);
	}

	uint32_t value = 7;
	EXPECT_THROW(counts->write(&value, sizeof(value), 16), Error);
	EXPECT_THROW(counts->read(&value, sizeof(value), 13), Error);
	EXPECT_THROW(counts->read(&value, sizeof(value), UINT64_MAX), Error);

	// Nothing reached the device
	EXPECT_EQ(counts->read <uint32_t> (), (std::vector <uint32_t> { 0, 0, 0, 0 }));

	EXPECT_NO_THROW(counts->write(&value, sizeof(value), 12));
	EXPECT_EQ(counts->read <uint32_t> (), (std::vector <uint32_t> { 0, 0, 0, 7 }));
}
