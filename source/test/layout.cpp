#include "util.hpp"

#include <functional>

#include "common/error.hpp"
#include "gpu/recording.hpp"
#include "spark/context.hpp"
#include "spark/root.hpp"

using namespace spark;

struct layout : ::testing::Test {
	std::shared_ptr <gpu::RecordingDevice> device = std::make_shared <gpu::RecordingDevice> ();
	Root root { device };

	data_ref counts_type = data::array_of(data::u32, 4);

	layout_ref make_layout() {
		return bind_group_layout("simulation", {
			{ "counts", mutable_entry(counts_type, gpu::ShaderStage::compute) },
			{ "params", uniform_entry(data::u32) },
			{ "weights", readonly_entry(data::array_of(data::f32, 4)) },
		});
	}
};

static error_kind raised_kind(const std::function <void ()> &action)
{
	try {
		action();
	} catch (const Error &e) {
		return e.kind;
	}

	return __error_kind_end;
}

TEST_F(layout, bindings_follow_entry_order)
{
	auto simulation = make_layout();

	EXPECT_EQ(simulation->binding_of("counts"), 0u);
	EXPECT_EQ(simulation->binding_of("params"), 1u);
	EXPECT_EQ(simulation->binding_of("weights"), 2u);
	EXPECT_FALSE(simulation->binding_of("missing").has_value());

	auto descriptor = simulation->descriptor();
	ASSERT_EQ(descriptor.size(), 3);
	EXPECT_EQ(descriptor[0].visibility, gpu::ShaderStage::compute);
	EXPECT_EQ(descriptor[0].type, gpu::BindingType::storage_buffer);
	EXPECT_EQ(descriptor[1].type, gpu::BindingType::uniform_buffer);
	EXPECT_EQ(descriptor[1].visibility, gpu::ShaderStage::all);
	EXPECT_EQ(descriptor[2].type, gpu::BindingType::readonly_storage_buffer);
}

TEST_F(layout, bound_entries)
{
	auto simulation = make_layout();

	EXPECT_EQ(simulation->bound("counts"), simulation->bound("counts"));
	EXPECT_NE(simulation->bound("counts"), simulation->bound("params"));
	EXPECT_EQ(raised_kind([&]() { simulation->bound("missing"); }), eUnknownLayoutEntry);
}

TEST_F(layout, vertex_entries_are_rejected)
{
	LayoutEntryInfo info { eVertex, data::vec2f };
	EXPECT_EQ(raised_kind([&]() { bind_group_layout("vertices", { { "positions", info } }); }), eInvalidBindGroup);
}

TEST_F(layout, entry_declarations)
{
	auto simulation = make_layout();

	StrictNameRegistry registry;
	BindingPlan plan;
	ResolutionContext ctx(registry, plan, nullptr, gpu::ShaderStage::compute);

	auto params = simulation->bound("params");
	auto counts = simulation->bound("counts");

	EXPECT_EQ(ctx.resolve(*params), "params");
	EXPECT_EQ(ctx.resolve(*counts), "counts");

	ASSERT_EQ(plan.layouts.size(), 1);
	EXPECT_EQ(plan.layouts[0], simulation);
	EXPECT_TRUE(plan.catchall.empty());

	auto &declarations = ctx.declarations();
	ASSERT_EQ(declarations.size(), 2);
	check_shader_sources(declarations[0], R"(
layout(set = 0, binding = 1, std140) uniform params_block {
    uint params;
};
)");
	check_shader_sources(declarations[1], R"(
layout(set = 0, binding = 0, std430) buffer counts_block {
    uint counts[4];
};
)");
}

TEST_F(layout, populate)
{
	auto simulation = make_layout();

	auto counts = root.create_buffer(counts_type, gpu::BufferUsageFlags::storage, "counts");
	auto params = root.create_buffer(data::u32, gpu::BufferUsageFlags::uniform, "params");
	auto weights = root.create_buffer(data::array_of(data::f32, 4), gpu::BufferUsageFlags::storage, "weights");

	auto group = simulation->populate({
		{ "counts", counts },
		{ "params", params },
		{ "weights", weights },
	});

	EXPECT_EQ(group->layout, simulation);
	EXPECT_EQ(group->resources.at("params"), params);

	// Missing entry
	EXPECT_EQ(raised_kind([&]() {
		simulation->populate({ { "counts", counts }, { "params", params } });
	}), eInvalidBindGroup);

	// Extra entry
	EXPECT_EQ(raised_kind([&]() {
		simulation->populate({
			{ "counts", counts },
			{ "params", params },
			{ "weights", weights },
			{ "extra", counts },
		});
	}), eInvalidBindGroup);

	// Uniform entry backed by a storage-only buffer
	EXPECT_EQ(raised_kind([&]() {
		simulation->populate({
			{ "counts", counts },
			{ "params", weights },
			{ "weights", weights },
		});
	}), eInvalidBindGroup);
}

TEST_F(layout, native_objects_are_cached)
{
	auto simulation = make_layout();

	auto counts = root.create_buffer(counts_type, gpu::BufferUsageFlags::storage, "counts");
	auto params = root.create_buffer(data::u32, gpu::BufferUsageFlags::uniform, "params");
	auto weights = root.create_buffer(data::array_of(data::f32, 4), gpu::BufferUsageFlags::storage, "weights");

	auto handle = simulation->unwrap(*device);
	EXPECT_EQ(simulation->unwrap(*device), handle);
	ASSERT_EQ(device->bind_group_layouts.size(), 1);
	EXPECT_EQ(device->bind_group_layouts.at(handle).label, "simulation");

	auto group = simulation->populate({
		{ "counts", counts },
		{ "params", params },
		{ "weights", weights },
	});

	auto native = group->unwrap(*device);
	EXPECT_EQ(group->unwrap(*device), native);
	ASSERT_EQ(device->bind_groups.size(), 1);

	auto &record = device->bind_groups.at(native);
	EXPECT_EQ(record.layout, handle);
	ASSERT_EQ(record.entries.size(), 3);
	EXPECT_EQ(record.entries[0].buffer, counts->unwrap());
	EXPECT_EQ(record.entries[0].size, 16);
	EXPECT_EQ(record.entries[1].binding, 1);
	EXPECT_EQ(record.entries[1].buffer, params->unwrap());

	// Other devices get their own objects
	gpu::RecordingDevice other;
	simulation->unwrap(other);
	EXPECT_EQ(other.bind_group_layouts.size(), 1);
}

TEST_F(layout, replaced_devices_get_fresh_objects)
{
	auto simulation = make_layout();

	auto first = std::make_unique <gpu::RecordingDevice> ();
	uint64_t first_id = first->id();
	simulation->unwrap(*first);
	first.reset();

	auto second = std::make_unique <gpu::RecordingDevice> ();
	EXPECT_NE(second->id(), first_id);

	simulation->unwrap(*second);
	EXPECT_EQ(second->bind_group_layouts.size(), 1);
}
