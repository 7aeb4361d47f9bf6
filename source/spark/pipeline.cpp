#include <filesystem>

#include <fmt/format.h>

#include "common/error.hpp"
#include "common/io.hpp"
#include "spark/pipeline.hpp"

namespace spark {

MODULE(pipeline);

// Pipeline core
void PipelineCore::trace(const std::string &title, const std::string &source, const char *extension) const
{
	if (options.trace)
		io::display_lines(title, source);

	if (options.trace_destination) {
		if (!std::filesystem::exists(*options.trace_destination))
			SPARK_WARNING("trace destination {} does not exist, creating it", options.trace_destination->string());

		auto path = *options.trace_destination / fmt::format("{}.{}", display_label(), extension);
		io::write_lines(path, source);
	}
}

Memo PipelineCore::build()
{
	SPARK_STAGE();

	Memo result;

	std::vector <ProgramStage> stages;
	if (auto compute = std::get_if <ComputeProgram> (&program)) {
		stages.push_back({ gpu::ShaderStage::compute, compute->entry });
	} else {
		auto &render = std::get <RenderProgram> (program);
		stages.push_back({ gpu::ShaderStage::vertex, render.vertex });
		stages.push_back({ gpu::ShaderStage::fragment, render.fragment });
	}

	auto resolution = resolve_program(stages, pinned, slots, options, transpiler.get());

	result.layouts = resolution.layouts;
	result.catchall = resolution.catchall;
	result.vertex_buffers = resolution.vertex_buffers;
	result.sources = resolution.sources;

	std::vector <gpu::BindGroupLayoutHandle> layouts;
	for (auto &layout : result.layouts)
		layouts.push_back(layout->unwrap(*device));

	std::string name = display_label();

	result.pipeline_layout = device->create_pipeline_layout(layouts, name + " - Pipeline Layout");

	if (auto compute = std::get_if <ComputeProgram> (&program)) {
		std::string shader = name + " - Shader";
		trace(shader, result.sources[0], "comp");

		gpu::ComputePipelineDescriptor descriptor {
			.label = name,
			.layout = result.pipeline_layout,
			.module = device->create_shader_module(gpu::ShaderStage::compute, result.sources[0], shader),
			.entry_point = "main",
		};

		SPARK_INFO("created shader module \"{}\"", shader);

		result.pipeline = device->create_compute_pipeline(descriptor);
	} else {
		auto &render = std::get <RenderProgram> (program);

		std::string vertex = name + " - Vertex Shader";
		std::string fragment = name + " - Fragment Shader";
		trace(vertex, result.sources[0], "vert");
		trace(fragment, result.sources[1], "frag");

		gpu::RenderPipelineDescriptor descriptor {
			.label = name,
			.layout = result.pipeline_layout,
			.vertex = device->create_shader_module(gpu::ShaderStage::vertex, result.sources[0], vertex),
			.fragment = device->create_shader_module(gpu::ShaderStage::fragment, result.sources[1], fragment),
			.entry_point = "main",
			.vertex_buffers = {},
			.targets = render.targets,
			.topology = render.topology,
		};

		SPARK_INFO("created shader modules \"{}\" and \"{}\"", vertex, fragment);

		for (size_t i = 0; i < render.targets.size(); i++)
			SPARK_INFO("  target #{}: {}", i, gpu::tbl_texture_format[int(render.targets[i])]);

		for (auto &entry : result.vertex_buffers)
			descriptor.vertex_buffers.push_back(entry.usage->vertex_layout(entry.location));

		result.pipeline = device->create_render_pipeline(descriptor);
	}

	return result;
}

const Memo &PipelineCore::unwrap()
{
	if (!memo)
		memo = build();

	return *memo;
}

// Pipeline views
std::shared_ptr <const prior_map> PipelineView::extended(const layout_ref &layout, const bind_group_ref &group) const
{
	if (group->layout != layout) {
		SPARK_RAISE(Error, eLayoutMismatch,
			fmt::format("bind group populated from layout '{}' cannot be bound to layout '{}'",
				group->layout->label, layout->label));
	}

	auto priors = std::make_shared <prior_map> (*priors_);
	priors->insert_or_assign(layout, group);
	return priors;
}

std::vector <std::pair <uint32_t, gpu::BindGroupHandle>> PipelineView::bind_groups(const Memo &memo) const
{
	std::vector <std::pair <uint32_t, gpu::BindGroupHandle>> result;

	for (uint32_t i = 0; i < memo.layouts.size(); i++) {
		auto &layout = memo.layouts[i];

		if (memo.catchall && memo.catchall->index == i) {
			result.emplace_back(i, memo.catchall->group->unwrap(*core_->device));
			continue;
		}

		auto it = priors_->find(layout);
		if (it == priors_->end())
			SPARK_RAISE(MissingBindGroupError, layout->label);

		result.emplace_back(i, it->second->unwrap(*core_->device));
	}

	return result;
}

// Compute pipelines
ComputePipeline ComputePipeline::with(const layout_ref &layout, const bind_group_ref &group) const
{
	return ComputePipeline(core_, extended(layout, group));
}

ComputePipeline ComputePipeline::with(const bind_group_ref &group) const
{
	return with(group->layout, group);
}

void ComputePipeline::dispatch(uint32_t x, uint32_t y, uint32_t z) const
{
	dispatch(glm::uvec3(x, y, z));
}

void ComputePipeline::dispatch(const glm::uvec3 &workgroups) const
{
	auto &memo = unwrap();

	// Every group is gathered before anything is recorded
	auto groups = bind_groups(memo);

	auto pass = core_->device->begin_compute_pass(core_->display_label());
	pass->set_pipeline(memo.pipeline);
	for (auto &[index, group] : groups)
		pass->set_bind_group(index, group);

	pass->dispatch_workgroups(workgroups);
	pass->end();
}

// Render pipelines
RenderPipeline RenderPipeline::with(const layout_ref &layout, const bind_group_ref &group) const
{
	return RenderPipeline(core_, extended(layout, group));
}

RenderPipeline RenderPipeline::with(const bind_group_ref &group) const
{
	return with(group->layout, group);
}

void RenderPipeline::draw(const std::vector <gpu::ColorAttachment> &attachments,
			  uint32_t vertex_count,
			  uint32_t instance_count,
			  uint32_t first_vertex,
			  uint32_t first_instance) const
{
	auto &memo = unwrap();
	auto groups = bind_groups(memo);

	std::vector <gpu::BufferHandle> vertex_buffers;
	for (auto &entry : memo.vertex_buffers)
		vertex_buffers.push_back(entry.usage->buffer->unwrap());

	auto pass = core_->device->begin_render_pass(core_->display_label(), attachments);
	pass->set_pipeline(memo.pipeline);
	for (auto &[index, group] : groups)
		pass->set_bind_group(index, group);

	for (uint32_t i = 0; i < vertex_buffers.size(); i++)
		pass->set_vertex_buffer(i, vertex_buffers[i]);

	pass->draw(vertex_count, instance_count, first_vertex, first_instance);
	pass->end();
}

// Builder
std::shared_ptr <PipelineCore> PipelineBuilder::core(const Program &program) const
{
	return std::make_shared <PipelineCore> (device, transpiler, options, label, program, slots, pinned);
}

PipelineBuilder PipelineBuilder::with(const slot_ref &s, const Value &value) const
{
	PipelineBuilder result = *this;
	result.slots.emplace_back(s, value);
	return result;
}

PipelineBuilder PipelineBuilder::with_layouts(const std::vector <layout_ref> &layouts) const
{
	PipelineBuilder result = *this;
	result.pinned = layouts;
	return result;
}

PipelineBuilder PipelineBuilder::named(const std::string &label_) const
{
	PipelineBuilder result = *this;
	result.label = label_;
	return result;
}

ComputePipeline PipelineBuilder::compute(const resolvable_ref &entry) const
{
	return ComputePipeline(core(ComputeProgram { entry }), std::make_shared <prior_map> ());
}

RenderPipeline PipelineBuilder::render(const resolvable_ref &vertex,
				       const resolvable_ref &fragment,
				       const std::vector <gpu::TextureFormat> &targets,
				       gpu::PrimitiveTopology topology) const
{
	RenderProgram program {
		.vertex = vertex,
		.fragment = fragment,
		.targets = targets,
		.topology = topology,
	};

	return RenderPipeline(core(program), std::make_shared <prior_map> ());
}

} // namespace spark
