#include <cstring>

#include <fmt/format.h>

#include "common/logging.hpp"
#include "gpu/recording.hpp"

namespace spark::gpu {

MODULE(recording);

struct RecordingComputePass : ComputePassEncoder {
	RecordingDevice &device;

	RecordingComputePass(RecordingDevice &device_) : device(device_) {}

	void set_pipeline(PipelineHandle pipeline) override {
		device.record(command::SetPipeline { pipeline });
	}

	void set_bind_group(uint32_t index, BindGroupHandle group) override {
		device.record(command::SetBindGroup { index, group });
	}

	void dispatch_workgroups(const glm::uvec3 &workgroups) override {
		device.record(command::Dispatch { workgroups });
	}

	void end() override {
		device.record(command::EndPass {});
		device.pass_open = false;
	}
};

struct RecordingRenderPass : RenderPassEncoder {
	RecordingDevice &device;

	RecordingRenderPass(RecordingDevice &device_) : device(device_) {}

	void set_pipeline(PipelineHandle pipeline) override {
		device.record(command::SetPipeline { pipeline });
	}

	void set_bind_group(uint32_t index, BindGroupHandle group) override {
		device.record(command::SetBindGroup { index, group });
	}

	void set_vertex_buffer(uint32_t slot, BufferHandle buffer) override {
		device.record(command::SetVertexBuffer { slot, buffer });
	}

	void draw(uint32_t vertices, uint32_t instances, uint32_t first_vertex, uint32_t first_instance) override {
		device.record(command::Draw { vertices, instances, first_vertex, first_instance });
	}

	void end() override {
		device.record(command::EndPass {});
		device.pass_open = false;
	}
};

std::string to_string(const Command &cmd)
{
	switch (cmd.index()) {
	case 0:
		return fmt::format("begin_compute_pass(\"{}\")", std::get <command::BeginComputePass> (cmd).label);
	case 1:
	{
		auto &begin = std::get <command::BeginRenderPass> (cmd);
		return fmt::format("begin_render_pass(\"{}\", {})", begin.label, begin.attachments.size());
	}
	case 2:
		return fmt::format("set_pipeline(#{})", std::get <command::SetPipeline> (cmd).pipeline.id);
	case 3:
	{
		auto &set = std::get <command::SetBindGroup> (cmd);
		return fmt::format("set_bind_group({}, #{})", set.index, set.group.id);
	}
	case 4:
	{
		auto &set = std::get <command::SetVertexBuffer> (cmd);
		return fmt::format("set_vertex_buffer({}, #{})", set.slot, set.buffer.id);
	}
	case 5:
	{
		auto &w = std::get <command::Dispatch> (cmd).workgroups;
		return fmt::format("dispatch_workgroups({}, {}, {})", w.x, w.y, w.z);
	}
	case 6:
	{
		auto &draw = std::get <command::Draw> (cmd);
		return fmt::format("draw({}, {}, {}, {})",
			draw.vertex_count, draw.instance_count,
			draw.first_vertex, draw.first_instance);
	}
	case 7:
		return "end";
	case 8:
		return "submit";
	default:
		break;
	}

	SPARK_ABORT("unknown command #{}", cmd.index());
}

void RecordingDevice::record(const Command &cmd)
{
	SPARK_DEBUG_INFO("{}", to_string(cmd));
	commands.push_back(cmd);
}

RecordingDevice::buffer_record &RecordingDevice::buffer(BufferHandle handle)
{
	auto it = buffers.find(handle);
	if (it == buffers.end())
		SPARK_ABORT("unknown buffer handle #{}", handle.id);

	return it->second;
}

BufferHandle RecordingDevice::create_buffer(const BufferDescriptor &descriptor)
{
	auto handle = allocate <BufferHandle> ();
	buffers[handle] = { descriptor, std::vector <uint8_t> (descriptor.size, 0) };
	return handle;
}

void RecordingDevice::write_buffer(BufferHandle handle, uint64_t offset, const void *data, uint64_t size)
{
	auto &record = buffer(handle);
	if (offset + size > record.bytes.size())
		SPARK_ABORT("write of {} bytes at offset {} overflows \"{}\"", size, offset, record.descriptor.label);

	std::memcpy(record.bytes.data() + offset, data, size);
}

void RecordingDevice::read_buffer(BufferHandle handle, uint64_t offset, void *data, uint64_t size)
{
	auto &record = buffer(handle);
	if (offset + size > record.bytes.size())
		SPARK_ABORT("read of {} bytes at offset {} overflows \"{}\"", size, offset, record.descriptor.label);

	std::memcpy(data, record.bytes.data() + offset, size);
}

ShaderModuleHandle RecordingDevice::create_shader_module(ShaderStage stage, const std::string &source, const std::string &label)
{
	auto handle = allocate <ShaderModuleHandle> ();
	modules[handle] = { stage, source, label };
	return handle;
}

BindGroupLayoutHandle RecordingDevice::create_bind_group_layout(const std::vector <BindGroupLayoutEntry> &entries, const std::string &label)
{
	auto handle = allocate <BindGroupLayoutHandle> ();
	bind_group_layouts[handle] = { entries, label };
	return handle;
}

PipelineLayoutHandle RecordingDevice::create_pipeline_layout(const std::vector <BindGroupLayoutHandle> &layouts, const std::string &label)
{
	auto handle = allocate <PipelineLayoutHandle> ();
	pipeline_layouts[handle] = { layouts, label };
	return handle;
}

PipelineHandle RecordingDevice::create_compute_pipeline(const ComputePipelineDescriptor &descriptor)
{
	auto handle = allocate <PipelineHandle> ();
	pipelines[handle] = descriptor;
	return handle;
}

PipelineHandle RecordingDevice::create_render_pipeline(const RenderPipelineDescriptor &descriptor)
{
	auto handle = allocate <PipelineHandle> ();
	pipelines[handle] = descriptor;
	return handle;
}

BindGroupHandle RecordingDevice::create_bind_group(BindGroupLayoutHandle layout, const std::vector <BindGroupEntry> &entries, const std::string &label)
{
	auto handle = allocate <BindGroupHandle> ();
	bind_groups[handle] = { layout, entries, label };
	return handle;
}

TextureHandle RecordingDevice::create_texture(const TextureDescriptor &descriptor)
{
	auto handle = allocate <TextureHandle> ();
	textures[handle] = descriptor;
	return handle;
}

std::unique_ptr <ComputePassEncoder> RecordingDevice::begin_compute_pass(const std::string &label)
{
	SPARK_ASSERT(!pass_open, "compute pass \"{}\" begun inside another pass", label);

	pass_open = true;
	record(command::BeginComputePass { label });
	return std::make_unique <RecordingComputePass> (*this);
}

std::unique_ptr <RenderPassEncoder> RecordingDevice::begin_render_pass(const std::string &label, const std::vector <ColorAttachment> &attachments)
{
	SPARK_ASSERT(!pass_open, "render pass \"{}\" begun inside another pass", label);

	pass_open = true;
	record(command::BeginRenderPass { label, attachments });
	return std::make_unique <RecordingRenderPass> (*this);
}

void RecordingDevice::submit()
{
	record(command::Submit {});
	submissions++;
}

std::vector <std::string> RecordingDevice::command_log() const
{
	std::vector <std::string> log;
	for (auto &cmd : commands)
		log.push_back(to_string(cmd));

	return log;
}

} // namespace spark::gpu
