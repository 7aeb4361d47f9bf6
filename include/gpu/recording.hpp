#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <variant>
#include <vector>

#include "device.hpp"

namespace spark::gpu {

namespace command {

struct BeginComputePass {
	std::string label;
};

struct BeginRenderPass {
	std::string label;
	std::vector <ColorAttachment> attachments;
};

struct SetPipeline {
	PipelineHandle pipeline;
};

struct SetBindGroup {
	uint32_t index;
	BindGroupHandle group;
};

struct SetVertexBuffer {
	uint32_t slot;
	BufferHandle buffer;
};

struct Dispatch {
	glm::uvec3 workgroups;
};

struct Draw {
	uint32_t vertex_count;
	uint32_t instance_count;
	uint32_t first_vertex;
	uint32_t first_instance;
};

struct EndPass {};

struct Submit {};

} // namespace command

using Command = std::variant <
	command::BeginComputePass,
	command::BeginRenderPass,
	command::SetPipeline,
	command::SetBindGroup,
	command::SetVertexBuffer,
	command::Dispatch,
	command::Draw,
	command::EndPass,
	command::Submit
>;

std::string to_string(const Command &);

struct ShaderModuleRecord {
	ShaderStage stage;
	std::string source;
	std::string label;
};

struct BindGroupLayoutRecord {
	std::vector <BindGroupLayoutEntry> entries;
	std::string label;
};

struct PipelineLayoutRecord {
	std::vector <BindGroupLayoutHandle> layouts;
	std::string label;
};

struct BindGroupRecord {
	BindGroupLayoutHandle layout;
	std::vector <BindGroupEntry> entries;
	std::string label;
};

using PipelineRecord = std::variant <ComputePipelineDescriptor, RenderPipelineDescriptor>;

// Headless device; keeps every object and command for inspection
class RecordingDevice : public Device {
	uint64_t next_id = 1;
	bool pass_open = false;

	struct buffer_record {
		BufferDescriptor descriptor;
		std::vector <uint8_t> bytes;
	};

	template <typename H>
	H allocate() {
		return H { next_id++ };
	}

	buffer_record &buffer(BufferHandle);

	friend struct RecordingComputePass;
	friend struct RecordingRenderPass;

	void record(const Command &);
public:
	std::map <BufferHandle, buffer_record> buffers;
	std::map <ShaderModuleHandle, ShaderModuleRecord> modules;
	std::map <BindGroupLayoutHandle, BindGroupLayoutRecord> bind_group_layouts;
	std::map <PipelineLayoutHandle, PipelineLayoutRecord> pipeline_layouts;
	std::map <PipelineHandle, PipelineRecord> pipelines;
	std::map <BindGroupHandle, BindGroupRecord> bind_groups;
	std::map <TextureHandle, TextureDescriptor> textures;

	std::vector <Command> commands;
	uint32_t submissions = 0;

	BufferHandle create_buffer(const BufferDescriptor &) override;
	void write_buffer(BufferHandle, uint64_t, const void *, uint64_t) override;
	void read_buffer(BufferHandle, uint64_t, void *, uint64_t) override;

	ShaderModuleHandle create_shader_module(ShaderStage, const std::string &, const std::string &) override;
	BindGroupLayoutHandle create_bind_group_layout(const std::vector <BindGroupLayoutEntry> &, const std::string &) override;
	PipelineLayoutHandle create_pipeline_layout(const std::vector <BindGroupLayoutHandle> &, const std::string &) override;
	PipelineHandle create_compute_pipeline(const ComputePipelineDescriptor &) override;
	PipelineHandle create_render_pipeline(const RenderPipelineDescriptor &) override;
	BindGroupHandle create_bind_group(BindGroupLayoutHandle, const std::vector <BindGroupEntry> &, const std::string &) override;
	TextureHandle create_texture(const TextureDescriptor &) override;

	std::unique_ptr <ComputePassEncoder> begin_compute_pass(const std::string &) override;
	std::unique_ptr <RenderPassEncoder> begin_render_pass(const std::string &, const std::vector <ColorAttachment> &) override;

	void submit() override;

	// Commands recorded so far, one line each
	std::vector <std::string> command_log() const;
};

} // namespace spark::gpu
