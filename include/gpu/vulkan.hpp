#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include <littlevk/littlevk.hpp>

#include "device.hpp"

namespace spark::vulkan {

vk::Format translate(gpu::TextureFormat);
vk::Format translate(gpu::VertexFormat);
vk::ShaderStageFlags translate(gpu::ShaderStage);
vk::DescriptorType translate(gpu::BindingType);
vk::PrimitiveTopology translate(gpu::PrimitiveTopology);

// GLSL to SPIR-V through glslang
std::vector <uint32_t> compile_glsl(gpu::ShaderStage, const std::string &, const std::string &);

// Headless Vulkan device; every pass is recorded into one
// primary command buffer until the next submission
class Device : public gpu::Device {
	vk::PhysicalDevice phdev;
	vk::PhysicalDeviceMemoryProperties memory_properties;
	vk::Device device;
	littlevk::Deallocator dal;

	uint32_t queue_family;
	vk::Queue queue;
	vk::CommandPool command_pool;
	vk::CommandBuffer cmd;
	vk::DescriptorPool descriptor_pool;
	bool recording = false;

	uint64_t next_id = 1;

	struct buffer_record {
		littlevk::Buffer buffer;
		uint64_t size;
	};

	struct pipeline_record {
		vk::Pipeline pipeline;
		vk::PipelineLayout layout;
		vk::PipelineBindPoint bind_point;
		vk::RenderPass render_pass;
	};

	struct texture_record {
		littlevk::Image image;
		gpu::TextureDescriptor descriptor;
	};

	std::map <gpu::BufferHandle, buffer_record> buffers;
	std::map <gpu::ShaderModuleHandle, vk::ShaderModule> modules;
	std::map <gpu::BindGroupLayoutHandle, vk::DescriptorSetLayout> set_layouts;
	std::map <gpu::BindGroupLayoutHandle, std::map <uint32_t, vk::DescriptorType>> binding_types;
	std::map <gpu::PipelineLayoutHandle, vk::PipelineLayout> pipeline_layouts;
	std::map <gpu::PipelineHandle, pipeline_record> pipelines;
	std::map <gpu::BindGroupHandle, vk::DescriptorSet> descriptor_sets;
	std::map <gpu::TextureHandle, texture_record> textures;

	// Render passes by target formats and load operations
	std::map <std::vector <std::pair <vk::Format, bool>>, vk::RenderPass> render_passes;
	std::vector <vk::Framebuffer> framebuffers;

	template <typename H>
	H allocate() {
		return H { next_id++ };
	}

	auto allocator() {
		return littlevk::bind(device, memory_properties, dal);
	}

	buffer_record &buffer(gpu::BufferHandle);
	vk::CommandBuffer &commands();
	vk::RenderPass render_pass(const std::vector <std::pair <vk::Format, bool>> &);

	friend struct ComputePass;
	friend struct RenderPass;
public:
	Device();
	~Device();

	Device(const Device &) = delete;
	Device &operator=(const Device &) = delete;

	gpu::BufferHandle create_buffer(const gpu::BufferDescriptor &) override;
	void write_buffer(gpu::BufferHandle, uint64_t, const void *, uint64_t) override;
	void read_buffer(gpu::BufferHandle, uint64_t, void *, uint64_t) override;

	gpu::ShaderModuleHandle create_shader_module(gpu::ShaderStage, const std::string &, const std::string &) override;
	gpu::BindGroupLayoutHandle create_bind_group_layout(const std::vector <gpu::BindGroupLayoutEntry> &, const std::string &) override;
	gpu::PipelineLayoutHandle create_pipeline_layout(const std::vector <gpu::BindGroupLayoutHandle> &, const std::string &) override;
	gpu::PipelineHandle create_compute_pipeline(const gpu::ComputePipelineDescriptor &) override;
	gpu::PipelineHandle create_render_pipeline(const gpu::RenderPipelineDescriptor &) override;
	gpu::BindGroupHandle create_bind_group(gpu::BindGroupLayoutHandle, const std::vector <gpu::BindGroupEntry> &, const std::string &) override;
	gpu::TextureHandle create_texture(const gpu::TextureDescriptor &) override;

	std::unique_ptr <gpu::ComputePassEncoder> begin_compute_pass(const std::string &) override;
	std::unique_ptr <gpu::RenderPassEncoder> begin_render_pass(const std::string &, const std::vector <gpu::ColorAttachment> &) override;

	void submit() override;
};

} // namespace spark::vulkan
