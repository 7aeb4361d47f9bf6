#pragma once

#include <compare>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include <glm/glm.hpp>

#include "../common/flags.hpp"

namespace spark::gpu {

// Opaque references to device objects; zero is never a valid handle
template <typename Tag>
struct Handle {
	uint64_t id = 0;

	explicit operator bool() const {
		return id != 0;
	}

	auto operator<=>(const Handle &) const = default;
};

using BufferHandle = Handle <struct buffer_tag>;
using ShaderModuleHandle = Handle <struct shader_module_tag>;
using BindGroupLayoutHandle = Handle <struct bind_group_layout_tag>;
using PipelineLayoutHandle = Handle <struct pipeline_layout_tag>;
using PipelineHandle = Handle <struct pipeline_tag>;
using BindGroupHandle = Handle <struct bind_group_tag>;
using TextureHandle = Handle <struct texture_tag>;

enum class ShaderStage : uint32_t {
	none = 0,
	vertex = 1 << 0,
	fragment = 1 << 1,
	compute = 1 << 2,
	all = vertex | fragment | compute,
};

DEFINE_FLAG_OPERATORS(ShaderStage)

enum class BufferUsageFlags : uint32_t {
	none = 0,
	uniform = 1 << 0,
	storage = 1 << 1,
	vertex = 1 << 2,
	copy_src = 1 << 3,
	copy_dst = 1 << 4,
};

DEFINE_FLAG_OPERATORS(BufferUsageFlags)

enum class BindingType : uint8_t {
	uniform_buffer,
	readonly_storage_buffer,
	storage_buffer,
};

enum class VertexStepMode : uint8_t {
	vertex,
	instance,
};

enum class VertexFormat : uint8_t {
	float32, float32x2, float32x3, float32x4,
	sint32, sint32x2, sint32x3, sint32x4,
	uint32, uint32x2, uint32x3, uint32x4,
};

enum class TextureFormat : uint8_t {
	rgba8_unorm,
	bgra8_unorm,
	rgba16_float,
	rgba32_float,
};

enum class PrimitiveTopology : uint8_t {
	point_list,
	line_list,
	triangle_list,
	triangle_strip,
};

extern const char *tbl_binding_type[];
extern const char *tbl_texture_format[];

struct BufferDescriptor {
	std::string label;
	uint64_t size;
	BufferUsageFlags usage;
};

struct BindGroupLayoutEntry {
	uint32_t binding;
	ShaderStage visibility;
	BindingType type;
};

struct BindGroupEntry {
	uint32_t binding;
	BufferHandle buffer;
	uint64_t offset;
	uint64_t size;
};

struct VertexAttribute {
	uint32_t location;
	uint64_t offset;
	VertexFormat format;
};

struct VertexBufferLayout {
	uint64_t stride;
	VertexStepMode step_mode;
	std::vector <VertexAttribute> attributes;
};

struct ComputePipelineDescriptor {
	std::string label;
	PipelineLayoutHandle layout;
	ShaderModuleHandle module;
	std::string entry_point;
};

struct RenderPipelineDescriptor {
	std::string label;
	PipelineLayoutHandle layout;
	ShaderModuleHandle vertex;
	ShaderModuleHandle fragment;
	std::string entry_point;
	std::vector <VertexBufferLayout> vertex_buffers;
	std::vector <TextureFormat> targets;
	PrimitiveTopology topology;
};

struct TextureDescriptor {
	std::string label;
	glm::uvec2 extent;
	TextureFormat format;
};

struct ColorAttachment {
	TextureHandle texture;
	glm::vec4 clear_value = glm::vec4(0, 0, 0, 1);
	bool clear = true;
};

struct ComputePassEncoder {
	virtual ~ComputePassEncoder() = default;

	virtual void set_pipeline(PipelineHandle) = 0;
	virtual void set_bind_group(uint32_t, BindGroupHandle) = 0;
	virtual void dispatch_workgroups(const glm::uvec3 &) = 0;
	virtual void end() = 0;
};

struct RenderPassEncoder {
	virtual ~RenderPassEncoder() = default;

	virtual void set_pipeline(PipelineHandle) = 0;
	virtual void set_bind_group(uint32_t, BindGroupHandle) = 0;
	virtual void set_vertex_buffer(uint32_t, BufferHandle) = 0;
	virtual void draw(uint32_t, uint32_t, uint32_t, uint32_t) = 0;
	virtual void end() = 0;
};

// Native GPU device; the engine only shapes and sequences these calls
struct Device {
	Device();
	virtual ~Device() = default;

	Device(const Device &) = delete;
	Device &operator=(const Device &) = delete;

	// Never reused within a process
	uint64_t id() const {
		return uid;
	}

	virtual BufferHandle create_buffer(const BufferDescriptor &) = 0;
	virtual void write_buffer(BufferHandle, uint64_t, const void *, uint64_t) = 0;
	virtual void read_buffer(BufferHandle, uint64_t, void *, uint64_t) = 0;

	virtual ShaderModuleHandle create_shader_module(ShaderStage, const std::string &, const std::string &) = 0;
	virtual BindGroupLayoutHandle create_bind_group_layout(const std::vector <BindGroupLayoutEntry> &, const std::string &) = 0;
	virtual PipelineLayoutHandle create_pipeline_layout(const std::vector <BindGroupLayoutHandle> &, const std::string &) = 0;
	virtual PipelineHandle create_compute_pipeline(const ComputePipelineDescriptor &) = 0;
	virtual PipelineHandle create_render_pipeline(const RenderPipelineDescriptor &) = 0;
	virtual BindGroupHandle create_bind_group(BindGroupLayoutHandle, const std::vector <BindGroupEntry> &, const std::string &) = 0;
	virtual TextureHandle create_texture(const TextureDescriptor &) = 0;

	virtual std::unique_ptr <ComputePassEncoder> begin_compute_pass(const std::string &) = 0;
	virtual std::unique_ptr <RenderPassEncoder> begin_render_pass(const std::string &, const std::vector <ColorAttachment> &) = 0;

	// Executes every pass recorded so far
	virtual void submit() = 0;
private:
	uint64_t uid;
};

} // namespace spark::gpu
