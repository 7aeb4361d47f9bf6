#include <array>
#include <cstring>

// Glslang and SPIRV-Tools
#include <glslang/Public/ResourceLimits.h>
#include <glslang/Public/ShaderLang.h>
#include <glslang/SPIRV/GlslangToSpv.h>

#include "common/io.hpp"
#include "common/logging.hpp"
#include "gpu/vulkan.hpp"

namespace spark::vulkan {

MODULE(vulkan);

// Translation of device enumerations
vk::Format translate(gpu::TextureFormat format)
{
	switch (format) {
	case gpu::TextureFormat::rgba8_unorm:
		return vk::Format::eR8G8B8A8Unorm;
	case gpu::TextureFormat::bgra8_unorm:
		return vk::Format::eB8G8R8A8Unorm;
	case gpu::TextureFormat::rgba16_float:
		return vk::Format::eR16G16B16A16Sfloat;
	case gpu::TextureFormat::rgba32_float:
		return vk::Format::eR32G32B32A32Sfloat;
	}

	SPARK_ABORT("unknown texture format #{}", int(format));
}

vk::Format translate(gpu::VertexFormat format)
{
	static const vk::Format formats[] {
		vk::Format::eR32Sfloat, vk::Format::eR32G32Sfloat,
		vk::Format::eR32G32B32Sfloat, vk::Format::eR32G32B32A32Sfloat,
		vk::Format::eR32Sint, vk::Format::eR32G32Sint,
		vk::Format::eR32G32B32Sint, vk::Format::eR32G32B32A32Sint,
		vk::Format::eR32Uint, vk::Format::eR32G32Uint,
		vk::Format::eR32G32B32Uint, vk::Format::eR32G32B32A32Uint,
	};

	return formats[uint32_t(format)];
}

vk::ShaderStageFlags translate(gpu::ShaderStage stage)
{
	vk::ShaderStageFlags flags;
	if (has(stage, gpu::ShaderStage::vertex))
		flags |= vk::ShaderStageFlagBits::eVertex;
	if (has(stage, gpu::ShaderStage::fragment))
		flags |= vk::ShaderStageFlagBits::eFragment;
	if (has(stage, gpu::ShaderStage::compute))
		flags |= vk::ShaderStageFlagBits::eCompute;

	return flags;
}

vk::DescriptorType translate(gpu::BindingType type)
{
	if (type == gpu::BindingType::uniform_buffer)
		return vk::DescriptorType::eUniformBuffer;

	return vk::DescriptorType::eStorageBuffer;
}

vk::PrimitiveTopology translate(gpu::PrimitiveTopology topology)
{
	switch (topology) {
	case gpu::PrimitiveTopology::point_list:
		return vk::PrimitiveTopology::ePointList;
	case gpu::PrimitiveTopology::line_list:
		return vk::PrimitiveTopology::eLineList;
	case gpu::PrimitiveTopology::triangle_list:
		return vk::PrimitiveTopology::eTriangleList;
	case gpu::PrimitiveTopology::triangle_strip:
		return vk::PrimitiveTopology::eTriangleStrip;
	}

	SPARK_ABORT("unknown primitive topology #{}", int(topology));
}

static vk::BufferUsageFlags translate(gpu::BufferUsageFlags usage)
{
	vk::BufferUsageFlags flags;
	if (has(usage, gpu::BufferUsageFlags::uniform))
		flags |= vk::BufferUsageFlagBits::eUniformBuffer;
	if (has(usage, gpu::BufferUsageFlags::storage))
		flags |= vk::BufferUsageFlagBits::eStorageBuffer;
	if (has(usage, gpu::BufferUsageFlags::vertex))
		flags |= vk::BufferUsageFlagBits::eVertexBuffer;
	if (has(usage, gpu::BufferUsageFlags::copy_src))
		flags |= vk::BufferUsageFlagBits::eTransferSrc;
	if (has(usage, gpu::BufferUsageFlags::copy_dst))
		flags |= vk::BufferUsageFlagBits::eTransferDst;

	return flags;
}

// Compiling shaders
static EShLanguage translate_shader_stage(gpu::ShaderStage stage)
{
	switch (stage) {
	case gpu::ShaderStage::vertex:
		return EShLangVertex;
	case gpu::ShaderStage::fragment:
		return EShLangFragment;
	case gpu::ShaderStage::compute:
		return EShLangCompute;
	default:
		break;
	}

	SPARK_ABORT("shader modules are compiled for exactly one stage");
}

std::vector <uint32_t> compile_glsl(gpu::ShaderStage flags, const std::string &glsl, const std::string &label)
{
	static bool initialized = glslang::InitializeProcess();
	SPARK_ASSERT(initialized, "failed to initialize glslang");

	EShLanguage stage = translate_shader_stage(flags);

	const char *shaderStrings[] { glsl.c_str() };

	glslang::SpvOptions options;
	options.generateDebugInfo = true;

	glslang::TShader shader(stage);

	shader.setStrings(shaderStrings, 1);
	shader.setEnvTarget(glslang::EShTargetLanguage::EShTargetSpv,
			    glslang::EShTargetLanguageVersion::EShTargetSpv_1_0);

	// Enable SPIR-V and Vulkan rules when parsing GLSL
	EShMessages messages = (EShMessages) (EShMsgDefault | EShMsgSpvRules | EShMsgVulkanRules);

	if (!shader.parse(GetDefaultResources(), 450, false, messages)) {
		std::string log = shader.getInfoLog();
		io::display_lines(label, glsl);
		SPARK_ABORT("failed to compile \"{}\" to SPIRV:\n{}", label, log);
	}

	// Link the program
	glslang::TProgram program;

	program.addShader(&shader);

	if (!program.link(messages)) {
		std::string log = program.getInfoLog();
		io::display_lines(label, glsl);
		SPARK_ABORT("failed to link SPIRV code of \"{}\":\n{}", label, log);
	}

	std::vector <uint32_t> spirv;
	glslang::GlslangToSpv(*program.getIntermediate(stage), spirv, &options);
	return spirv;
}

// Pass encoders
struct ComputePass : gpu::ComputePassEncoder {
	Device &device;
	vk::CommandBuffer &cmd;
	vk::PipelineLayout layout;

	ComputePass(Device &device_) : device(device_), cmd(device_.commands()) {}

	void set_pipeline(gpu::PipelineHandle handle) override {
		auto &record = device.pipelines.at(handle);
		layout = record.layout;
		cmd.bindPipeline(vk::PipelineBindPoint::eCompute, record.pipeline);
	}

	void set_bind_group(uint32_t index, gpu::BindGroupHandle group) override {
		cmd.bindDescriptorSets(vk::PipelineBindPoint::eCompute,
			layout, index,
			device.descriptor_sets.at(group), {});
	}

	void dispatch_workgroups(const glm::uvec3 &workgroups) override {
		cmd.dispatch(workgroups.x, workgroups.y, workgroups.z);
	}

	void end() override {
		// Later passes and the host observe the writes of this one
		vk::MemoryBarrier barrier {
			vk::AccessFlagBits::eShaderWrite,
			vk::AccessFlagBits::eShaderRead
				| vk::AccessFlagBits::eVertexAttributeRead
				| vk::AccessFlagBits::eHostRead,
		};

		cmd.pipelineBarrier(vk::PipelineStageFlagBits::eComputeShader,
			vk::PipelineStageFlagBits::eAllCommands | vk::PipelineStageFlagBits::eHost,
			{}, barrier, {}, {});
	}
};

struct RenderPass : gpu::RenderPassEncoder {
	Device &device;
	vk::CommandBuffer &cmd;
	std::vector <gpu::ColorAttachment> attachments;
	vk::PipelineLayout layout;
	bool begun = false;

	RenderPass(Device &device_, const std::vector <gpu::ColorAttachment> &attachments_)
			: device(device_), cmd(device_.commands()), attachments(attachments_) {}

	// The render pass is only known once the pipeline is
	void begin(const Device::pipeline_record &record) {
		std::vector <std::pair <vk::Format, bool>> key;
		std::vector <vk::ImageView> views;
		std::vector <vk::ClearValue> clears;

		auto &first = device.textures.at(attachments.front().texture);
		vk::Extent2D extent { first.descriptor.extent.x, first.descriptor.extent.y };

		for (auto &attachment : attachments) {
			auto &texture = device.textures.at(attachment.texture);
			key.emplace_back(translate(texture.descriptor.format), attachment.clear);
			views.push_back(texture.image.view);

			auto &c = attachment.clear_value;
			clears.push_back(vk::ClearColorValue(std::array <float, 4> { c.x, c.y, c.z, c.w }));
		}

		vk::RenderPass render_pass = device.render_pass(key);

		vk::FramebufferCreateInfo framebuffer_info {
			{}, render_pass, views,
			extent.width, extent.height, 1,
		};

		vk::Framebuffer framebuffer = device.device.createFramebuffer(framebuffer_info);
		device.framebuffers.push_back(framebuffer);

		vk::RenderPassBeginInfo begin_info {
			render_pass, framebuffer,
			vk::Rect2D { {}, extent },
			clears,
		};

		cmd.beginRenderPass(begin_info, vk::SubpassContents::eInline);

		vk::Viewport viewport { 0, 0, float(extent.width), float(extent.height), 0, 1 };
		cmd.setViewport(0, viewport);
		cmd.setScissor(0, vk::Rect2D { {}, extent });

		begun = true;
	}

	void set_pipeline(gpu::PipelineHandle handle) override {
		auto &record = device.pipelines.at(handle);
		if (!begun)
			begin(record);

		layout = record.layout;
		cmd.bindPipeline(vk::PipelineBindPoint::eGraphics, record.pipeline);
	}

	void set_bind_group(uint32_t index, gpu::BindGroupHandle group) override {
		cmd.bindDescriptorSets(vk::PipelineBindPoint::eGraphics,
			layout, index,
			device.descriptor_sets.at(group), {});
	}

	void set_vertex_buffer(uint32_t slot, gpu::BufferHandle handle) override {
		cmd.bindVertexBuffers(slot, device.buffer(handle).buffer.buffer, { 0 });
	}

	void draw(uint32_t vertices, uint32_t instances, uint32_t first_vertex, uint32_t first_instance) override {
		cmd.draw(vertices, instances, first_vertex, first_instance);
	}

	void end() override {
		if (begun)
			cmd.endRenderPass();
	}
};

// Device
Device::Device()
{
	auto predicate = [](vk::PhysicalDevice phdev) {
		return littlevk::physical_device_able(phdev, {});
	};

	phdev = littlevk::pick_physical_device(predicate);
	memory_properties = phdev.getMemoryProperties();

	auto families = phdev.getQueueFamilyProperties();

	queue_family = families.size();
	for (uint32_t i = 0; i < families.size(); i++) {
		auto flags = families[i].queueFlags;
		if ((flags & vk::QueueFlagBits::eCompute) && (flags & vk::QueueFlagBits::eGraphics)) {
			queue_family = i;
			break;
		}
	}

	if (queue_family == families.size())
		SPARK_ABORT("no queue family supports both compute and graphics");

	float priority = 1.0f;
	vk::DeviceQueueCreateInfo queue_info { {}, queue_family, 1, &priority };
	vk::DeviceCreateInfo device_info { {}, queue_info };

	device = phdev.createDevice(device_info);
	dal = littlevk::Deallocator(device);
	queue = device.getQueue(queue_family, 0);

	command_pool = littlevk::command_pool(device,
		vk::CommandPoolCreateFlagBits::eResetCommandBuffer,
		queue_family).unwrap(dal);

	cmd = littlevk::command_buffers(device,
		command_pool,
		vk::CommandBufferLevel::ePrimary, 1u).front();

	std::array <vk::DescriptorPoolSize, 2> pool_sizes {
		vk::DescriptorPoolSize { vk::DescriptorType::eUniformBuffer, 1 << 10 },
		vk::DescriptorPoolSize { vk::DescriptorType::eStorageBuffer, 1 << 10 },
	};

	descriptor_pool = littlevk::descriptor_pool(
		device, vk::DescriptorPoolCreateInfo {
			vk::DescriptorPoolCreateFlagBits::eFreeDescriptorSet,
			1 << 10, pool_sizes,
		}
	).unwrap(dal);

	SPARK_INFO("using device \"{}\"", std::string(phdev.getProperties().deviceName.data()));
}

Device::~Device()
{
	device.waitIdle();

	for (auto &framebuffer : framebuffers)
		device.destroyFramebuffer(framebuffer);
	for (auto &[_, pass] : render_passes)
		device.destroyRenderPass(pass);
	for (auto &[_, record] : pipelines)
		device.destroyPipeline(record.pipeline);
	for (auto &[_, layout] : pipeline_layouts)
		device.destroyPipelineLayout(layout);
	for (auto &[_, layout] : set_layouts)
		device.destroyDescriptorSetLayout(layout);
	for (auto &[_, module] : modules)
		device.destroyShaderModule(module);

	dal.drop();
	device.destroy();
}

Device::buffer_record &Device::buffer(gpu::BufferHandle handle)
{
	auto it = buffers.find(handle);
	if (it == buffers.end())
		SPARK_ABORT("unknown buffer handle #{}", handle.id);

	return it->second;
}

vk::CommandBuffer &Device::commands()
{
	if (!recording) {
		cmd.begin(vk::CommandBufferBeginInfo {});
		recording = true;
	}

	return cmd;
}

vk::RenderPass Device::render_pass(const std::vector <std::pair <vk::Format, bool>> &key)
{
	auto it = render_passes.find(key);
	if (it != render_passes.end())
		return it->second;

	std::vector <vk::AttachmentDescription> attachments;
	std::vector <vk::AttachmentReference> references;

	for (auto &[format, clear] : key) {
		vk::AttachmentDescription description = littlevk::default_color_attachment(format);
		description.loadOp = clear ? vk::AttachmentLoadOp::eClear : vk::AttachmentLoadOp::eLoad;
		description.initialLayout = clear ? vk::ImageLayout::eUndefined : vk::ImageLayout::eColorAttachmentOptimal;
		description.finalLayout = vk::ImageLayout::eColorAttachmentOptimal;

		references.push_back({ uint32_t(attachments.size()), vk::ImageLayout::eColorAttachmentOptimal });
		attachments.push_back(description);
	}

	vk::SubpassDescription subpass { {}, vk::PipelineBindPoint::eGraphics, {}, references };
	vk::RenderPassCreateInfo info { {}, attachments, subpass };

	vk::RenderPass pass = device.createRenderPass(info);
	render_passes[key] = pass;
	return pass;
}

gpu::BufferHandle Device::create_buffer(const gpu::BufferDescriptor &descriptor)
{
	auto handle = allocate <gpu::BufferHandle> ();

	buffer_record record;
	record.size = descriptor.size;
	std::tie(record.buffer) = allocator().buffer(descriptor.size, translate(descriptor.usage));

	buffers[handle] = record;

	// Buffers start zeroed
	std::vector <uint8_t> zeros(descriptor.size, 0);
	littlevk::upload(device, record.buffer, zeros);

	return handle;
}

void Device::write_buffer(gpu::BufferHandle handle, uint64_t offset, const void *data, uint64_t size)
{
	auto &record = buffer(handle);
	if (offset > record.size || size > record.size - offset)
		SPARK_ABORT("write of {} bytes at offset {} overflows buffer #{}", size, offset, handle.id);

	std::vector <uint8_t> bytes(record.size);
	if (offset != 0 || size != record.size)
		littlevk::download(device, record.buffer, bytes);

	std::memcpy(bytes.data() + offset, data, size);
	littlevk::upload(device, record.buffer, bytes);
}

void Device::read_buffer(gpu::BufferHandle handle, uint64_t offset, void *data, uint64_t size)
{
	auto &record = buffer(handle);
	if (offset > record.size || size > record.size - offset)
		SPARK_ABORT("read of {} bytes at offset {} overflows buffer #{}", size, offset, handle.id);

	std::vector <uint8_t> bytes(record.size);
	littlevk::download(device, record.buffer, bytes);
	std::memcpy(data, bytes.data() + offset, size);
}

gpu::ShaderModuleHandle Device::create_shader_module(gpu::ShaderStage stage, const std::string &source, const std::string &label)
{
	auto spirv = compile_glsl(stage, source, label);

	auto handle = allocate <gpu::ShaderModuleHandle> ();
	modules[handle] = device.createShaderModule(vk::ShaderModuleCreateInfo { {}, spirv });
	return handle;
}

gpu::BindGroupLayoutHandle Device::create_bind_group_layout(const std::vector <gpu::BindGroupLayoutEntry> &entries, const std::string &label)
{
	auto handle = allocate <gpu::BindGroupLayoutHandle> ();

	std::vector <vk::DescriptorSetLayoutBinding> bindings;
	for (auto &entry : entries) {
		binding_types[handle][entry.binding] = translate(entry.type);
		bindings.push_back(vk::DescriptorSetLayoutBinding {
			entry.binding,
			translate(entry.type), 1,
			translate(entry.visibility),
		});
	}

	set_layouts[handle] = device.createDescriptorSetLayout(vk::DescriptorSetLayoutCreateInfo { {}, bindings });

	SPARK_DEBUG_INFO("created descriptor set layout \"{}\" with {} bindings", label, bindings.size());

	return handle;
}

gpu::PipelineLayoutHandle Device::create_pipeline_layout(const std::vector <gpu::BindGroupLayoutHandle> &layouts, const std::string &label)
{
	std::vector <vk::DescriptorSetLayout> sets;
	for (auto &layout : layouts)
		sets.push_back(set_layouts.at(layout));

	auto handle = allocate <gpu::PipelineLayoutHandle> ();
	pipeline_layouts[handle] = device.createPipelineLayout(vk::PipelineLayoutCreateInfo { {}, sets });

	SPARK_DEBUG_INFO("created pipeline layout \"{}\"", label);

	return handle;
}

gpu::PipelineHandle Device::create_compute_pipeline(const gpu::ComputePipelineDescriptor &descriptor)
{
	vk::PipelineShaderStageCreateInfo stage {
		{}, vk::ShaderStageFlagBits::eCompute,
		modules.at(descriptor.module),
		descriptor.entry_point.c_str(),
	};

	vk::PipelineLayout layout = pipeline_layouts.at(descriptor.layout);

	vk::ComputePipelineCreateInfo info { {}, stage, layout };

	auto result = device.createComputePipeline(nullptr, info);
	if (result.result != vk::Result::eSuccess)
		SPARK_ABORT("failed to create compute pipeline \"{}\"", descriptor.label);

	auto handle = allocate <gpu::PipelineHandle> ();
	pipelines[handle] = { result.value, layout, vk::PipelineBindPoint::eCompute, nullptr };
	return handle;
}

gpu::PipelineHandle Device::create_render_pipeline(const gpu::RenderPipelineDescriptor &descriptor)
{
	std::array <vk::PipelineShaderStageCreateInfo, 2> stages {
		vk::PipelineShaderStageCreateInfo {
			{}, vk::ShaderStageFlagBits::eVertex,
			modules.at(descriptor.vertex),
			descriptor.entry_point.c_str(),
		},
		vk::PipelineShaderStageCreateInfo {
			{}, vk::ShaderStageFlagBits::eFragment,
			modules.at(descriptor.fragment),
			descriptor.entry_point.c_str(),
		},
	};

	std::vector <vk::VertexInputBindingDescription> bindings;
	std::vector <vk::VertexInputAttributeDescription> attributes;

	for (uint32_t i = 0; i < descriptor.vertex_buffers.size(); i++) {
		auto &layout = descriptor.vertex_buffers[i];

		auto rate = (layout.step_mode == gpu::VertexStepMode::instance)
			? vk::VertexInputRate::eInstance
			: vk::VertexInputRate::eVertex;

		bindings.push_back({ i, uint32_t(layout.stride), rate });

		for (auto &attribute : layout.attributes)
			attributes.push_back({ attribute.location, i, translate(attribute.format), uint32_t(attribute.offset) });
	}

	vk::PipelineVertexInputStateCreateInfo vertex_input { {}, bindings, attributes };
	vk::PipelineInputAssemblyStateCreateInfo input_assembly { {}, translate(descriptor.topology) };
	vk::PipelineViewportStateCreateInfo viewport { {}, 1, nullptr, 1, nullptr };

	vk::PipelineRasterizationStateCreateInfo rasterization;
	rasterization.polygonMode = vk::PolygonMode::eFill;
	rasterization.cullMode = vk::CullModeFlagBits::eNone;
	rasterization.lineWidth = 1.0f;

	vk::PipelineMultisampleStateCreateInfo multisample;

	std::vector <vk::PipelineColorBlendAttachmentState> blending;
	std::vector <std::pair <vk::Format, bool>> key;
	for (auto &target : descriptor.targets) {
		vk::PipelineColorBlendAttachmentState state;
		state.colorWriteMask = vk::ColorComponentFlagBits::eR
			| vk::ColorComponentFlagBits::eG
			| vk::ColorComponentFlagBits::eB
			| vk::ColorComponentFlagBits::eA;

		blending.push_back(state);
		key.emplace_back(translate(target), true);
	}

	vk::PipelineColorBlendStateCreateInfo color_blend { {}, false, vk::LogicOp::eCopy, blending };

	std::array <vk::DynamicState, 2> dynamic_states {
		vk::DynamicState::eViewport,
		vk::DynamicState::eScissor,
	};

	vk::PipelineDynamicStateCreateInfo dynamic { {}, dynamic_states };

	vk::PipelineLayout layout = pipeline_layouts.at(descriptor.layout);

	// Any pass with the same formats is compatible
	vk::RenderPass pass = render_pass(key);

	vk::GraphicsPipelineCreateInfo info;
	info.setStages(stages);
	info.pVertexInputState = &vertex_input;
	info.pInputAssemblyState = &input_assembly;
	info.pViewportState = &viewport;
	info.pRasterizationState = &rasterization;
	info.pMultisampleState = &multisample;
	info.pColorBlendState = &color_blend;
	info.pDynamicState = &dynamic;
	info.layout = layout;
	info.renderPass = pass;

	auto result = device.createGraphicsPipeline(nullptr, info);
	if (result.result != vk::Result::eSuccess)
		SPARK_ABORT("failed to create render pipeline \"{}\"", descriptor.label);

	auto handle = allocate <gpu::PipelineHandle> ();
	pipelines[handle] = { result.value, layout, vk::PipelineBindPoint::eGraphics, pass };
	return handle;
}

gpu::BindGroupHandle Device::create_bind_group(gpu::BindGroupLayoutHandle layout, const std::vector <gpu::BindGroupEntry> &entries, const std::string &label)
{
	vk::DescriptorSetLayout set_layout = set_layouts.at(layout);
	vk::DescriptorSet set = device.allocateDescriptorSets(vk::DescriptorSetAllocateInfo { descriptor_pool, set_layout }).front();

	// Descriptor types are those of the layout
	std::vector <vk::DescriptorBufferInfo> infos;
	infos.reserve(entries.size());

	std::vector <vk::WriteDescriptorSet> writes;
	for (auto &entry : entries) {
		auto &record = buffer(entry.buffer);
		infos.push_back({ record.buffer.buffer, entry.offset, entry.size });

		writes.push_back(vk::WriteDescriptorSet {
			set, entry.binding, 0, 1,
			binding_types.at(layout).at(entry.binding),
			nullptr, &infos.back(),
		});
	}

	device.updateDescriptorSets(writes, {});

	SPARK_DEBUG_INFO("created descriptor set \"{}\"", label);

	auto handle = allocate <gpu::BindGroupHandle> ();
	descriptor_sets[handle] = set;
	return handle;
}

gpu::TextureHandle Device::create_texture(const gpu::TextureDescriptor &descriptor)
{
	texture_record record;
	record.descriptor = descriptor;

	std::tie(record.image) = allocator()
		.image(vk::Extent2D { descriptor.extent.x, descriptor.extent.y },
			translate(descriptor.format),
			vk::ImageUsageFlagBits::eColorAttachment
				| vk::ImageUsageFlagBits::eTransferSrc
				| vk::ImageUsageFlagBits::eSampled,
			vk::ImageAspectFlagBits::eColor);

	auto handle = allocate <gpu::TextureHandle> ();
	textures[handle] = record;
	return handle;
}

std::unique_ptr <gpu::ComputePassEncoder> Device::begin_compute_pass(const std::string &label)
{
	SPARK_DEBUG_INFO("recording compute pass \"{}\"", label);
	return std::make_unique <ComputePass> (*this);
}

std::unique_ptr <gpu::RenderPassEncoder> Device::begin_render_pass(const std::string &label, const std::vector <gpu::ColorAttachment> &attachments)
{
	SPARK_ASSERT(!attachments.empty(), "render pass \"{}\" has no color attachments", label);
	SPARK_DEBUG_INFO("recording render pass \"{}\"", label);
	return std::make_unique <RenderPass> (*this, attachments);
}

void Device::submit()
{
	if (!recording)
		return;

	cmd.end();
	recording = false;

	vk::SubmitInfo info { {}, {}, cmd };
	queue.submit(info);
	queue.waitIdle();

	cmd.reset();
}

} // namespace spark::vulkan
