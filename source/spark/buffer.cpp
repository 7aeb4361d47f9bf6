#include <fmt/format.h>

#include "common/error.hpp"
#include "spark/buffer.hpp"
#include "spark/context.hpp"
#include "spark/layout.hpp"

namespace spark {

MODULE(buffer);

const char *tbl_binding_kind[] = {
	"uniform",
	"readonly",
	"mutable",
	"vertex",
};

gpu::BindingType binding_type(BindingKind kind)
{
	switch (kind) {
	case eUniform:
		return gpu::BindingType::uniform_buffer;
	case eReadonly:
		return gpu::BindingType::readonly_storage_buffer;
	case eMutable:
		return gpu::BindingType::storage_buffer;
	default:
		break;
	}

	SPARK_ABORT("{} usages are not bound through bind groups", tbl_binding_kind[kind]);
}

gpu::BufferUsageFlags required_usage(BindingKind kind)
{
	switch (kind) {
	case eUniform:
		return gpu::BufferUsageFlags::uniform;
	case eReadonly:
	case eMutable:
		return gpu::BufferUsageFlags::storage;
	case eVertex:
		return gpu::BufferUsageFlags::vertex;
	default:
		break;
	}

	SPARK_ABORT("unknown binding kind #{}", int(kind));
}

static const char *tbl_usage_flag(BindingKind kind)
{
	return kind == eUniform ? "uniform" : (kind == eVertex ? "vertex" : "storage");
}

// Vertex shapes
static data_ref vertex_element(const data_ref &type)
{
	if (type->kind() == eArray)
		return std::static_pointer_cast <Array> (type)->element;

	return type;
}

static bool vertex_attribute_type(const data_ref &type)
{
	if (auto scalar = std::dynamic_pointer_cast <Scalar> (type))
		return scalar->scalar != eBool;

	if (auto vector = std::dynamic_pointer_cast <Vector> (type))
		return vector->component != eBool;

	return false;
}

static void validate_vertex_shape(const Buffer &buffer)
{
	data_ref element = vertex_element(buffer.type);

	auto reject = [&](const std::string &reason) {
		SPARK_RAISE(UnsupportedDataShapeError, buffer.type->label(), reason);
	};

	switch (element->kind()) {
	case eScalar:
	case eVector:
		if (!vertex_attribute_type(element))
			reject("boolean vertex attributes are not supported");
		break;
	case eStruct:
		for (auto &[name, field] : std::static_pointer_cast <Struct> (element)->fields) {
			if (!vertex_attribute_type(field))
				reject(fmt::format("field '{}' of type '{}' cannot be a vertex attribute", name, field->label()));
		}
		break;
	case eMatrix:
		reject("matrices cannot be vertex attributes");
		break;
	case eArray:
		reject("nested arrays cannot back a vertex buffer");
		break;
	}
}

static gpu::VertexFormat vertex_format(const data_ref &type)
{
	scalar_kind component;
	uint32_t count = 1;

	if (auto vector = std::dynamic_pointer_cast <Vector> (type)) {
		component = vector->component;
		count = vector->count;
	} else {
		component = std::static_pointer_cast <Scalar> (type)->scalar;
	}

	uint32_t base = 0;
	if (component == eI32)
		base = uint32_t(gpu::VertexFormat::sint32);
	else if (component == eU32)
		base = uint32_t(gpu::VertexFormat::uint32);

	return gpu::VertexFormat(base + count - 1);
}

// Buffer usages
usage_ref BufferUsage::ref()
{
	return usage_ref(buffer->shared_from_this(), this);
}

std::string BufferUsage::label() const
{
	std::string name = buffer->label.empty() ? "<unnamed>" : buffer->label;
	return fmt::format("{}:{}", tbl_binding_kind[kind], name);
}

uint64_t BufferUsage::stride() const
{
	return vertex_element(buffer->type)->size();
}

std::vector <VertexInput> BufferUsage::inputs() const
{
	data_ref element = vertex_element(buffer->type);
	if (element->kind() != eStruct)
		return { { "", element, 0 } };

	auto structure = std::static_pointer_cast <Struct> (element);
	auto offsets = structure->offsets();

	std::vector <VertexInput> result;
	for (size_t i = 0; i < structure->fields.size(); i++) {
		auto &[name, type] = structure->fields[i];
		result.push_back({ name, type, offsets[i] });
	}

	return result;
}

gpu::VertexBufferLayout BufferUsage::vertex_layout(uint32_t location) const
{
	gpu::VertexBufferLayout layout;
	layout.stride = stride();
	layout.step_mode = step_mode;

	for (auto &input : inputs())
		layout.attributes.push_back({ location++, input.offset, vertex_format(input.type) });

	return layout;
}

std::string BufferUsage::resolve(ResolutionContext &ctx)
{
	Identifier identifier(buffer->label);
	std::string name = ctx.resolve(identifier);

	if (kind != eVertex) {
		uint32_t binding = ctx.plan().catchall_binding(ref(), name, ctx.stage());
		return declare_binding(ctx, kind, buffer->type, name, catchall_marker, binding);
	}

	auto fields = inputs();
	auto [slot, location] = ctx.plan().vertex_input(ref(), fields.size());

	std::string declaration;
	for (auto &input : fields) {
		std::string variable = name;
		if (!input.field.empty()) {
			Identifier field(name + "_" + input.field);
			variable = ctx.resolve(field);
			ctx.add_member(name, input.field, variable);
		}

		declaration += fmt::format("layout(location = {}) in {};\n",
			location++, input.type->declare(ctx, variable));
	}

	ctx.add_declaration(declaration);

	return name;
}

// Buffers
Buffer::Buffer(const std::shared_ptr <gpu::Device> &device_, const data_ref &type_, gpu::BufferUsageFlags flags_, const std::string &label_)
		: device(device_), label(label_), type(type_), flags(flags_) {}

gpu::BufferHandle Buffer::unwrap()
{
	if (!handle) {
		gpu::BufferDescriptor descriptor {
			.label = label,
			.size = type->size(),
			.usage = flags | gpu::BufferUsageFlags::copy_src | gpu::BufferUsageFlags::copy_dst,
		};

		handle = device->create_buffer(descriptor);
	}

	return handle;
}

void Buffer::check_range(const char *access, uint64_t size, uint64_t offset) const
{
	if (offset > type->size() || size > type->size() - offset) {
		SPARK_RAISE(Error, eOutOfBounds,
			fmt::format("{} {} bytes at offset {} overflows buffer '{}' ({} bytes)",
				access, size, offset, label, type->size()));
	}
}

void Buffer::write(const void *data, uint64_t size, uint64_t offset)
{
	check_range("writing", size, offset);

	device->write_buffer(unwrap(), offset, data, size);
}

void Buffer::read(void *data, uint64_t size, uint64_t offset)
{
	check_range("reading", size, offset);

	device->read_buffer(unwrap(), offset, data, size);
}

usage_ref Buffer::usage(BindingKind kind, gpu::VertexStepMode step_mode)
{
	// Step modes only distinguish vertex usages
	if (kind != eVertex)
		step_mode = gpu::VertexStepMode::vertex;

	auto &slot = usages[{ kind, step_mode }];
	if (!slot)
		slot = std::make_unique <BufferUsage> (this, kind, step_mode);

	return slot->ref();
}

static usage_ref authorized_usage(const buffer_ref &buffer, BindingKind kind, gpu::VertexStepMode step_mode = gpu::VertexStepMode::vertex)
{
	if (!buffer->usable_as(required_usage(kind)))
		SPARK_RAISE(UnauthorizedUsageError, buffer->label, tbl_binding_kind[kind], tbl_usage_flag(kind));

	return buffer->usage(kind, step_mode);
}

usage_ref as_uniform(const buffer_ref &buffer)
{
	return authorized_usage(buffer, eUniform);
}

usage_ref as_readonly(const buffer_ref &buffer)
{
	return authorized_usage(buffer, eReadonly);
}

usage_ref as_mutable(const buffer_ref &buffer)
{
	return authorized_usage(buffer, eMutable);
}

usage_ref as_vertex(const buffer_ref &buffer, gpu::VertexStepMode step_mode)
{
	if (buffer->usable_as(gpu::BufferUsageFlags::vertex))
		validate_vertex_shape(*buffer);

	return authorized_usage(buffer, eVertex, step_mode);
}

} // namespace spark
