#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "../gpu/device.hpp"
#include "data.hpp"
#include "resolvable.hpp"

namespace spark {

enum BindingKind : int8_t {
	eUniform,
	eReadonly,
	eMutable,
	eVertex,
	__binding_kind_end
};

extern const char *tbl_binding_kind[__binding_kind_end];

gpu::BindingType binding_type(BindingKind);

// Usage flag a buffer needs for a binding kind
gpu::BufferUsageFlags required_usage(BindingKind);

class Buffer;

// One vertex input declared for a vertex bindable
struct VertexInput {
	std::string field;
	data_ref type;
	uint64_t offset;
};

// A buffer paired with the way shaders access it
struct BufferUsage : Resolvable {
	Buffer *buffer;
	BindingKind kind;
	gpu::VertexStepMode step_mode;

	BufferUsage(Buffer *buffer_, BindingKind kind_, gpu::VertexStepMode step_mode_ = gpu::VertexStepMode::vertex)
			: buffer(buffer_), kind(kind_), step_mode(step_mode_) {}

	// Shares ownership of the buffer
	std::shared_ptr <BufferUsage> ref();

	std::string label() const override;
	std::string resolve(ResolutionContext &) override;

	// Vertex usages only
	uint64_t stride() const;
	std::vector <VertexInput> inputs() const;
	gpu::VertexBufferLayout vertex_layout(uint32_t) const;
};

using usage_ref = std::shared_ptr <BufferUsage>;

// Typed GPU buffer; the native buffer is created on first use
class Buffer : public std::enable_shared_from_this <Buffer> {
	std::shared_ptr <gpu::Device> device;
	gpu::BufferHandle handle;

	// At most one usage per kind and step mode
	std::map <std::pair <BindingKind, gpu::VertexStepMode>, std::unique_ptr <BufferUsage>> usages;

	void check_range(const char *, uint64_t, uint64_t) const;
public:
	std::string label;
	data_ref type;
	gpu::BufferUsageFlags flags;

	Buffer(const std::shared_ptr <gpu::Device> &, const data_ref &, gpu::BufferUsageFlags, const std::string & = "");

	Buffer(const Buffer &) = delete;
	Buffer &operator=(const Buffer &) = delete;

	bool usable_as(gpu::BufferUsageFlags flag) const {
		return has(flags, flag);
	}

	gpu::BufferHandle unwrap();

	void write(const void *, uint64_t, uint64_t = 0);
	void read(void *, uint64_t, uint64_t = 0);

	template <typename T>
	void write(const std::vector <T> &values) {
		write(values.data(), values.size() * sizeof(T));
	}

	template <typename T>
	std::vector <T> read() {
		std::vector <T> values(type->size() / sizeof(T));
		read(values.data(), values.size() * sizeof(T));
		return values;
	}

	// Memoized; does not check the usage flags
	std::shared_ptr <BufferUsage> usage(BindingKind, gpu::VertexStepMode = gpu::VertexStepMode::vertex);
};

using buffer_ref = std::shared_ptr <Buffer>;

usage_ref as_uniform(const buffer_ref &);
usage_ref as_readonly(const buffer_ref &);
usage_ref as_mutable(const buffer_ref &);
usage_ref as_vertex(const buffer_ref &, gpu::VertexStepMode = gpu::VertexStepMode::vertex);

} // namespace spark
