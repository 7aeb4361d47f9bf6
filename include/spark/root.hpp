#pragma once

#include <memory>
#include <string>

#include "../gpu/device.hpp"
#include "buffer.hpp"
#include "options.hpp"
#include "pipeline.hpp"
#include "transpiler.hpp"

namespace spark {

// Entry point for applications; ties a device to the engine settings
struct Root {
	std::shared_ptr <gpu::Device> device;
	Options options;
	std::shared_ptr <Transpiler> transpiler;

	Root(const std::shared_ptr <gpu::Device> &,
	     const Options & = {},
	     const std::shared_ptr <Transpiler> & = nullptr);

	buffer_ref create_buffer(const data_ref &, gpu::BufferUsageFlags, const std::string & = "") const;

	PipelineBuilder pipeline() const;

	// Pipeline builder with a slot already bound
	PipelineBuilder with(const slot_ref &, const Value &) const;

	void submit() const;
};

} // namespace spark
