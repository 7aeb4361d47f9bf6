#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include <glm/glm.hpp>

#include "../gpu/device.hpp"
#include "context.hpp"
#include "function.hpp"
#include "layout.hpp"
#include "options.hpp"
#include "slot.hpp"
#include "transpiler.hpp"

namespace spark {

// Everything a pipeline needs after its single resolution pass
struct Memo {
	gpu::PipelineHandle pipeline;
	gpu::PipelineLayoutHandle pipeline_layout;
	std::vector <layout_ref> layouts;
	std::optional <Catchall> catchall;
	std::vector <BindingPlan::vertex_entry> vertex_buffers;
	std::vector <std::string> sources;
};

struct ComputeProgram {
	resolvable_ref entry;
};

struct RenderProgram {
	resolvable_ref vertex;
	resolvable_ref fragment;
	std::vector <gpu::TextureFormat> targets;
	gpu::PrimitiveTopology topology = gpu::PrimitiveTopology::triangle_list;
};

using Program = std::variant <ComputeProgram, RenderProgram>;

// Owns the one compiled artifact of a pipeline
class PipelineCore {
	std::optional <Memo> memo;

	void trace(const std::string &, const std::string &, const char *) const;
	Memo build();
public:
	std::shared_ptr <gpu::Device> device;
	std::shared_ptr <Transpiler> transpiler;
	Options options;

	std::string label;
	Program program;
	slot_bindings slots;
	std::vector <layout_ref> pinned;

	PipelineCore(const std::shared_ptr <gpu::Device> &device_,
		     const std::shared_ptr <Transpiler> &transpiler_,
		     const Options &options_,
		     const std::string &label_,
		     const Program &program_,
		     const slot_bindings &slots_,
		     const std::vector <layout_ref> &pinned_)
			: device(device_), transpiler(transpiler_), options(options_),
			label(label_), program(program_), slots(slots_), pinned(pinned_) {}

	PipelineCore(const PipelineCore &) = delete;
	PipelineCore &operator=(const PipelineCore &) = delete;

	// Resolves on the first call only
	const Memo &unwrap();

	bool resolved() const {
		return memo.has_value();
	}

	std::string display_label() const {
		return label.empty() ? "<unnamed>" : label;
	}
};

using prior_map = std::map <layout_ref, bind_group_ref>;

// Shared core plus the bind groups supplied by the caller
class PipelineView {
protected:
	std::shared_ptr <PipelineCore> core_;
	std::shared_ptr <const prior_map> priors_;

	std::shared_ptr <const prior_map> extended(const layout_ref &, const bind_group_ref &) const;

	// Group index and native group for every layout of the memo
	std::vector <std::pair <uint32_t, gpu::BindGroupHandle>> bind_groups(const Memo &) const;
public:
	PipelineView(const std::shared_ptr <PipelineCore> &core, const std::shared_ptr <const prior_map> &priors)
			: core_(core), priors_(priors) {}

	const Memo &unwrap() const {
		return core_->unwrap();
	}

	const std::shared_ptr <PipelineCore> &core() const {
		return core_;
	}

	const prior_map &priors() const {
		return *priors_;
	}
};

struct ComputePipeline : PipelineView {
	using PipelineView::PipelineView;

	ComputePipeline with(const layout_ref &, const bind_group_ref &) const;
	ComputePipeline with(const bind_group_ref &) const;

	void dispatch(uint32_t, uint32_t = 1, uint32_t = 1) const;
	void dispatch(const glm::uvec3 &) const;
};

struct RenderPipeline : PipelineView {
	using PipelineView::PipelineView;

	RenderPipeline with(const layout_ref &, const bind_group_ref &) const;
	RenderPipeline with(const bind_group_ref &) const;

	void draw(const std::vector <gpu::ColorAttachment> &,
		  uint32_t,
		  uint32_t = 1,
		  uint32_t = 0,
		  uint32_t = 0) const;
};

// Collects pipeline settings before creating a core
class PipelineBuilder {
	std::shared_ptr <gpu::Device> device;
	std::shared_ptr <Transpiler> transpiler;
	Options options;

	std::string label;
	slot_bindings slots;
	std::vector <layout_ref> pinned;

	std::shared_ptr <PipelineCore> core(const Program &) const;
public:
	PipelineBuilder(const std::shared_ptr <gpu::Device> &device_,
			const std::shared_ptr <Transpiler> &transpiler_,
			const Options &options_,
			const slot_bindings &slots_ = {})
			: device(device_), transpiler(transpiler_), options(options_), slots(slots_) {}

	PipelineBuilder with(const slot_ref &, const Value &) const;
	PipelineBuilder with_layouts(const std::vector <layout_ref> &) const;
	PipelineBuilder named(const std::string &) const;

	ComputePipeline compute(const resolvable_ref &) const;
	RenderPipeline render(const resolvable_ref &,
			      const resolvable_ref &,
			      const std::vector <gpu::TextureFormat> &,
			      gpu::PrimitiveTopology = gpu::PrimitiveTopology::triangle_list) const;
};

} // namespace spark
