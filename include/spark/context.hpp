#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "../gpu/device.hpp"
#include "buffer.hpp"
#include "layout.hpp"
#include "names.hpp"
#include "options.hpp"
#include "resolvable.hpp"
#include "slot.hpp"
#include "transpiler.hpp"

namespace spark {

// Set index written by catch-all declarations until the
// number of explicit layouts is known
inline constexpr const char catchall_marker[] = "$catchall$";

// Bind group and vertex buffer assignments, shared by
// every stage of one program
struct BindingPlan {
	struct catchall_entry {
		usage_ref usage;
		std::string key;
		gpu::ShaderStage visibility;
	};

	struct vertex_entry {
		usage_ref usage;
		uint32_t location;
	};

	// Explicit layouts; pinned ones come first
	std::vector <layout_ref> layouts;

	std::vector <catchall_entry> catchall;
	std::vector <vertex_entry> vertex_buffers;
	uint32_t next_location = 0;

	BindingPlan(const std::vector <layout_ref> &pinned = {}) : layouts(pinned) {}

	// Group of an explicit layout, appended on first reference
	uint32_t group_index(const layout_ref &);

	// Binding of a bindable inside the catch-all group
	uint32_t catchall_binding(const usage_ref &, const std::string &, gpu::ShaderStage);

	// Buffer slot and first location of a vertex bindable
	std::pair <uint32_t, uint32_t> vertex_input(const usage_ref &, uint32_t);

	uint32_t catchall_index() const {
		return layouts.size();
	}

	// Layout and populated group covering every catch-all entry
	std::pair <layout_ref, bind_group_ref> build_catchall() const;
};

// One resolution pass over a single shader module
class ResolutionContext {
	using slot_read = std::pair <const Slot *, Value>;

	struct memo_entry {
		std::string result;
		std::vector <slot_read> reads;
	};

	// Slot reads of the items currently being resolved
	struct frame {
		size_t mark;
		std::vector <slot_read> reads;
	};

	NameRegistry &registry;
	BindingPlan &binding_plan;
	Transpiler *transpiler_;
	gpu::ShaderStage stage_;

	SlotEnvironment env;
	std::vector <frame> frames;
	std::map <const Resolvable *, std::vector <memo_entry>> memo;
	std::vector <std::string> declarations_;

	// Names standing for member accesses on resolved items
	std::map <std::pair <std::string, std::string>, std::string> members;

	void record(const Slot &, const Value &, std::optional <size_t>);
	bool matches(const memo_entry &) const;
	void propagate(const memo_entry &);
public:
	ResolutionContext(NameRegistry &, BindingPlan &, Transpiler *, gpu::ShaderStage);

	ResolutionContext(const ResolutionContext &) = delete;
	ResolutionContext &operator=(const ResolutionContext &) = delete;

	// Returns the text that refers to the item, declaring it first
	// unless it was declared under the same slot values already
	std::string resolve(Resolvable &);
	std::string resolve(const Value &);
	std::string resolve(Resolvable &, const slot_bindings &);

	// Current value of a slot; reading it makes the slot part of
	// the memo key of every item being resolved
	Value unwrap(const Slot &);

	void add_declaration(const std::string &);

	// Spells "resolved.field" as a separate name, e.g. for
	// the fields of structured vertex inputs
	void add_member(const std::string &, const std::string &, const std::string &);
	std::string member(const std::string &, const std::string &) const;

	NameRegistry &names() {
		return registry;
	}

	BindingPlan &plan() {
		return binding_plan;
	}

	Transpiler *transpiler() const {
		return transpiler_;
	}

	gpu::ShaderStage stage() const {
		return stage_;
	}

	const std::vector <std::string> &declarations() const {
		return declarations_;
	}

	std::string source() const;
};

struct Catchall {
	uint32_t index;
	bind_group_ref group;
};

struct ResolutionResult {
	// One module per stage, in stage order
	std::vector <std::string> sources;

	// Explicit layouts followed by the catch-all, if any
	std::vector <layout_ref> layouts;

	std::optional <Catchall> catchall;
	std::vector <BindingPlan::vertex_entry> vertex_buffers;

	const std::string &source() const {
		return sources.front();
	}
};

struct ProgramStage {
	gpu::ShaderStage stage;
	resolvable_ref entry;
};

ResolutionResult resolve_program(const std::vector <ProgramStage> &,
				 const std::vector <layout_ref> &,
				 const slot_bindings &,
				 const Options &,
				 Transpiler *);

// Single compute module
ResolutionResult resolve(const resolvable_ref &,
			 const Options & = {},
			 const std::vector <layout_ref> & = {},
			 const slot_bindings & = {},
			 Transpiler * = nullptr);

} // namespace spark
