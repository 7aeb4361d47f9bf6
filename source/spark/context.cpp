#include <fmt/format.h>

#include "common/error.hpp"
#include "spark/context.hpp"

namespace spark {

MODULE(context);

// Binding plan
uint32_t BindingPlan::group_index(const layout_ref &layout)
{
	for (uint32_t i = 0; i < layouts.size(); i++) {
		if (layouts[i] == layout)
			return i;
	}

	layouts.push_back(layout);
	return layouts.size() - 1;
}

uint32_t BindingPlan::catchall_binding(const usage_ref &usage, const std::string &key, gpu::ShaderStage stage)
{
	for (uint32_t i = 0; i < catchall.size(); i++) {
		auto &entry = catchall[i];
		if (entry.usage == usage) {
			entry.visibility = entry.visibility | stage;
			return i;
		}
	}

	catchall.push_back({ usage, key, stage });
	return catchall.size() - 1;
}

std::pair <uint32_t, uint32_t> BindingPlan::vertex_input(const usage_ref &usage, uint32_t locations)
{
	for (uint32_t i = 0; i < vertex_buffers.size(); i++) {
		if (vertex_buffers[i].usage == usage)
			return { i, vertex_buffers[i].location };
	}

	vertex_buffers.push_back({ usage, next_location });
	next_location += locations;

	return { vertex_buffers.size() - 1, vertex_buffers.back().location };
}

std::pair <layout_ref, bind_group_ref> BindingPlan::build_catchall() const
{
	std::vector <BindGroupLayout::entry> entries;
	std::map <std::string, buffer_ref> resources;

	for (auto &e : catchall) {
		LayoutEntryInfo info {
			.kind = e.usage->kind,
			.type = e.usage->buffer->type,
			.visibility = e.visibility,
		};

		entries.emplace_back(e.key, info);
		resources[e.key] = e.usage->buffer->shared_from_this();
	}

	auto layout = std::make_shared <BindGroupLayout> ("catchall", entries);
	return { layout, layout->populate(resources) };
}

// Resolution context
ResolutionContext::ResolutionContext(NameRegistry &registry_, BindingPlan &plan_, Transpiler *transpiler__, gpu::ShaderStage stage__)
		: registry(registry_), binding_plan(plan_),
		transpiler_(transpiler__), stage_(stage__) {}

void ResolutionContext::record(const Slot &s, const Value &value, std::optional <size_t> index)
{
	for (auto &f : frames) {
		// Bound inside the item itself
		if (index && *index >= f.mark)
			continue;

		bool seen = false;
		for (auto &[read, _] : f.reads)
			seen |= (read == &s);

		if (!seen)
			f.reads.emplace_back(&s, value);
	}
}

bool ResolutionContext::matches(const memo_entry &entry) const
{
	for (auto &[s, value] : entry.reads) {
		if (auto found = env.find(*s)) {
			if (found->second != value)
				return false;
		} else if (!s->default_value || *s->default_value != value) {
			return false;
		}
	}

	return true;
}

void ResolutionContext::propagate(const memo_entry &entry)
{
	for (auto &[s, value] : entry.reads) {
		auto found = env.find(*s);
		if (found)
			record(*s, value, found->first);
		else
			record(*s, value, std::nullopt);
	}
}

std::string ResolutionContext::resolve(Resolvable &item)
{
	if (!item.memoized())
		return item.resolve(*this);

	auto &entries = memo[&item];
	for (auto &entry : entries) {
		if (matches(entry)) {
			propagate(entry);
			return entry.result;
		}
	}

	// Frames are popped on every exit path
	struct frame_guard {
		std::vector <frame> &frames;

		~frame_guard() {
			frames.pop_back();
		}
	};

	frames.push_back({ env.size(), {} });
	frame_guard guard { frames };

	std::string result = item.resolve(*this);

	// The memo may have grown while resolving dependencies
	memo[&item].push_back({ result, frames.back().reads });

	return result;
}

std::string ResolutionContext::resolve(const Value &value)
{
	if (auto ref = std::get_if <resolvable_ref> (&value))
		return resolve(**ref);

	return literal(value);
}

std::string ResolutionContext::resolve(Resolvable &item, const slot_bindings &bindings)
{
	SlotScope scope(env, bindings);
	return resolve(item);
}

Value ResolutionContext::unwrap(const Slot &s)
{
	if (auto found = env.find(s)) {
		record(s, found->second, found->first);
		return found->second;
	}

	if (s.default_value) {
		record(s, *s.default_value, std::nullopt);
		return *s.default_value;
	}

	SPARK_RAISE(Error, eUnboundSlot,
		fmt::format("slot '{}' is not bound and has no default value", s.name));
}

void ResolutionContext::add_declaration(const std::string &declaration)
{
	declarations_.push_back(declaration);
}

void ResolutionContext::add_member(const std::string &resolved, const std::string &field, const std::string &name)
{
	members[{ resolved, field }] = name;
}

std::string ResolutionContext::member(const std::string &resolved, const std::string &field) const
{
	auto it = members.find({ resolved, field });
	if (it != members.end())
		return it->second;

	return resolved + "." + field;
}

std::string ResolutionContext::source() const
{
	std::string result;
	for (size_t i = 0; i < declarations_.size(); i++) {
		if (i > 0)
			result += "\n";

		result += declarations_[i];
	}

	return result;
}

// Resolution entry points
static std::string substitute_catchall(std::string source, uint32_t index)
{
	std::string marker = catchall_marker;
	std::string replacement = std::to_string(index);

	size_t pos = 0;
	while ((pos = source.find(marker, pos)) != std::string::npos) {
		source.replace(pos, marker.size(), replacement);
		pos += replacement.size();
	}

	return source;
}

ResolutionResult resolve_program(const std::vector <ProgramStage> &stages,
				 const std::vector <layout_ref> &pinned,
				 const slot_bindings &slots,
				 const Options &options,
				 Transpiler *transpiler)
{
	auto registry = make_registry(options.naming, options.naming_seed);

	BindingPlan plan(pinned);

	ResolutionResult result;
	for (auto &stage : stages) {
		ResolutionContext ctx(*registry, plan, transpiler, stage.stage);

		std::string entry = ctx.resolve(*stage.entry, slots);

		result.sources.push_back(fmt::format("#version {}\n\n{}\nvoid main()\n{{\n    {}();\n}}\n",
			options.glsl_version, ctx.source(), entry));
	}

	result.layouts = plan.layouts;
	result.vertex_buffers = plan.vertex_buffers;

	uint32_t index = plan.catchall_index();
	for (auto &source : result.sources)
		source = substitute_catchall(source, index);

	if (!plan.catchall.empty()) {
		auto [layout, group] = plan.build_catchall();
		result.layouts.push_back(layout);
		result.catchall = Catchall { index, group };
	}

	return result;
}

ResolutionResult resolve(const resolvable_ref &entry,
			 const Options &options,
			 const std::vector <layout_ref> &pinned,
			 const slot_bindings &slots,
			 Transpiler *transpiler)
{
	return resolve_program({ { gpu::ShaderStage::compute, entry } }, pinned, slots, options, transpiler);
}

} // namespace spark
