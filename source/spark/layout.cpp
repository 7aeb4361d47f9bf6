#include <fmt/format.h>
#include <fmt/ranges.h>

#include "common/error.hpp"
#include "spark/context.hpp"
#include "spark/layout.hpp"

namespace spark {

MODULE(layout);

LayoutEntryInfo uniform_entry(const data_ref &type, gpu::ShaderStage visibility)
{
	return { eUniform, type, visibility };
}

LayoutEntryInfo readonly_entry(const data_ref &type, gpu::ShaderStage visibility)
{
	return { eReadonly, type, visibility };
}

LayoutEntryInfo mutable_entry(const data_ref &type, gpu::ShaderStage visibility)
{
	return { eMutable, type, visibility };
}

std::string declare_binding(ResolutionContext &ctx, BindingKind kind, const data_ref &type,
			    const std::string &name, const std::string &set, uint32_t binding)
{
	Identifier identifier(name + "_block");
	std::string block = ctx.resolve(identifier);

	std::string qualifier;
	switch (kind) {
	case eUniform:
		qualifier = "std140) uniform";
		break;
	case eReadonly:
		qualifier = "std430) readonly buffer";
		break;
	case eMutable:
		qualifier = "std430) buffer";
		break;
	default:
		SPARK_ABORT("{} usages cannot be declared as bindings", tbl_binding_kind[kind]);
	}

	ctx.add_declaration(fmt::format("layout(set = {}, binding = {}, {} {} {{\n    {};\n}};\n",
		set, binding, qualifier, block, type->declare(ctx, name)));

	return name;
}

// Layout entries
std::string LayoutEntry::resolve(ResolutionContext &ctx)
{
	uint32_t group = ctx.plan().group_index(layout->shared_from_this());
	uint32_t binding = *layout->binding_of(key);
	auto &info = layout->info(key);

	Identifier identifier(key);
	std::string name = ctx.resolve(identifier);

	return declare_binding(ctx, info.kind, info.type, name, std::to_string(group), binding);
}

// Bind group layouts
BindGroupLayout::BindGroupLayout(const std::string &label_, const std::vector <entry> &entries_)
		: label(label_), entries(entries_)
{
	for (auto &[key, info] : entries) {
		if (info.kind == eVertex) {
			SPARK_RAISE(Error, eInvalidBindGroup,
				fmt::format("entry '{}' of layout '{}' is a vertex usage, "
					"which cannot be part of a bind group", key, label));
		}
	}
}

std::optional <uint32_t> BindGroupLayout::binding_of(const std::string &key) const
{
	for (uint32_t i = 0; i < entries.size(); i++) {
		if (entries[i].first == key)
			return i;
	}

	return std::nullopt;
}

const LayoutEntryInfo &BindGroupLayout::info(const std::string &key) const
{
	auto binding = binding_of(key);
	if (!binding) {
		SPARK_RAISE(Error, eUnknownLayoutEntry,
			fmt::format("layout '{}' has no entry named '{}'", label, key));
	}

	return entries[*binding].second;
}

resolvable_ref BindGroupLayout::bound(const std::string &key)
{
	info(key);

	auto &slot = bound_entries[key];
	if (!slot)
		slot = std::make_unique <LayoutEntry> (this, key);

	return resolvable_ref(shared_from_this(), slot.get());
}

std::vector <gpu::BindGroupLayoutEntry> BindGroupLayout::descriptor() const
{
	std::vector <gpu::BindGroupLayoutEntry> result;
	for (uint32_t i = 0; i < entries.size(); i++) {
		auto &info = entries[i].second;
		result.push_back({ i, info.visibility, binding_type(info.kind) });
	}

	return result;
}

gpu::BindGroupLayoutHandle BindGroupLayout::unwrap(gpu::Device &device)
{
	auto &handle = handles[device.id()];
	if (!handle)
		handle = device.create_bind_group_layout(descriptor(), label);

	return handle;
}

bind_group_ref BindGroupLayout::populate(const std::map <std::string, buffer_ref> &resources)
{
	std::vector <std::string> missing;
	for (auto &[key, info] : entries) {
		auto it = resources.find(key);
		if (it == resources.end() || !it->second) {
			missing.push_back(key);
			continue;
		}

		auto &buffer = it->second;
		auto flag = required_usage(info.kind);
		if (!buffer->usable_as(flag)) {
			SPARK_RAISE(Error, eInvalidBindGroup,
				fmt::format("buffer '{}' cannot back entry '{}' of layout '{}', "
					"it is used as {} but lacks the matching usage flag",
					buffer->label, key, label, tbl_binding_kind[info.kind]));
		}
	}

	if (!missing.empty()) {
		SPARK_RAISE(Error, eInvalidBindGroup,
			fmt::format("bind group for layout '{}' is missing entries: {}",
				label, fmt::join(missing, ", ")));
	}

	for (auto &[key, _] : resources) {
		if (!binding_of(key)) {
			SPARK_RAISE(Error, eInvalidBindGroup,
				fmt::format("layout '{}' has no entry named '{}'", label, key));
		}
	}

	return std::make_shared <BindGroup> (shared_from_this(), resources);
}

layout_ref bind_group_layout(const std::string &label, const std::vector <BindGroupLayout::entry> &entries)
{
	return std::make_shared <BindGroupLayout> (label, entries);
}

// Bind groups
gpu::BindGroupHandle BindGroup::unwrap(gpu::Device &device)
{
	auto &handle = handles[device.id()];
	if (handle)
		return handle;

	std::vector <gpu::BindGroupEntry> entries;
	for (auto &[key, info] : layout->entries) {
		auto &buffer = resources.at(key);
		entries.push_back({
			*layout->binding_of(key),
			buffer->unwrap(),
			0, buffer->type->size(),
		});
	}

	handle = device.create_bind_group(layout->unwrap(device), entries, layout->label);
	return handle;
}

} // namespace spark
