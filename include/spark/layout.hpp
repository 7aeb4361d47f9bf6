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
#include "data.hpp"
#include "resolvable.hpp"

namespace spark {

struct LayoutEntryInfo {
	BindingKind kind;
	data_ref type;
	gpu::ShaderStage visibility = gpu::ShaderStage::all;
};

LayoutEntryInfo uniform_entry(const data_ref &, gpu::ShaderStage = gpu::ShaderStage::all);
LayoutEntryInfo readonly_entry(const data_ref &, gpu::ShaderStage = gpu::ShaderStage::all);
LayoutEntryInfo mutable_entry(const data_ref &, gpu::ShaderStage = gpu::ShaderStage::all);

// Declares a buffer binding and returns the name referring to it
std::string declare_binding(ResolutionContext &, BindingKind, const data_ref &,
			    const std::string &, const std::string &, uint32_t);

class BindGroupLayout;
struct BindGroup;

// Shader-visible reference to one entry of an explicit layout
struct LayoutEntry : Resolvable {
	BindGroupLayout *layout;
	std::string key;

	LayoutEntry(BindGroupLayout *layout_, const std::string &key_)
			: layout(layout_), key(key_) {}

	std::string label() const override {
		return key;
	}

	std::string resolve(ResolutionContext &) override;
};

using bind_group_ref = std::shared_ptr <BindGroup>;

// Binding numbers are the positions of the entries
class BindGroupLayout : public std::enable_shared_from_this <BindGroupLayout> {
	std::map <std::string, std::unique_ptr <LayoutEntry>> bound_entries;

	// Native objects by device id
	std::map <uint64_t, gpu::BindGroupLayoutHandle> handles;
public:
	using entry = std::pair <std::string, LayoutEntryInfo>;

	std::string label;
	std::vector <entry> entries;

	BindGroupLayout(const std::string &, const std::vector <entry> &);

	BindGroupLayout(const BindGroupLayout &) = delete;
	BindGroupLayout &operator=(const BindGroupLayout &) = delete;

	std::optional <uint32_t> binding_of(const std::string &) const;
	const LayoutEntryInfo &info(const std::string &) const;

	resolvable_ref bound(const std::string &);

	std::vector <gpu::BindGroupLayoutEntry> descriptor() const;
	gpu::BindGroupLayoutHandle unwrap(gpu::Device &);

	// Every key must be given a buffer allowed to back its entry
	bind_group_ref populate(const std::map <std::string, buffer_ref> &);
};

using layout_ref = std::shared_ptr <BindGroupLayout>;

layout_ref bind_group_layout(const std::string &, const std::vector <BindGroupLayout::entry> &);

struct BindGroup {
	layout_ref layout;
	std::map <std::string, buffer_ref> resources;

	BindGroup(const layout_ref &layout_, const std::map <std::string, buffer_ref> &resources_)
			: layout(layout_), resources(resources_) {}

	gpu::BindGroupHandle unwrap(gpu::Device &);
private:
	std::map <uint64_t, gpu::BindGroupHandle> handles;
};

} // namespace spark
