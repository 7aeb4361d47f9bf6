#include "spark/context.hpp"
#include "spark/slot.hpp"

namespace spark {

std::string Slot::resolve(ResolutionContext &ctx)
{
	return ctx.resolve(ctx.unwrap(*this));
}

slot_ref slot(const std::string &name, const std::optional <Value> &default_value)
{
	return std::make_shared <Slot> (name, default_value);
}

size_t SlotEnvironment::push(const slot_bindings &bindings)
{
	size_t mark = stack.size();
	for (auto &[s, value] : bindings)
		stack.push_back({ s.get(), value });

	return mark;
}

void SlotEnvironment::restore(size_t mark)
{
	if (mark < stack.size())
		stack.resize(mark);
}

std::optional <std::pair <size_t, Value>> SlotEnvironment::find(const Slot &s) const
{
	for (size_t i = stack.size(); i-- > 0; ) {
		if (stack[i].slot == &s)
			return std::make_pair(i, stack[i].value);
	}

	return std::nullopt;
}

std::string SlotBound::resolve(ResolutionContext &ctx)
{
	return ctx.resolve(*inner, bindings);
}

resolvable_ref with(const resolvable_ref &item, const slot_ref &s, const Value &value)
{
	// Nested bindings flatten into one scope
	if (auto bound = std::dynamic_pointer_cast <SlotBound> (item)) {
		auto bindings = bound->bindings;
		bindings.emplace_back(s, value);
		return std::make_shared <SlotBound> (bound->inner, bindings);
	}

	return std::make_shared <SlotBound> (item, slot_bindings { { s, value } });
}

} // namespace spark
