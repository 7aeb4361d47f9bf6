#include <fmt/format.h>
#include <fmt/ranges.h>

#include "common/error.hpp"

namespace spark {

const char *tbl_error_kind[] = {
	"unauthorized usage",
	"missing links",
	"missing bind group",
	"unsupported data shape",
	"unbound slot",
	"missing transpiler",
	"layout mismatch",
	"invalid bind group",
	"unknown layout entry",
	"argument mismatch",
	"out of bounds",
	"invalid literal",
};

static std::string label_or_unnamed(const std::string &label)
{
	return label.empty() ? "<unnamed>" : label;
}

MissingLinksError::MissingLinksError(const std::string &function_, const std::vector <std::string> &names_)
		: Error(eMissingLinks, fmt::format("missing links in function '{}': {}",
			label_or_unnamed(function_),
			fmt::join(names_, ", "))),
		function(function_), names(names_) {}

MissingBindGroupError::MissingBindGroupError(const std::string &layout_)
		: Error(eMissingBindGroup, fmt::format("missing bind group for layout '{}'",
			label_or_unnamed(layout_))),
		layout(layout_) {}

UnauthorizedUsageError::UnauthorizedUsageError(const std::string &buffer_, const std::string &usage_, const std::string &flag)
		: Error(eUnauthorizedUsage, fmt::format("cannot use buffer '{}' as {}, it was not created "
			"with the {} usage flag (add it to the buffer's usage when creating it)",
			label_or_unnamed(buffer_), usage_, flag)),
		buffer(buffer_), usage(usage_) {}

UnsupportedDataShapeError::UnsupportedDataShapeError(const std::string &type_, const std::string &reason)
		: Error(eUnsupportedDataShape, fmt::format("unsupported data shape '{}': {}", type_, reason)),
		type(type_) {}

} // namespace spark
