#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

#include "names.hpp"

namespace spark {

struct Options {
	NamingStrategy naming = NamingStrategy::strict;
	uint64_t naming_seed = 0;

	std::string glsl_version = "450";

	// Print every generated module
	bool trace = false;

	// Directory receiving every generated module
	std::optional <std::filesystem::path> trace_destination;
};

} // namespace spark
