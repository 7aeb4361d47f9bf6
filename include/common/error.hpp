#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "logging.hpp"

namespace spark {

enum error_kind : int32_t {
	eUnauthorizedUsage,
	eMissingLinks,
	eMissingBindGroup,
	eUnsupportedDataShape,
	eUnboundSlot,
	eMissingTranspiler,
	eLayoutMismatch,
	eInvalidBindGroup,
	eUnknownLayoutEntry,
	eArgumentMismatch,
	eOutOfBounds,
	eInvalidLiteral,
	__error_kind_end
};

extern const char *tbl_error_kind[__error_kind_end];

struct Error : std::runtime_error {
	error_kind kind;

	Error(error_kind kind_, const std::string &msg)
			: std::runtime_error(msg), kind(kind_) {}
};

struct MissingLinksError : Error {
	std::string function;
	std::vector <std::string> names;

	MissingLinksError(const std::string &, const std::vector <std::string> &);
};

struct MissingBindGroupError : Error {
	std::string layout;

	MissingBindGroupError(const std::string &);
};

struct UnauthorizedUsageError : Error {
	std::string buffer;
	std::string usage;

	UnauthorizedUsageError(const std::string &, const std::string &, const std::string &);
};

struct UnsupportedDataShapeError : Error {
	std::string type;

	UnsupportedDataShapeError(const std::string &, const std::string &);
};

// Reports the error under the raising module before throwing it
template <typename E, typename ... Args>
[[noreturn]]
void raise(const char *module, Args &&... args)
{
	E error(std::forward <Args> (args)...);
	io::error(module, error.what());
	throw error;
}

#define SPARK_RAISE(E, ...)	spark::raise <E> (__module__, __VA_ARGS__)

} // namespace spark
