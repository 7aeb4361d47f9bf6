#include <cstdio>

#include "common/logging.hpp"

namespace spark::io {

const char *tbl_severity[] = {
	"note",
	"info",
	"warning",
	"error",
	"fatal error",
};

static const fmt::color tbl_severity_color[] = {
	fmt::color::cadet_blue,
	fmt::color::cadet_blue,
	fmt::color::magenta,
	fmt::color::orange_red,
	fmt::color::orange_red,
};

static severity current_threshold = eNote;

void set_threshold(severity level)
{
	current_threshold = level;
}

severity threshold()
{
	return current_threshold;
}

void print(severity level, const std::string &module, const std::string &msg)
{
	if (level < current_threshold && level != eFatal)
		return;

	if (module.empty()) {
		fmt::print(stderr, fmt::emphasis::bold | fmt::fg(fmt::color::gray), "spark: ");
	} else {
		fmt::print(stderr, fmt::emphasis::bold | fmt::fg(fmt::color::gray), "spark ");
		fmt::print(stderr, fmt::emphasis::bold | fmt::fg(fmt::color::gray), "({}): ", module);
	}

	fmt::print(stderr, fmt::emphasis::bold | fmt::fg(tbl_severity_color[level]), "{}: ", tbl_severity[level]);
	fmt::print(stderr, "{}\n", msg);
	std::fflush(stderr);
}

static void declared_from(const char *const file, int line)
{
	fmt::print(stderr, fmt::emphasis::bold | fmt::fg(fmt::color::gray), "spark: ");
	fmt::print(stderr, fmt::emphasis::bold | fmt::fg(fmt::color::cadet_blue), "note: ");
	fmt::print(stderr, "declared from {}:{}\n", file, line);
	std::fflush(stderr);
}

void assertion(bool cond, const std::string &module, const std::string &msg)
{
	if (cond) return;
	print(eFatal, module, "assertion failed: " + msg);
	__builtin_trap();
}

void assertion(bool cond, const std::string &module, const std::string &msg, const char *const file, int line)
{
	if (cond) return;
	print(eFatal, module, "assertion failed: " + msg);
	declared_from(file, line);
	__builtin_trap();
}

[[noreturn]]
void abort(const std::string &module, const std::string &msg)
{
	print(eFatal, module, msg);
	__builtin_trap();
}

[[noreturn]]
void abort(const std::string &module, const std::string &msg, const char *const file, int line)
{
	print(eFatal, module, msg);
	declared_from(file, line);
	__builtin_trap();
}

void error(const std::string &module, const std::string &msg)
{
	print(eError, module, msg);
}

void warning(const std::string &module, const std::string &msg)
{
	print(eWarning, module, msg);
}

void info(const std::string &module, const std::string &msg)
{
	print(eInfo, module, msg);
}

void note(const std::string &msg)
{
	print(eNote, "", msg);
}

stage_bracket::stage_bracket(const std::string &module_) : module(module_)
{
	if (current_threshold <= eInfo) {
		fmt::print(stderr, fmt::emphasis::bold | fmt::fg(fmt::color::gray), "spark: ");
		fmt::print(stderr, fmt::emphasis::bold | fmt::fg(fmt::color::gold), "begin: ");
		fmt::print(stderr, fmt::emphasis::underline | fmt::emphasis::bold | fmt::fg(fmt::color::gray), "{}\n", module);
		std::fflush(stderr);
	}

	start = clk.now();
}

stage_bracket::~stage_bracket()
{
	auto us = std::chrono::duration_cast <std::chrono::microseconds> (clk.now() - start).count();
	auto ms = us/1000.0;

	if (current_threshold > eInfo)
		return;

	fmt::print(stderr, fmt::emphasis::bold | fmt::fg(fmt::color::gray), "spark: ");
	fmt::print(stderr, fmt::emphasis::bold | fmt::fg(fmt::color::gold), "close: ");
	fmt::print(stderr, fmt::emphasis::underline | fmt::emphasis::bold | fmt::fg(fmt::color::gray), "{}", module);
	fmt::print(stderr, fmt::emphasis::bold | fmt::fg(fmt::color::gray), " ({} ms)\n", ms);
	std::fflush(stderr);
}

} // namespace spark::io
