#pragma once

#include <chrono>
#include <cstdint>
#include <string>

#include <fmt/color.h>
#include <fmt/format.h>

namespace spark::io {

// Message severities, ordered by importance
enum severity : int8_t {
	eNote,
	eInfo,
	eWarning,
	eError,
	eFatal,
	__severity_end
};

extern const char *tbl_severity[__severity_end];

// Messages below the threshold are dropped; fatal messages always print
void set_threshold(severity);
severity threshold();

void print(severity, const std::string &, const std::string &);

void assertion(bool cond, const std::string &, const std::string &);
void assertion(bool cond, const std::string &, const std::string &, const char *const, int);

[[noreturn]] void abort(const std::string &, const std::string &);
[[noreturn]] void abort(const std::string &, const std::string &, const char *const, int);

void error(const std::string &, const std::string &);
void warning(const std::string &, const std::string &);
void info(const std::string &, const std::string &);
void note(const std::string &);

struct stage_bracket {
	std::string module;

	using clock_t = std::chrono::high_resolution_clock;
	using time_t = clock_t::time_point;

	clock_t clk;
	time_t start;

	stage_bracket(const std::string &);

	~stage_bracket();
};

// Helper macros for easier logging
#define MODULE(name) static constexpr const char __module__[] = #name

} // namespace spark::io

#ifdef SPARK_DEBUG

#define SPARK_ASSERT(cond, ...)		spark::io::assertion(cond, __module__, fmt::format(__VA_ARGS__), __FILE__, __LINE__)
#define SPARK_DEBUG_INFO(...)		spark::io::info(__module__, fmt::format(__VA_ARGS__))
#define SPARK_STAGE()			spark::io::stage_bracket __stage(__module__)

#else

#define SPARK_ASSERT(cond, ...)		if (cond && __module__) {}
#define SPARK_DEBUG_INFO(...)
#define SPARK_STAGE()

#endif

#define SPARK_ABORT(...)		spark::io::abort(__module__, fmt::format(__VA_ARGS__), __FILE__, __LINE__)
#define SPARK_ERROR(...)		spark::io::error(__module__, fmt::format(__VA_ARGS__))
#define SPARK_WARNING(...)		spark::io::warning(__module__, fmt::format(__VA_ARGS__))
#define SPARK_INFO(...)			spark::io::info(__module__, fmt::format(__VA_ARGS__))
#define SPARK_NOTE(...)			spark::io::note(fmt::format(__VA_ARGS__))
