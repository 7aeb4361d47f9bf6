#pragma once

#include <gtest/gtest.h>

#include <map>
#include <string>

#include "spark/transpiler.hpp"

// Source comparison utilities
inline std::string trim_shader_source(const std::string &A)
{
	static constexpr const char ws[] = " \t\n\r\f\v";
	std::string s = A;
	s.erase(s.find_last_not_of(ws) + 1);
	s.erase(0, s.find_first_not_of(ws));
	return s;
}

inline void check_shader_sources(const std::string &A, const std::string &B)
{
	auto tA = trim_shader_source(A);
	auto tB = trim_shader_source(B);
	ASSERT_EQ(tA, tB);
}

// Transpiler returning canned results, keyed by host function name
struct CountingTranspiler : spark::Transpiler {
	std::map <std::string, spark::Transpilation> results;
	int calls = 0;

	spark::Transpilation transpile(const spark::HostFunction &function) override {
		calls++;
		return results.at(function.name);
	}
};
