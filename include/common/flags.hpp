#pragma once

#include <type_traits>

// Bitwise operations for flag-like enumeration classes
#define DEFINE_FLAG_OPERATORS(T)						\
	constexpr T operator|(T A, T B)						\
	{									\
		using base = std::underlying_type_t <T>;			\
		return T(base(A) | base(B));					\
	}									\
	constexpr T operator-(T A, T B)						\
	{									\
		using base = std::underlying_type_t <T>;			\
		return T(base(A) & ~base(B));					\
	}									\
	constexpr bool has(T A, T B)						\
	{									\
		using base = std::underlying_type_t <T>;			\
		return ((base(A) & base(B)) == base(B));			\
	}
