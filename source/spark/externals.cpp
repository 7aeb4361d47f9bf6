#include <cctype>

#include "spark/context.hpp"
#include "spark/externals.hpp"

namespace spark {

[[gnu::always_inline]]
inline bool is_legal_first_identifier_char(char c)
{
	return std::isalpha(static_cast <unsigned char> (c)) || c == '_';
}

[[gnu::always_inline]]
inline bool is_legal_identifier_char(char c)
{
	return std::isalnum(static_cast <unsigned char> (c)) || c == '_';
}

void apply_externals(ExternalMap &externals, const ExternalMap &additions)
{
	for (auto &[name, value] : additions) {
		auto ref = std::get_if <resolvable_ref> (&value);
		if (ref && !*ref)
			continue;

		externals.insert_or_assign(name, value);
	}
}

std::string replace_externals(ResolutionContext &ctx, const ExternalMap &externals, const std::string &code)
{
	// Resolved lazily, in order of first appearance in the code
	std::map <std::string, std::string> resolved;

	std::string result;
	result.reserve(code.size());

	size_t i = 0;
	while (i < code.size()) {
		char c = code[i];

		// Numeric literals may contain letters (1e5, 2u)
		if (std::isdigit(static_cast <unsigned char> (c))) {
			while (i < code.size() && (is_legal_identifier_char(code[i]) || code[i] == '.'))
				result += code[i++];

			continue;
		}

		if (!is_legal_first_identifier_char(c)) {
			result += code[i++];
			continue;
		}

		size_t start = i;
		while (i < code.size() && is_legal_identifier_char(code[i]))
			i++;

		std::string token = code.substr(start, i - start);

		size_t before = result.find_last_not_of(" \t\n\r");
		bool member = (before != std::string::npos && result[before] == '.');

		auto it = externals.find(token);
		if (member || it == externals.end()) {
			result += token;
			continue;
		}

		auto cached = resolved.find(token);
		if (cached == resolved.end())
			cached = resolved.emplace(token, ctx.resolve(it->second)).first;

		std::string text = cached->second;

		// Member accesses may stand for separate names
		if (i + 1 < code.size() && code[i] == '.' && is_legal_first_identifier_char(code[i + 1])) {
			size_t field = ++i;
			while (i < code.size() && is_legal_identifier_char(code[i]))
				i++;

			text = ctx.member(text, code.substr(field, i - field));
		}

		result += text;
	}

	return result;
}

} // namespace spark
