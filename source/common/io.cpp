#include <cstdio>

#include <fmt/format.h>

#include "common/io.hpp"
#include "common/logging.hpp"

namespace spark::io {

MODULE(io);

static std::string repeat(const std::string &a, size_t b)
{
	std::string output;
	while (b--)
		output += a;

	return output;
}

std::vector <std::string> split_lines(const std::string &contents)
{
	std::vector <std::string> lines;
	lines.emplace_back("");

	for (auto c : contents) {
		if (c == '\n')
			lines.emplace_back("");
		else
			lines.back() += c;
	}

	if (lines.back().empty())
		lines.pop_back();

	return lines;
}

void display_lines(const std::string &title, const std::string &contents)
{
	auto lines = split_lines(contents);

	size_t size = std::max <size_t> (50, title.size() + 4);

	std::string s1 = "┌" + repeat("─", size - 2) + "┐";
	std::string s2 = "└" + repeat("─", size - 2) + "┘";
	std::string s3 = std::string((size - 2 - title.size()) / 2, ' ');
	std::string s4 = std::string((size - 2 - title.size()) - s3.size(), ' ');

	fmt::print("{}\n", s1);
	fmt::print("{}{}{}{}{}\n", "│", s3, title, s4, "│");
	fmt::print("{}\n", s2);

	for (size_t i = 0; i < lines.size(); i++)
		fmt::print("{:4d}: {}\n", i + 1, lines[i]);
}

void write_lines(const std::filesystem::path &path, const std::string &contents)
{
	if (path.has_parent_path())
		std::filesystem::create_directories(path.parent_path());

	FILE *fout = fopen(path.c_str(), "w");
	if (!fout) {
		SPARK_ERROR("failed to open file '{}' for writing", path.string());
		return;
	}

	for (auto &line : split_lines(contents))
		fmt::print(fout, "{}\n", line);

	fclose(fout);
}

} // namespace spark::io
