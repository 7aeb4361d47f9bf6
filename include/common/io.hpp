#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace spark::io {

std::vector <std::string> split_lines(const std::string &);

// Boxed title followed by numbered source lines
void display_lines(const std::string &title, const std::string &content);

void write_lines(const std::filesystem::path &path, const std::string &content);

} // namespace spark::io
