#pragma once

#include <algorithm>
#include <filesystem>
#include <sstream>
#include <string>
#include <vector>

namespace preflop {

bool create_dir(const std::filesystem::path& path);
void write_to_file(const std::filesystem::path& file_path, const std::string& content, bool append = false);
std::string date_time_str(const std::string& format = "%Y-%m-%d_%H-%M-%S");
std::string join_strs(const std::vector<std::string>& strs, const std::string& sep);
std::string to_lower(std::string str);
std::string round_to_str(double x, int precision);

}
