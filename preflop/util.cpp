#include <cctype>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <preflop/util.hpp>

namespace preflop {

bool create_dir(const std::filesystem::path& path) {
  if(path.empty()) return true;
  try {
    if(std::filesystem::exists(path)) {
      return true;
    }
    return std::filesystem::create_directories(path);
  }
  catch(const std::filesystem::filesystem_error& e) {
    std::cerr << "Error creating directory: " << e.what() << std::endl;
    return false;
  }
}

void write_to_file(const std::filesystem::path& file_path, const std::string& content, const bool append) {
  std::ofstream out_file(file_path, std::ios::out | (append ? std::ios::app : std::ios::trunc));
  if(!out_file.is_open()) throw std::runtime_error("Failed to open or create file: " + file_path.string());
  out_file << content;
}

std::string date_time_str(const std::string& format) {
  std::time_t t = std::time(nullptr);
  std::tm tm;
  localtime_r(&t, &tm);
  std::ostringstream oss;
  oss << std::put_time(&tm, format.c_str());
  return oss.str();
}

std::string join_strs(const std::vector<std::string>& strs, const std::string& sep) {
  std::ostringstream oss;
  for(int i = 0; i < strs.size(); ++i) oss << strs[i] << (i == strs.size() - 1 ? "" : sep);
  return oss.str();
}

std::string to_lower(std::string str) {
  std::ranges::transform(str, str.begin(), [](const unsigned char c) { return std::tolower(c); });
  return str;
}

std::string round_to_str(const double x, const int precision) {
  std::ostringstream oss;
  oss << std::fixed << std::setprecision(precision) << x;
  return oss.str();
}

}
