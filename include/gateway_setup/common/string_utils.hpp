#pragma once

#include <string>
#include <vector>

namespace gateway_setup {
namespace common {

std::string trim(const std::string& s);
std::string toLower(const std::string& s);
std::vector<std::string> split(const std::string& s, char delimiter);
std::string join(const std::vector<std::string>& parts, const std::string& separator);

// Number of Unicode code points in a UTF-8 string.
size_t utf8Length(const std::string& s);

}}
