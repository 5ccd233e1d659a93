#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace erlflow {

std::string EscapeJsonString(std::string_view value);
std::string JsonString(std::string_view value);
std::string JsonStringArray(const std::vector<std::string> &values);

} // namespace erlflow
