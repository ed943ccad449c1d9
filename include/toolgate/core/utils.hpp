#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace toolgate::utils {

auto generate_id(std::size_t length = 16) -> std::string;
auto generate_uuid() -> std::string;
auto timestamp_iso() -> std::string;
auto trim(std::string_view s) -> std::string;
auto split(std::string_view s, char delim) -> std::vector<std::string>;
auto sha256(std::string_view data) -> std::string;

} // namespace toolgate::utils
