#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace vqhuff {

std::vector<uint8_t> read_all(const std::string& path);
void write_all(const std::string& path, const std::vector<uint8_t>& bytes);

} // namespace vqhuff
