#pragma once
#include <string>
#include <vector>

namespace pdf {

// *.pdf files directly under dir, sorted by path. Throws std::runtime_error
// if dir does not exist.
std::vector<std::string> list_pdfs(const std::string& dir);

}  // namespace pdf
