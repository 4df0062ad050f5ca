#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace tilewrap {

// The built-in cell labels: 100 emoji.
const std::vector<std::string>& default_labels();

// Read labels from a UTF-8 text file, one per line. Blank lines are skipped
// and a trailing '\r' is stripped. Throws std::runtime_error if the file
// cannot be read.
std::vector<std::string> load_labels(const std::filesystem::path& path);

} // namespace tilewrap
