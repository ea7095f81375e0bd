#ifndef DCARCHIVE_UTILS_FILESYSTEM_H
#define DCARCHIVE_UTILS_FILESYSTEM_H

#include <filesystem>

namespace fs = std::filesystem;

#endif  // DCARCHIVE_UTILS_FILESYSTEM_H
