#pragma once

#include <filesystem>
#include <string>
#include <string_view>

namespace pw::util {

std::string readFileToString(const std::filesystem::path& path);

// Writes to "<path>.tmp" and renames over the target so readers never see a half-written file.
void writeFileAtomic(const std::filesystem::path& path, std::string_view content);

void ensureParentDir(const std::filesystem::path& path);

// Drops malformed UTF-8 sequences instead of failing.
std::string sanitizeUtf8(std::string_view in);

}
