#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace pw::tail {

inline constexpr std::size_t DEFAULT_TAIL_CHUNK = 4096;

// Last `maxLines` lines of `path`, oldest first. Reads backward in `chunkSize` blocks so
// only the tail of a large log is touched. A missing file is an empty result.
std::vector<std::string> readTail(const std::filesystem::path& path, long maxLines,
                                  std::size_t chunkSize = DEFAULT_TAIL_CHUNK);

}
