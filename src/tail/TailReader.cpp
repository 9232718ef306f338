#include "tail/TailReader.hpp"
#include "util/files.hpp"
#include "log/Registry.hpp"

#include <algorithm>
#include <fstream>
#include <system_error>

namespace pw::tail {

std::vector<std::string> readTail(const std::filesystem::path& path, const long maxLines, std::size_t chunkSize) {
    if (maxLines <= 0) return {};
    if (chunkSize == 0) chunkSize = DEFAULT_TAIL_CHUNK;

    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) return {};

    std::ifstream in(path, std::ios::binary);
    if (!in) {
        log::Registry::tail()->debug("[TailReader] Cannot open {}", path.string());
        return {};
    }

    in.seekg(0, std::ios::end);
    const auto fileSize = static_cast<std::uint64_t>(std::max<std::streamoff>(in.tellg(), 0));

    std::string data;
    std::uint64_t remaining = fileSize;
    std::size_t newlines = 0;

    while (remaining > 0 && newlines <= static_cast<std::size_t>(maxLines)) {
        const auto readSize = static_cast<std::size_t>(std::min<std::uint64_t>(chunkSize, remaining));
        remaining -= readSize;

        std::string chunk(readSize, '\0');
        in.seekg(static_cast<std::streamoff>(remaining));
        if (!in.read(chunk.data(), static_cast<std::streamsize>(readSize))) {
            log::Registry::tail()->debug("[TailReader] Short read on {}", path.string());
            return {};
        }

        newlines += static_cast<std::size_t>(std::count(chunk.begin(), chunk.end(), '\n'));
        data.insert(0, chunk);
    }

    const auto text = util::sanitizeUtf8(data);

    std::vector<std::string> lines;
    std::size_t start = 0;
    while (start < text.size()) {
        auto end = text.find('\n', start);
        if (end == std::string::npos) end = text.size();
        auto line = text.substr(start, end - start);
        if (!line.empty() && line.back() == '\r') line.pop_back();
        lines.push_back(std::move(line));
        start = end + 1;
    }

    if (lines.size() > static_cast<std::size_t>(maxLines))
        lines.erase(lines.begin(), lines.end() - maxLines);

    return lines;
}

}
