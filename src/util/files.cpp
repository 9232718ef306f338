#include "util/files.hpp"

#include <fstream>
#include <stdexcept>
#include <system_error>

namespace fs = std::filesystem;

std::string pw::util::readFileToString(const fs::path& path) {
    std::ifstream in(path, std::ios::binary | std::ios::ate);
    if (!in) throw std::runtime_error("Failed to open file: " + path.string());

    const std::streamsize size = in.tellg();
    in.seekg(0, std::ios::beg);

    std::string buffer(static_cast<size_t>(size), '\0');
    if (size > 0 && !in.read(buffer.data(), size))
        throw std::runtime_error("Failed to read file: " + path.string());

    return buffer;
}

void pw::util::ensureParentDir(const fs::path& path) {
    const auto parent = path.parent_path();
    if (parent.empty()) return;

    std::error_code ec;
    fs::create_directories(parent, ec);
    if (ec) throw std::runtime_error("Failed to create directory " + parent.string() + ": " + ec.message());
}

void pw::util::writeFileAtomic(const fs::path& path, const std::string_view content) {
    ensureParentDir(path);

    auto tmp = path;
    tmp += ".tmp";

    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out) throw std::runtime_error("Failed to open for writing: " + tmp.string());
        out.write(content.data(), static_cast<std::streamsize>(content.size()));
        out.flush();
        if (!out) throw std::runtime_error("Failed to write file: " + tmp.string());
    }

    std::error_code ec;
    fs::rename(tmp, path, ec);
    if (ec) {
        fs::remove(tmp, ec);
        throw std::runtime_error("Failed to replace " + path.string());
    }
}

std::string pw::util::sanitizeUtf8(const std::string_view in) {
    std::string out;
    out.reserve(in.size());

    size_t i = 0;
    while (i < in.size()) {
        const auto c = static_cast<unsigned char>(in[i]);

        size_t len = 0;
        if (c < 0x80) len = 1;
        else if ((c & 0xE0) == 0xC0 && c >= 0xC2) len = 2;
        else if ((c & 0xF0) == 0xE0) len = 3;
        else if ((c & 0xF8) == 0xF0 && c <= 0xF4) len = 4;

        if (len == 0 || i + len > in.size()) {
            ++i;
            continue;
        }

        bool valid = true;
        for (size_t k = 1; k < len; ++k) {
            if ((static_cast<unsigned char>(in[i + k]) & 0xC0) != 0x80) {
                valid = false;
                break;
            }
        }

        if (valid && len == 3) {
            const auto c1 = static_cast<unsigned char>(in[i + 1]);
            if ((c == 0xE0 && c1 < 0xA0) || (c == 0xED && c1 > 0x9F)) valid = false;
        } else if (valid && len == 4) {
            const auto c1 = static_cast<unsigned char>(in[i + 1]);
            if ((c == 0xF0 && c1 < 0x90) || (c == 0xF4 && c1 > 0x8F)) valid = false;
        }

        if (!valid) {
            ++i;
            continue;
        }

        out.append(in.substr(i, len));
        i += len;
    }

    return out;
}
