#pragma once
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace histeq {

inline std::uintmax_t file_size_bytes(const std::filesystem::path& p) {
    std::error_code ec;
    auto sz = std::filesystem::file_size(p, ec);
    return ec ? 0u : static_cast<std::uintmax_t>(sz);
}

// Reads a file in fixed-size chunks; the view returned by next() stays valid
// until the following call.
class chunk_reader {
public:
    chunk_reader(const std::filesystem::path& p, std::size_t chunk_bytes)
        : path_(p)
    {
        if (chunk_bytes == 0) throw std::invalid_argument("chunk_bytes == 0");
        buf_.resize(chunk_bytes);
        in_.open(path_, std::ios::binary);
        if (!in_) throw std::runtime_error("Failed to open file: " + path_.string());
    }

    // Empty view = EOF
    std::string_view next() {
        if (!in_) return {};
        in_.read(buf_.data(), static_cast<std::streamsize>(buf_.size()));
        const auto got = static_cast<std::size_t>(in_.gcount());
        if (in_.bad()) throw std::runtime_error("Read failed: " + path_.string());
        return std::string_view(buf_.data(), got);
    }

private:
    std::filesystem::path path_;
    std::ifstream in_;
    std::vector<char> buf_;
};

}
