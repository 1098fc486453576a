#include "dropshare/client/chunk_source.hpp"

#include <algorithm>
#include <cstddef>
#include <stdexcept>

namespace dropshare::client {

std::vector<std::uint8_t> MemorySource::read(std::uint64_t offset, std::size_t length) {
    if (offset >= bytes_.size()) return {};
    auto end = std::min<std::uint64_t>(bytes_.size(), offset + length);
    return std::vector<std::uint8_t>(bytes_.begin() + static_cast<std::ptrdiff_t>(offset),
                                     bytes_.begin() + static_cast<std::ptrdiff_t>(end));
}

FileSource::FileSource(const std::string& path) : path_(path), in_(path, std::ios::binary) {
    if (!in_) throw std::runtime_error("cannot open " + path);
    in_.seekg(0, std::ios::end);
    auto end = in_.tellg();
    if (end < 0) throw std::runtime_error("cannot determine size of " + path);
    size_ = static_cast<std::uint64_t>(end);
}

std::vector<std::uint8_t> FileSource::read(std::uint64_t offset, std::size_t length) {
    if (offset >= size_) return {};
    auto n = static_cast<std::size_t>(std::min<std::uint64_t>(length, size_ - offset));
    std::vector<std::uint8_t> out(n);
    in_.clear();
    in_.seekg(static_cast<std::streamoff>(offset));
    in_.read(reinterpret_cast<char*>(out.data()), static_cast<std::streamsize>(n));
    if (in_.gcount() != static_cast<std::streamsize>(n))
        throw std::runtime_error("short read from " + path_);
    return out;
}

} // namespace dropshare::client
