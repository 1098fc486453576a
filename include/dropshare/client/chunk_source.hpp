#pragma once
#include <cstddef>
#include <cstdint>
#include <fstream>
#include <string>
#include <utility>
#include <vector>

namespace dropshare::client {

// Random-access byte source the sender slices lazily.
class ChunkSource {
public:
    virtual ~ChunkSource() = default;
    virtual std::uint64_t size() const = 0;
    // Returns at most length bytes starting at offset; fewer at the end of the source.
    virtual std::vector<std::uint8_t> read(std::uint64_t offset, std::size_t length) = 0;
};

class MemorySource : public ChunkSource {
public:
    explicit MemorySource(std::vector<std::uint8_t> bytes) : bytes_(std::move(bytes)) {}
    std::uint64_t size() const override { return bytes_.size(); }
    std::vector<std::uint8_t> read(std::uint64_t offset, std::size_t length) override;

private:
    std::vector<std::uint8_t> bytes_;
};

class FileSource : public ChunkSource {
public:
    // Throws std::runtime_error if the file cannot be opened.
    explicit FileSource(const std::string& path);
    std::uint64_t size() const override { return size_; }
    std::vector<std::uint8_t> read(std::uint64_t offset, std::size_t length) override;

private:
    std::string path_;
    std::ifstream in_;
    std::uint64_t size_ = 0;
};

} // namespace dropshare::client
