#include <algorithm>
#include <span>
#include <utility>
#include <vector>

#include <cstddef>
#include <cstdint>
#include <cstring>

#include <hobeta/io/memory.hpp>

hobeta::MemorySource::MemorySource(std::vector<std::byte> data) noexcept : data_(std::move(data)) {}

std::size_t hobeta::MemorySource::read(std::span<std::byte> buffer) {
    if (position_ >= data_.size())
        return 0;

    const std::size_t available = data_.size() - static_cast<std::size_t>(position_);
    const std::size_t take = std::min(available, buffer.size());

    std::memcpy(buffer.data(), data_.data() + position_, take);
    position_ += take;

    return take;
}

// Seeking past the end is allowed and behaves like end of stream.
void hobeta::MemorySource::seek(std::uint64_t offset) {
    position_ = offset;
}

std::uint64_t hobeta::MemorySource::tell() const {
    return position_;
}

std::uint64_t hobeta::MemorySource::total_size() const {
    return data_.size();
}

void hobeta::MemorySink::write(std::span<const std::byte> data) {
    data_.insert(data_.end(), data.begin(), data.end());
    ++write_count_;
}

const std::vector<std::byte>& hobeta::MemorySink::data() const noexcept {
    return data_;
}

std::size_t hobeta::MemorySink::write_count() const noexcept {
    return write_count_;
}
