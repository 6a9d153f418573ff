#include "negotiate/json/byte_buffer.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>

namespace negotiate {

namespace {

constexpr std::size_t kMinimumGrowth = 256;

}  // namespace

ArrayByteBuffer::ArrayByteBuffer(std::size_t initial_capacity)
    : storage_(initial_capacity)
{}

std::span<std::uint8_t> ArrayByteBuffer::get_span(std::size_t size_hint) {
    const std::size_t wanted = std::max<std::size_t>(size_hint, 1);
    const std::size_t available = storage_.size() - written_;

    if (available < wanted) {
        // Double, but never by less than what was asked for
        const std::size_t growth = std::max({wanted - available, storage_.size(), kMinimumGrowth});
        storage_.resize(storage_.size() + growth);
    }

    return {storage_.data() + written_, storage_.size() - written_};
}

void ArrayByteBuffer::advance(std::size_t count) {
    if (count > storage_.size() - written_) {
        throw std::invalid_argument(
            "ArrayByteBuffer::advance past the end of the writable span (" + std::to_string(count)
            + " > " + std::to_string(storage_.size() - written_) + ")");
    }
    written_ += count;
}

}  // namespace negotiate
