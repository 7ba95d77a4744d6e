#include "process/output_buffer.hpp"

namespace argrun::process {

void OutputBuffer::append(std::string_view chunk) {
    std::lock_guard<std::mutex> lock(mutex_);
    data_.append(chunk);
}

std::string OutputBuffer::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return data_;
}

std::string OutputBuffer::snapshot_from(size_t offset) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (offset >= data_.size()) {
        return {};
    }
    return data_.substr(offset);
}

size_t OutputBuffer::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return data_.size();
}

} // namespace argrun::process
