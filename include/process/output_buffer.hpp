//! # Output Buffer
//!
//! Append-only text shared between the stream reader threads of a child
//! process and the controlling thread that renders it.

#ifndef ARGRUN_PROCESS_OUTPUT_BUFFER_HPP
#define ARGRUN_PROCESS_OUTPUT_BUFFER_HPP

#include <mutex>
#include <string>
#include <string_view>

namespace argrun::process {

/// Thread-safe append-only byte buffer. Chunks from one writer keep their
/// order; chunks from different writers interleave in arrival order.
class OutputBuffer {
public:
    void append(std::string_view chunk);

    /// Copy of the whole buffer.
    [[nodiscard]] std::string snapshot() const;

    /// Copy of everything after `offset` (empty if `offset` is past the end).
    [[nodiscard]] std::string snapshot_from(size_t offset) const;

    [[nodiscard]] size_t size() const;

private:
    mutable std::mutex mutex_;
    std::string data_;
};

} // namespace argrun::process

#endif // ARGRUN_PROCESS_OUTPUT_BUFFER_HPP
