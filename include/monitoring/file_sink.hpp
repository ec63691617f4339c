#pragma once

#include "monitoring/event_sink.hpp"
#include <cstdint>
#include <fstream>
#include <string>

namespace ztgate {

/**
 * @brief Append-only JSONL file sink
 *
 * Every write is flushed before returning so a successful write() means the
 * line reached the OS. The file is never rotated: metrics recovery replays it
 * from the first line. Only bytes past the last complete line are ever cut:
 * a failed write may leave part of a line behind, so the next write truncates
 * back to the end of the last successful one before reopening. Opening an
 * existing log likewise drops a torn final line left by a crash.
 */
class FileSink : public IEventSink {
public:
    explicit FileSink(std::string output_file);
    ~FileSink() override;

    [[nodiscard]] bool write(std::string_view json_line) override;
    void flush() override;
    void shutdown() override;
    [[nodiscard]] std::string name() const override;

    [[nodiscard]] const std::string& path() const { return output_file_; }

    /// Bytes in the file up to the end of the last complete line
    [[nodiscard]] uintmax_t committed_size() const { return committed_size_; }

private:
    bool reopen();
    bool truncate_to_committed();

    std::string output_file_;
    std::ofstream file_stream_;
    uintmax_t committed_size_ = 0;
    bool needs_repair_ = false;
};

} // namespace ztgate
