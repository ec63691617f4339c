#include "monitoring/file_sink.hpp"
#include "core/utils.hpp"
#include <filesystem>
#include <format>
#include <stdexcept>

namespace ztgate {

namespace {

// Offset just past the last '\n' in the file, 0 if there is none.
// An unreadable file reports size so that nothing is cut.
uintmax_t last_line_end(const std::string& path, uintmax_t size) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) return size;

    constexpr uintmax_t kChunk = 4096;
    std::string buffer;
    uintmax_t end = size;
    while (end > 0) {
        const uintmax_t begin = end > kChunk ? end - kChunk : 0;
        buffer.resize(static_cast<size_t>(end - begin));
        in.seekg(static_cast<std::streamoff>(begin));
        in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        if (!in) return size;
        const auto pos = buffer.rfind('\n');
        if (pos != std::string::npos) {
            return begin + pos + 1;
        }
        end = begin;
    }
    return 0;
}

} // anonymous namespace

FileSink::FileSink(std::string output_file)
    : output_file_(std::move(output_file)) {
    const auto parent = std::filesystem::path(output_file_).parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
    }

    std::error_code ec;
    const uintmax_t size = std::filesystem::file_size(output_file_, ec);
    if (!ec && size > 0) {
        committed_size_ = last_line_end(output_file_, size);
        if (committed_size_ != size) {
            utils::log::warn(std::format("Event log {} ends with a torn line ({} bytes), truncating",
                                         output_file_, size - committed_size_));
            if (!truncate_to_committed()) {
                throw std::runtime_error("Failed to repair event log: " + output_file_);
            }
        }
    }

    file_stream_.open(output_file_, std::ios::app | std::ios::binary);
    if (!file_stream_.is_open()) {
        throw std::runtime_error("Failed to open event log: " + output_file_);
    }
}

FileSink::~FileSink() {
    shutdown();
}

bool FileSink::write(std::string_view json_line) {
    if (needs_repair_ || !file_stream_.is_open() || !file_stream_.good()) {
        if (!reopen()) return false;
    }
    file_stream_.write(json_line.data(), static_cast<std::streamsize>(json_line.size()));
    file_stream_.flush();
    if (!file_stream_.good()) {
        // Part of the line may be on disk
        needs_repair_ = true;
        return false;
    }
    committed_size_ += json_line.size();
    return true;
}

void FileSink::flush() {
    file_stream_.flush();
}

void FileSink::shutdown() {
    if (file_stream_.is_open()) {
        file_stream_.flush();
        file_stream_.close();
    }
}

std::string FileSink::name() const {
    return "file:" + output_file_;
}

bool FileSink::truncate_to_committed() {
    std::error_code ec;
    std::filesystem::resize_file(output_file_, committed_size_, ec);
    if (ec) {
        utils::log::error(std::format("Event log {} could not be truncated to {} bytes: {}",
                                      output_file_, committed_size_, ec.message()));
        return false;
    }
    return true;
}

bool FileSink::reopen() {
    if (file_stream_.is_open()) {
        file_stream_.close();
    }
    file_stream_.clear();
    if (needs_repair_) {
        if (!truncate_to_committed()) return false;
        needs_repair_ = false;
    }
    file_stream_.open(output_file_, std::ios::app | std::ios::binary);
    if (!file_stream_.is_open()) {
        utils::log::error(std::format("Event log {} could not be reopened", output_file_));
        return false;
    }
    return true;
}

} // namespace ztgate
