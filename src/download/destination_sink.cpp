#include <authfetch/download/destination_sink.h>

#include <spdlog/spdlog.h>

#include <string>
#include <system_error>

namespace authfetch::download {

FileSink::FileSink(std::filesystem::path path) : path_(std::move(path)) {}

FileSink::~FileSink() {
    if (out_.is_open()) {
        out_.close();
    }
}

Result<void> FileSink::open(std::ios::openmode mode) {
    if (out_.is_open())
        out_.close();
    std::error_code ec;
    if (path_.has_parent_path())
        std::filesystem::create_directories(path_.parent_path(), ec);
    out_.clear();
    out_.open(path_, std::ios::binary | std::ios::out | mode);
    if (!out_.is_open()) {
        return Error{ErrorCode::WriteError, "failed to open " + path_.string() + " for writing"};
    }
    return {};
}

Result<void> FileSink::write(ByteSpan data) {
    if (!out_.is_open()) {
        auto r = open(written_ == 0 ? std::ios::trunc : std::ios::app);
        if (!r)
            return r;
    }
    out_.write(reinterpret_cast<const char*>(data.data()),
               static_cast<std::streamsize>(data.size()));
    if (!out_) {
        return Error{ErrorCode::WriteError, "failed to write to " + path_.string()};
    }
    written_ += data.size();
    return {};
}

Result<void> FileSink::rewind(std::uint64_t mark) {
    if (mark > written_) {
        return Error{ErrorCode::InvalidArgument, "cannot rewind " + path_.string() + " to " +
                                                     std::to_string(mark) + " of " +
                                                     std::to_string(written_) + " bytes"};
    }
    spdlog::debug("discarding {} partial bytes in {}", written_ - mark, path_.string());
    if (mark == 0) {
        written_ = 0;
        return open(std::ios::trunc);
    }
    if (auto closed = close(); !closed)
        return closed;
    std::error_code ec;
    std::filesystem::resize_file(path_, mark, ec);
    if (ec) {
        return Error{ErrorCode::WriteError,
                     "failed to truncate " + path_.string() + ": " + ec.message()};
    }
    written_ = mark;
    return open(std::ios::app);
}

Result<void> FileSink::close() {
    if (!out_.is_open())
        return {};
    out_.flush();
    const bool ok = static_cast<bool>(out_);
    out_.close();
    if (!ok)
        return Error{ErrorCode::WriteError, "failed to flush " + path_.string()};
    return {};
}

Result<void> MemorySink::write(ByteSpan data) {
    data_.insert(data_.end(), data.begin(), data.end());
    return {};
}

Result<void> MemorySink::rewind(std::uint64_t mark) {
    if (mark > data_.size())
        return Error{ErrorCode::InvalidArgument, "rewind mark is past the end of the buffer"};
    data_.resize(static_cast<std::size_t>(mark));
    return {};
}

std::string MemorySink::str() const {
    return std::string(reinterpret_cast<const char*>(data_.data()), data_.size());
}

} // namespace authfetch::download
