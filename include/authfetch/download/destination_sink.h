#pragma once

#include <authfetch/core/types.h>
#include <authfetch/http/http_types.h>

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>

namespace authfetch::download {

using IDestinationSink = http::IResponseSink;

/**
 * Writes the body to a file, truncating on first open. rewind(mark) truncates the file back
 * to `mark` bytes.
 */
class FileSink final : public IDestinationSink {
public:
    explicit FileSink(std::filesystem::path path);
    ~FileSink() override;

    FileSink(const FileSink&) = delete;
    FileSink& operator=(const FileSink&) = delete;

    Result<void> write(ByteSpan data) override;
    Result<void> rewind(std::uint64_t mark) override;
    [[nodiscard]] std::uint64_t bytesWritten() const override { return written_; }

    // Flushes and closes the file. Further writes reopen it in append mode.
    Result<void> close();

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    Result<void> open(std::ios::openmode mode);

    std::filesystem::path path_;
    std::ofstream out_;
    std::uint64_t written_{0};
};

/**
 * Accumulates the body in memory.
 */
class MemorySink final : public IDestinationSink {
public:
    Result<void> write(ByteSpan data) override;
    Result<void> rewind(std::uint64_t mark) override;
    [[nodiscard]] std::uint64_t bytesWritten() const override { return data_.size(); }

    [[nodiscard]] const ByteVector& data() const noexcept { return data_; }
    [[nodiscard]] std::string str() const;

private:
    ByteVector data_;
};

} // namespace authfetch::download
