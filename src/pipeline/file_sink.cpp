// src/pipeline/file_sink.cpp
#include "quote_ngin/pipeline/file_sink.hpp"
#include <fcntl.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include "quote_ngin/core/logger.hpp"
#include "quote_ngin/core/time_utils.hpp"

namespace quote_ngin {

FileSink::FileSink(std::string output_directory)
    : output_directory_(output_directory.empty() ? "." : std::move(output_directory)) {}

Result<std::string> FileSink::claim_free_path() const {
    std::string stem =
        std::to_string(core::to_unix_seconds(std::chrono::system_clock::now()));

    for (int suffix = 0;; ++suffix) {
        std::string name = suffix == 0 ? stem + ".csv"
                                       : stem + "_" + std::to_string(suffix) + ".csv";
        std::string candidate = (std::filesystem::path(output_directory_) / name).string();

        // Exclusive create: the existence check and the creation are one step
        int fd = ::open(candidate.c_str(), O_WRONLY | O_CREAT | O_EXCL, 0644);
        if (fd >= 0) {
            ::close(fd);
            return candidate;
        }
        if (errno != EEXIST) {
            return make_error<std::string>(ErrorCode::FILE_IO_ERROR,
                                           "Cannot create " + candidate + ": " +
                                               std::strerror(errno),
                                           "FileSink");
        }
    }
}

Result<void> FileSink::on_start(ActorContext& ctx) {
    std::error_code ec;
    std::filesystem::create_directories(output_directory_, ec);
    if (ec) {
        return make_error<void>(ErrorCode::FILE_IO_ERROR,
                                "Cannot create " + output_directory_ + ": " + ec.message(),
                                "FileSink");
    }

    auto path = claim_free_path();
    if (path.is_error()) {
        return forward_error<void>(path);
    }
    path_ = path.value();

    file_.open(path_, std::ios::out | std::ios::trunc);
    if (!file_.is_open()) {
        return make_error<void>(ErrorCode::FILE_IO_ERROR, "Cannot open " + path_ + " for writing",
                                "FileSink");
    }

    file_ << CSV_HEADER << "\n";
    file_.flush();
    if (!file_) {
        return make_error<void>(ErrorCode::FILE_IO_ERROR, "Cannot write header to " + path_,
                                "FileSink");
    }

    INFO("Writing indicators to " << path_);
    return ctx.subscribe<PerformanceIndicators>(
        [this](const PerformanceIndicators& indicators) { write(indicators); });
}

void FileSink::write(const PerformanceIndicators& indicators) {
    file_ << format_csv_row(indicators) << "\n";
    file_.flush();

    if (!file_) {
        ERROR("Failed to write " << indicators.symbol << " to " << path_);
        file_.clear();
        return;
    }
    ++rows_written_;
}

void FileSink::on_stop() {
    if (file_.is_open()) {
        file_.flush();
        file_.close();
        INFO("Closed " << path_ << " after " << rows_written_ << " rows");
    }
}

}  // namespace quote_ngin
