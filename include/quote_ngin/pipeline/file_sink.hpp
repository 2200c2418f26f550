// include/quote_ngin/pipeline/file_sink.hpp
#pragma once

#include <cstddef>
#include <fstream>
#include <string>
#include "quote_ngin/actor/actor.hpp"
#include "quote_ngin/pipeline/messages.hpp"

namespace quote_ngin {

/**
 * @brief Appends every indicator record to a fresh CSV file
 *
 * The file is named after the start time, "<unix seconds>.csv", with a "_<k>"
 * suffix when that name is taken. Each row is flushed as soon as it is
 * written.
 */
class FileSink : public Actor {
public:
    explicit FileSink(std::string output_directory);

    /**
     * @brief Create the file and write the header
     * @return FILE_IO_ERROR when the directory or file cannot be created
     */
    Result<void> on_start(ActorContext& ctx) override;

    /**
     * @brief Flush and close the file
     */
    void on_stop() override;

    /**
     * @brief Append one row; a failed write is logged and not retried
     */
    void write(const PerformanceIndicators& indicators);

    const std::string& path() const {
        return path_;
    }

    size_t rows_written() const {
        return rows_written_;
    }

private:
    // Creates the first free <seconds>[_k].csv and returns its path
    Result<std::string> claim_free_path() const;

    std::string output_directory_;
    std::string path_;
    std::ofstream file_;
    size_t rows_written_{0};
};

}  // namespace quote_ngin
