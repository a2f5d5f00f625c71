#pragma once
#include <chrono>
#include <cstdio>
#include <mutex>
#include <string>
#include <vector>

#include "config.hpp"

// --------------------------------------------------
// Row sink seen by the sampler
// --------------------------------------------------

struct RowSink {
    virtual void write_row(
        std::chrono::system_clock::time_point when,
        const std::vector<double>& values) = 0;

    virtual ~RowSink() = default;
};

// --------------------------------------------------
// CSV file: truncated on open, header rows, then appended
// --------------------------------------------------

class CsvLog : public RowSink
{
public:
    CsvLog(std::string path, std::vector<ChannelConfig> channels);
    ~CsvLog() override;

    CsvLog(const CsvLog&) = delete;
    CsvLog& operator=(const CsvLog&) = delete;

    // Creates/truncates the file and writes both header rows.
    // Throws LogWriteError.
    void open();

    // Appends and flushes one row. Throws LogWriteError.
    void write_row(
        std::chrono::system_clock::time_point when,
        const std::vector<double>& values) override;

    // Safe to call more than once.
    void close();

    bool is_open() const;
    size_t rows_written() const;
    const std::string& path() const { return file_path; }

private:
    void put(const std::string& line);

    std::string file_path;
    std::vector<ChannelConfig> channels;

    mutable std::mutex m;
    std::FILE* fp = nullptr;
    size_t rows = 0;
};

// "YYYY-MM-DD HH:MM:SS.ffffff", local time.
std::string format_timestamp(std::chrono::system_clock::time_point t);

// Shortest decimal text that parses back to the same double.
std::string format_value(double v);
