#include "csv_log.hpp"
#include "errors.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <ctime>

// ---------------- formatting ----------------

std::string format_timestamp(std::chrono::system_clock::time_point t)
{
    using namespace std::chrono;

    const auto us = duration_cast<microseconds>(t.time_since_epoch()).count();
    std::time_t secs = static_cast<std::time_t>(us / 1000000);
    long frac = static_cast<long>(us % 1000000);
    if (frac < 0) {
        frac += 1000000;
        secs -= 1;
    }

    std::tm tm_buf{};
    localtime_r(&secs, &tm_buf);

    char date[32];
    std::strftime(date, sizeof(date), "%Y-%m-%d %H:%M:%S", &tm_buf);

    char out[48];
    std::snprintf(out, sizeof(out), "%s.%06ld", date, frac);
    return out;
}

std::string format_value(double v)
{
    char buf[32];
    for (int digits = 15; digits < 17; ++digits)
    {
        std::snprintf(buf, sizeof(buf), "%.*g", digits, v);
        if (std::strtod(buf, nullptr) == v)
            return buf;
    }
    std::snprintf(buf, sizeof(buf), "%.17g", v);
    return buf;
}

// ---------------- CsvLog ----------------

CsvLog::CsvLog(std::string path, std::vector<ChannelConfig> chans)
    : file_path(std::move(path)), channels(std::move(chans))
{
}

CsvLog::~CsvLog()
{
    close();
}

void CsvLog::put(const std::string& line)
{
    if (std::fputs(line.c_str(), fp) == EOF || std::fflush(fp) != 0)
        throw LogWriteError("write to '" + file_path + "' failed: " +
                            std::strerror(errno));
}

void CsvLog::open()
{
    std::lock_guard<std::mutex> lk(m);

    if (fp)
        return;

    fp = std::fopen(file_path.c_str(), "w");
    if (!fp)
        throw LogWriteError("cannot open '" + file_path + "': " +
                            std::strerror(errno));

    std::string group = "Time";
    std::string sub;
    for (const auto& ch : channels)
    {
        group += ",Channel " + std::to_string(ch.id) + ",";
        for (size_t s = 0; s < SENSORS_PER_CHANNEL; ++s)
            sub += ",Sensor " + std::to_string(s + 1);
    }

    put(group + "\n");
    put(sub + "\n");
    rows = 0;
}

void CsvLog::write_row(
    std::chrono::system_clock::time_point when,
    const std::vector<double>& values)
{
    std::string line = format_timestamp(when);
    for (double v : values)
    {
        line += ',';
        line += format_value(v);
    }
    line += '\n';

    std::lock_guard<std::mutex> lk(m);

    if (!fp)
        throw LogWriteError("'" + file_path + "' is not open");

    put(line);
    ++rows;
}

void CsvLog::close()
{
    std::lock_guard<std::mutex> lk(m);

    if (!fp)
        return;

    if (std::fclose(fp) != 0)
        std::fprintf(stderr, "[CSV] closing '%s' failed: %s\n",
                     file_path.c_str(), std::strerror(errno));
    fp = nullptr;
}

bool CsvLog::is_open() const
{
    std::lock_guard<std::mutex> lk(m);
    return fp != nullptr;
}

size_t CsvLog::rows_written() const
{
    std::lock_guard<std::mutex> lk(m);
    return rows;
}
