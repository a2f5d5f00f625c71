#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

// --------------------------------------------------
// Runtime configuration
// --------------------------------------------------

constexpr uint16_t DEFAULT_PORT = 4578;
constexpr double   DEFAULT_SAMPLE_RATE_HZ = 10.0;
constexpr size_t   SENSORS_PER_CHANNEL = 2;

// Sampling period between 1 ms and 24 h.
constexpr double   MAX_SAMPLE_RATE_HZ = 1000.0;
constexpr double   MIN_SAMPLE_RATE_HZ = 1.0 / 86400.0;

struct ChannelConfig
{
    uint8_t id = 0;
    uint8_t sensors[SENSORS_PER_CHANNEL] = {0, 1};
};

enum class TransportKind { Tcp, Sim };

struct SimConfig
{
    double   record_rate_hz = 1000.0;
    uint64_t max_records = 0; // 0 = unlimited
};

struct Config
{
    TransportKind transport = TransportKind::Tcp;
    std::string   bind_address = "0.0.0.0";
    uint16_t      port = DEFAULT_PORT;
    double        sample_rate_hz = DEFAULT_SAMPLE_RATE_HZ;
    std::string   log_path = "Data.csv";
    bool          echo_readings = false;

    std::vector<ChannelConfig> channels = default_channels();

    SimConfig sim;

    static std::vector<ChannelConfig> default_channels();

    size_t slot_count() const { return channels.size() * SENSORS_PER_CHANNEL; }
};

// Merges a YAML document into cfg. Keys that are absent keep their value.
// Throws ConfigError on unreadable files or bad values.
void load_config_file(const std::string& path, Config& cfg);
void load_config_string(const std::string& yaml, Config& cfg);

// Throws ConfigError describing the first violated constraint.
void validate_config(const Config& cfg);

// Parses command-line flags on top of defaults and an optional --config
// file. Returns false when --help was given (usage already printed).
bool parse_args(int argc, char** argv, Config& cfg);

void print_usage(const char* prog);

// --------------------------------------------------
// Routing table: (channel, sensor) -> column index
// --------------------------------------------------

class SlotTable
{
public:
    static constexpr int NO_SLOT = -1;

    explicit SlotTable(const std::vector<ChannelConfig>& channels);

    int find(uint8_t channel, uint8_t sensor) const;

    size_t size() const { return keys.size(); }

private:
    struct Key { uint8_t channel; uint8_t sensor; };
    std::vector<Key> keys;
};
