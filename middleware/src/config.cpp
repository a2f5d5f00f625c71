#include "config.hpp"
#include "errors.hpp"

#include <yaml-cpp/yaml.h>

#include <cerrno>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <cstring>

std::vector<ChannelConfig> Config::default_channels()
{
    ChannelConfig ch1;
    ch1.id = 1;
    ChannelConfig ch2;
    ch2.id = 2;
    return {ch1, ch2};
}

// --------------------------------------------------
// YAML
// --------------------------------------------------

static uint8_t to_id(const YAML::Node& n, const char* what)
{
    int v = n.as<int>();
    if (v < 0 || v > 255)
        throw ConfigError(std::string(what) + " out of range 0..255: " +
                          std::to_string(v));
    return static_cast<uint8_t>(v);
}

static void apply_yaml(const YAML::Node& root, Config& cfg)
{
    if (!root || root.IsNull())
        return;
    if (!root.IsMap())
        throw ConfigError("config root must be a mapping");

    if (root["transport"])
    {
        std::string t = root["transport"].as<std::string>();
        if (t == "tcp")      cfg.transport = TransportKind::Tcp;
        else if (t == "sim") cfg.transport = TransportKind::Sim;
        else throw ConfigError("unknown transport '" + t + "'");
    }

    if (root["bind_address"])
        cfg.bind_address = root["bind_address"].as<std::string>();

    if (root["port"])
    {
        int p = root["port"].as<int>();
        if (p < 0 || p > 65535)
            throw ConfigError("port out of range: " + std::to_string(p));
        cfg.port = static_cast<uint16_t>(p);
    }

    if (root["sample_rate_hz"])
        cfg.sample_rate_hz = root["sample_rate_hz"].as<double>();

    if (root["log_path"])
        cfg.log_path = root["log_path"].as<std::string>();

    if (root["echo_readings"])
        cfg.echo_readings = root["echo_readings"].as<bool>();

    if (const YAML::Node chans = root["channels"])
    {
        if (!chans.IsSequence())
            throw ConfigError("'channels' must be a list");

        std::vector<ChannelConfig> out;
        for (const auto& c : chans)
        {
            ChannelConfig ch;
            if (!c["id"])
                throw ConfigError("channel entry without 'id'");
            ch.id = to_id(c["id"], "channel id");

            if (const YAML::Node sensors = c["sensors"])
            {
                if (!sensors.IsSequence() ||
                    sensors.size() != SENSORS_PER_CHANNEL)
                    throw ConfigError("channel " + std::to_string(ch.id) +
                                      ": 'sensors' must list exactly 2 ids");
                for (size_t i = 0; i < SENSORS_PER_CHANNEL; ++i)
                    ch.sensors[i] = to_id(sensors[i], "sensor id");
            }
            out.push_back(ch);
        }
        cfg.channels = out;
    }

    if (const YAML::Node sim = root["sim"])
    {
        if (sim["record_rate_hz"])
            cfg.sim.record_rate_hz = sim["record_rate_hz"].as<double>();
        if (sim["max_records"])
            cfg.sim.max_records = sim["max_records"].as<uint64_t>();
    }
}

void load_config_string(const std::string& yaml, Config& cfg)
{
    try {
        apply_yaml(YAML::Load(yaml), cfg);
    } catch (const YAML::Exception& e) {
        throw ConfigError(std::string("bad config: ") + e.what());
    }
}

void load_config_file(const std::string& path, Config& cfg)
{
    try {
        apply_yaml(YAML::LoadFile(path), cfg);
    } catch (const YAML::BadFile&) {
        throw ConfigError("cannot read config file '" + path + "'");
    } catch (const YAML::Exception& e) {
        throw ConfigError(path + ": " + e.what());
    }
}

void validate_config(const Config& cfg)
{
    if (!std::isfinite(cfg.sample_rate_hz) ||
        cfg.sample_rate_hz < MIN_SAMPLE_RATE_HZ ||
        cfg.sample_rate_hz > MAX_SAMPLE_RATE_HZ)
    {
        char msg[128];
        std::snprintf(msg, sizeof(msg),
            "sample_rate_hz must be between %g and %g (got %g)",
            MIN_SAMPLE_RATE_HZ, MAX_SAMPLE_RATE_HZ, cfg.sample_rate_hz);
        throw ConfigError(msg);
    }

    if (cfg.log_path.empty())
        throw ConfigError("log_path is empty");

    if (cfg.channels.empty())
        throw ConfigError("at least one channel must be configured");

    for (size_t i = 0; i < cfg.channels.size(); ++i)
    {
        const auto& a = cfg.channels[i];
        if (a.sensors[0] == a.sensors[1])
            throw ConfigError("channel " + std::to_string(a.id) +
                              " lists sensor " + std::to_string(a.sensors[0]) +
                              " twice");
        for (size_t j = i + 1; j < cfg.channels.size(); ++j)
            if (cfg.channels[j].id == a.id)
                throw ConfigError("channel " + std::to_string(a.id) +
                                  " configured twice");
    }

    if (cfg.transport == TransportKind::Sim &&
        (!std::isfinite(cfg.sim.record_rate_hz) || cfg.sim.record_rate_hz <= 0.0))
        throw ConfigError("sim.record_rate_hz must be > 0");
}

// --------------------------------------------------
// Command line
// --------------------------------------------------

void print_usage(const char* prog)
{
    std::printf(
        "Usage: %s [options]\n"
        "  --config <file>      YAML configuration file\n"
        "  --port <n>           TCP listen port (default %u)\n"
        "  --bind <addr>        listen address (default 0.0.0.0)\n"
        "  --rate <hz>          CSV sampling rate (default %.0f)\n"
        "  --log <file>         CSV output path (default Data.csv)\n"
        "  --echo               print every decoded reading\n"
        "  --sim                use the built-in simulated interrogator\n"
        "  --sim-records <n>    stop the simulator after n records\n"
        "  --help               show this text\n",
        prog, (unsigned)DEFAULT_PORT, DEFAULT_SAMPLE_RATE_HZ);
}

static const char* need_value(int& i, int argc, char** argv)
{
    if (i + 1 >= argc)
        throw ConfigError(std::string("missing value for ") + argv[i]);
    return argv[++i];
}

static long long parse_int(const char* flag, const char* s,
                           long long lo, long long hi)
{
    errno = 0;
    char* end = nullptr;
    long long v = std::strtoll(s, &end, 10);
    if (errno != 0 || end == s || *end != '\0' || v < lo || v > hi)
        throw ConfigError(std::string("bad value for ") + flag + ": '" + s + "'");
    return v;
}

static double parse_double(const char* flag, const char* s)
{
    errno = 0;
    char* end = nullptr;
    double v = std::strtod(s, &end);
    if (errno != 0 || end == s || *end != '\0')
        throw ConfigError(std::string("bad value for ") + flag + ": '" + s + "'");
    return v;
}

bool parse_args(int argc, char** argv, Config& cfg)
{
    // The file goes first so that flags override it.
    for (int i = 1; i < argc; ++i)
    {
        if (std::strcmp(argv[i], "--help") == 0 || std::strcmp(argv[i], "-h") == 0)
        {
            print_usage(argv[0]);
            return false;
        }
        if (std::strcmp(argv[i], "--config") == 0)
            load_config_file(need_value(i, argc, argv), cfg);
    }

    for (int i = 1; i < argc; ++i)
    {
        const char* a = argv[i];

        if (std::strcmp(a, "--config") == 0)
            ++i;
        else if (std::strcmp(a, "--port") == 0)
            cfg.port = static_cast<uint16_t>(
                parse_int(a, need_value(i, argc, argv), 0, 65535));
        else if (std::strcmp(a, "--bind") == 0)
            cfg.bind_address = need_value(i, argc, argv);
        else if (std::strcmp(a, "--rate") == 0)
            cfg.sample_rate_hz = parse_double(a, need_value(i, argc, argv));
        else if (std::strcmp(a, "--log") == 0)
            cfg.log_path = need_value(i, argc, argv);
        else if (std::strcmp(a, "--echo") == 0)
            cfg.echo_readings = true;
        else if (std::strcmp(a, "--sim") == 0)
            cfg.transport = TransportKind::Sim;
        else if (std::strcmp(a, "--sim-records") == 0)
            cfg.sim.max_records = static_cast<uint64_t>(
                parse_int(a, need_value(i, argc, argv), 0, 1LL << 62));
        else
            throw ConfigError(std::string("unknown option '") + a + "'");
    }

    validate_config(cfg);
    return true;
}

// --------------------------------------------------
// SlotTable
// --------------------------------------------------

constexpr int SlotTable::NO_SLOT;

SlotTable::SlotTable(const std::vector<ChannelConfig>& channels)
{
    for (const auto& ch : channels)
        for (size_t s = 0; s < SENSORS_PER_CHANNEL; ++s)
            keys.push_back(Key{ch.id, ch.sensors[s]});
}

int SlotTable::find(uint8_t channel, uint8_t sensor) const
{
    for (size_t i = 0; i < keys.size(); ++i)
        if (keys[i].channel == channel && keys[i].sensor == sensor)
            return static_cast<int>(i);
    return NO_SLOT;
}
