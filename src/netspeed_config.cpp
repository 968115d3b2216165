#include "netspeed_config.h"
#include <iostream>

namespace netspeed {

namespace {

uint16_t get_port(const ConfigParser& config, const std::string& key, uint16_t default_value) {
    uint32_t value = config.get_uint32(key, default_value);
    if (value > 65535) {
        std::cerr << "[Config] Warning: " << key << "=" << value
                  << " is not a valid port, using " << default_value << std::endl;
        return default_value;
    }
    return static_cast<uint16_t>(value);
}

// Zero would turn a bounded wait into a busy spin
uint32_t get_wait_ms(const ConfigParser& config, const std::string& key, uint32_t default_value) {
    uint32_t value = config.get_uint32(key, default_value);
    if (value == 0) {
        std::cerr << "[Config] Warning: " << key << " must be positive, using "
                  << default_value << std::endl;
        return default_value;
    }
    return value;
}

} // namespace

ClientConfig load_client_config(const ConfigParser& config) {
    ClientConfig cfg;
    cfg.verbose = config.get_bool("verbose", false);
    cfg.offer_port = get_port(config, "offer_port", DEFAULT_OFFER_PORT);
    cfg.discovery_wait_ms = get_wait_ms(config, "discovery_wait_ms", cfg.discovery_wait_ms);

    cfg.transfer.udp_timeout_ms = get_wait_ms(config, "udp_timeout_ms", cfg.transfer.udp_timeout_ms);
    cfg.transfer.tcp_timeout_ms = get_wait_ms(config, "tcp_timeout_ms", cfg.transfer.tcp_timeout_ms);
    cfg.transfer.tcp_connect_timeout_ms =
        get_wait_ms(config, "tcp_connect_timeout_ms", cfg.transfer.tcp_connect_timeout_ms);
    cfg.transfer.max_tracked_segments =
        config.get_uint64("max_tracked_segments", cfg.transfer.max_tracked_segments);
    cfg.transfer.verbose = cfg.verbose;

    cfg.has_round_defaults = config.has_key("file_size");
    cfg.file_size = config.get_uint64("file_size", 0);
    cfg.tcp_connections = config.get_uint32("tcp_connections", 1);
    cfg.udp_connections = config.get_uint32("udp_connections", 1);
    cfg.rounds = config.get_uint32("rounds", 0);
    return cfg;
}

ServerConfig load_server_config(const ConfigParser& config) {
    ServerConfig cfg;
    cfg.verbose = config.get_bool("verbose", false);
    cfg.offer_port = get_port(config, "offer_port", DEFAULT_OFFER_PORT);
    cfg.broadcast_address = config.get_string("broadcast_address", cfg.broadcast_address);

    cfg.udp_port = get_port(config, "udp_port", 0);
    cfg.tcp_port = get_port(config, "tcp_port", 0);
    cfg.port_range_min = get_port(config, "port_range_min", cfg.port_range_min);
    cfg.port_range_max = get_port(config, "port_range_max", cfg.port_range_max);
    if (cfg.port_range_min == 0 || cfg.port_range_min >= cfg.port_range_max) {
        std::cerr << "[Config] Warning: empty port range [" << cfg.port_range_min << ", "
                  << cfg.port_range_max << "), using [20000, 65000)" << std::endl;
        cfg.port_range_min = 20000;
        cfg.port_range_max = 65000;
    }
    cfg.bind_attempts = config.get_uint32("bind_attempts", cfg.bind_attempts);
    if (cfg.bind_attempts == 0) {
        cfg.bind_attempts = 1;
    }

    cfg.broadcast_interval_ms = get_wait_ms(config, "broadcast_interval_ms", cfg.broadcast_interval_ms);
    cfg.broadcast_backoff_ms = get_wait_ms(config, "broadcast_backoff_ms", cfg.broadcast_backoff_ms);
    cfg.dispatch_wait_ms = get_wait_ms(config, "dispatch_wait_ms", cfg.dispatch_wait_ms);

    cfg.handler.tcp_chunk_bytes = config.get_uint32("tcp_chunk_bytes", cfg.handler.tcp_chunk_bytes);
    if (cfg.handler.tcp_chunk_bytes == 0) {
        cfg.handler.tcp_chunk_bytes = 64 * 1024;
    }
    cfg.handler.tcp_timeout_ms = get_wait_ms(config, "tcp_timeout_ms", cfg.handler.tcp_timeout_ms);
    cfg.handler.pacing_cap_us = config.get_uint32("pacing_cap_us", cfg.handler.pacing_cap_us);
    cfg.handler.pacing_scale_bytes = config.get_uint64("pacing_scale_bytes", cfg.handler.pacing_scale_bytes);
    cfg.handler.verbose = cfg.verbose;

    cfg.worker_threads = config.get_uint32("worker_threads", cfg.worker_threads);
    if (cfg.worker_threads == 0) {
        cfg.worker_threads = 1;
    }
    cfg.max_pending_tasks = config.get_uint32("max_pending_tasks", cfg.max_pending_tasks);
    return cfg;
}

} // namespace netspeed
