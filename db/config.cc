/*
 * Copyright (C) 2015-present ScyllaDB
 *
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include <cstdlib>

#include <boost/program_options.hpp>
#include <yaml-cpp/yaml.h>

#include <boost/lexical_cast.hpp>

#include <seastar/util/log.hh>
#include <seastar/util/program-options.hh>

#include "db/config.hh"
#include "log.hh"
#include "utils/config_file_impl.hh"

using liveness = utils::config_file::liveness;
using value_status = utils::config_file::value_status;

db::config::config()
    : utils::config_file()
    , listen_address(this, "listen_address", value_status::Used, "127.0.0.1",
        "The IP address that this node binds to for accepting streaming connections from other nodes, and the address peers know it by.")
    , streaming_port(this, "streaming_port", value_status::Used, 7100,
        "The port used for inter-node bulk file streaming. All nodes of a cluster must use the same port.")
    , stream_throughput_outbound_megabits_per_sec(this, "stream_throughput_outbound_megabits_per_sec", liveness::LiveUpdate, value_status::Used, 0,
        "Throttles all outbound streaming file transfers on this node to the specified throughput, per peer. 0 disables throttling.")
    , max_streaming_retries(this, "max_streaming_retries", value_status::Used, 3,
        "Number of times a single file may be re-sent within a session after the receiver failed to store it. Exceeding it fails the session.")
    , streaming_chunk_size_in_kb(this, "streaming_chunk_size_in_kb", value_status::Used, 64,
        "Size of the chunks file sections are sent in. Throttling is applied per chunk.")
    , data_directory(this, "data_directory", value_status::Used, "data",
        "The directory holding the files of every table, laid out as <keyspace>/<table>/<file>. Received files are stored here as well.")
    , default_log_level(this, "default_log_level", value_status::Used)
    , log_to_stdout(this, "log_to_stdout", value_status::Used)
{}

db::config::~config()
{}

db::fs::path db::config::get_conf_dir() {
    using namespace db::fs;

    path confdir;
    auto* cd = std::getenv("BULKSTREAM_CONF");
    if (cd != nullptr) {
        confdir = path(cd);
    } else {
        auto* p = std::getenv("BULKSTREAM_HOME");
        if (p != nullptr) {
            confdir = path(p);
        }
        confdir /= "conf";
    }

    return confdir;
}

db::fs::path db::config::get_conf_sub(db::fs::path sub) {
    return get_conf_dir() / sub;
}

logging::settings db::config::logging_settings(const bpo::variables_map& map) const {
    // Command line wins unless it was left at its default and the yaml
    // file sets the value.
    auto value = [&map] (auto& v, auto fallback) {
        using expected = std::decay_t<decltype(fallback)>;
        auto name = utils::hyphenate(v.name());
        if (!map.count(name)) {
            return v.value_or(std::move(fallback));
        }
        const bpo::variable_value& opt = map[name];
        if (opt.defaulted() && v.is_set()) {
            return v();
        }
        if constexpr (std::is_same_v<expected, seastar::log_level>) {
            return boost::lexical_cast<seastar::log_level>(opt.as<sstring>());
        } else {
            return opt.as<expected>();
        }
    };

    logging::settings s{};
    if (map.count("logger-log-level")) {
        for (auto& [name, level] : map["logger-log-level"].as<seastar::program_options::string_map>()) {
            s.logger_levels.emplace(name, boost::lexical_cast<seastar::log_level>(level));
        }
    }
    s.default_level = value(default_log_level, seastar::log_level::info);
    s.stdout_enabled = value(log_to_stdout, true);
    s.syslog_enabled = false;
    return s;
}
