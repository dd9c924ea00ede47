/*
 * Copyright (C) 2024-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include <boost/test/unit_test.hpp>
#include <boost/program_options.hpp>

#include <seastar/testing/test_case.hh>

#include "db/config.hh"
#include "utils/updateable_value.hh"

namespace bpo = boost::program_options;

SEASTAR_TEST_CASE(test_defaults) {
    db::config cfg;
    BOOST_REQUIRE_EQUAL(cfg.listen_address(), "127.0.0.1");
    BOOST_REQUIRE_EQUAL(cfg.streaming_port(), 7100);
    BOOST_REQUIRE_EQUAL(cfg.stream_throughput_outbound_megabits_per_sec(), 0);
    BOOST_REQUIRE_EQUAL(cfg.max_streaming_retries(), 3);
    BOOST_REQUIRE_EQUAL(cfg.streaming_chunk_size_in_kb(), 64);
    BOOST_REQUIRE_EQUAL(cfg.data_directory(), "data");
    BOOST_REQUIRE(!cfg.streaming_port.is_set());
    return make_ready_future<>();
}

SEASTAR_TEST_CASE(test_read_from_yaml) {
    db::config cfg;
    cfg.read_from_yaml(
        "listen_address: 10.0.0.1\n"
        "streaming_port: 7200\n"
        "max_streaming_retries: 5\n"
        "data_directory: /var/lib/bulkstream\n"
        "stream_throughput_outbound_megabits_per_sec: 400\n");
    BOOST_REQUIRE_EQUAL(cfg.listen_address(), "10.0.0.1");
    BOOST_REQUIRE_EQUAL(cfg.streaming_port(), 7200);
    BOOST_REQUIRE(cfg.streaming_port.is_set());
    BOOST_REQUIRE_EQUAL(cfg.max_streaming_retries(), 5);
    BOOST_REQUIRE_EQUAL(cfg.data_directory(), "/var/lib/bulkstream");
    BOOST_REQUIRE_EQUAL(cfg.stream_throughput_outbound_megabits_per_sec(), 400);
    BOOST_REQUIRE_EQUAL(cfg.streaming_chunk_size_in_kb(), 64);
    // An empty document changes nothing
    cfg.read_from_yaml("");
    BOOST_REQUIRE_EQUAL(cfg.streaming_port(), 7200);
    return make_ready_future<>();
}

SEASTAR_TEST_CASE(test_bad_yaml_is_reported) {
    db::config cfg;
    BOOST_REQUIRE_THROW(cfg.read_from_yaml("no_such_option: 1\n"), std::invalid_argument);
    BOOST_REQUIRE_THROW(cfg.read_from_yaml("streaming_port: not-a-number\n"), std::invalid_argument);
    BOOST_REQUIRE_EQUAL(cfg.streaming_port(), 7100);

    std::vector<sstring> errors;
    cfg.read_from_yaml("no_such_option: 1\nmax_streaming_retries: 7\n", [&errors] (const sstring& opt, const sstring& msg, std::optional<utils::config_file::value_status> status) {
        errors.push_back(opt);
        BOOST_REQUIRE(!status);
    });
    BOOST_REQUIRE_EQUAL(errors.size(), 1);
    BOOST_REQUIRE_EQUAL(errors[0], "no_such_option");
    BOOST_REQUIRE_EQUAL(cfg.max_streaming_retries(), 7);
    return make_ready_future<>();
}

SEASTAR_TEST_CASE(test_reload_only_touches_live_values) {
    db::config cfg;
    utils::updateable_value<uint32_t> throughput(cfg.stream_throughput_outbound_megabits_per_sec);
    BOOST_REQUIRE_EQUAL(throughput(), 0);

    auto applied = cfg.reload_live_values(
        "streaming_port: 7300\n"
        "stream_throughput_outbound_megabits_per_sec: 100\n");
    BOOST_REQUIRE_EQUAL(applied, 1);
    BOOST_REQUIRE_EQUAL(throughput(), 100);
    // Needs a restart
    BOOST_REQUIRE_EQUAL(cfg.streaming_port(), 7100);
    return make_ready_future<>();
}

SEASTAR_TEST_CASE(test_command_line_wins_over_yaml) {
    db::config cfg;
    bpo::options_description desc;
    auto init = desc.add_options();
    cfg.add_options(init);
    bpo::variables_map vm;
    const char* argv[] = {"bulkstream", "--streaming-port", "7400"};
    bpo::store(bpo::parse_command_line(3, argv, desc), vm);
    bpo::notify(vm);
    BOOST_REQUIRE_EQUAL(cfg.streaming_port(), 7400);

    cfg.read_from_yaml("streaming_port: 7200\nmax_streaming_retries: 9\n");
    BOOST_REQUIRE_EQUAL(cfg.streaming_port(), 7400);
    BOOST_REQUIRE_EQUAL(cfg.max_streaming_retries(), 9);
    return make_ready_future<>();
}

SEASTAR_TEST_CASE(test_logging_settings) {
    db::config cfg;
    bpo::variables_map empty;
    auto s = cfg.logging_settings(empty);
    BOOST_REQUIRE(s.default_level == seastar::log_level::info);
    BOOST_REQUIRE(s.stdout_enabled);

    cfg.read_from_yaml("default_log_level: debug\nlog_to_stdout: false\n");
    s = cfg.logging_settings(empty);
    BOOST_REQUIRE(s.default_level == seastar::log_level::debug);
    BOOST_REQUIRE(!s.stdout_enabled);
    return make_ready_future<>();
}
