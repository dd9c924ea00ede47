/*
 * Copyright (C) 2015-present ScyllaDB
 *
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#pragma once

#include <filesystem>

#include <boost/program_options.hpp>

#include <seastar/core/sstring.hh>
#include <seastar/util/log.hh>

#include "seastarx.hh"
#include "log.hh"
#include "utils/config_file.hh"
#include "utils/updateable_value.hh"

namespace db {

namespace fs = std::filesystem;

class config final : public utils::config_file {
public:
    config();
    ~config();

    /**
     * Scans the environment variables for configuration files directory
     * definition. It's either $BULKSTREAM_CONF, $BULKSTREAM_HOME/conf or "conf"
     * if none of BULKSTREAM_CONF and BULKSTREAM_HOME is defined.
     *
     * @return path of the directory where configuration files are located
     *         according the environment variables definitions.
     */
    static fs::path get_conf_dir();
    static fs::path get_conf_sub(fs::path);

    named_value<sstring> listen_address;
    named_value<uint16_t> streaming_port;
    named_value<uint32_t> stream_throughput_outbound_megabits_per_sec;
    named_value<uint32_t> max_streaming_retries;
    named_value<uint32_t> streaming_chunk_size_in_kb;
    named_value<sstring> data_directory;

    // Logging settings of the command line merged with the ones of the
    // yaml file.
    logging::settings logging_settings(const boost::program_options::variables_map&) const;
private:
    template<typename T>
    struct log_legacy_value : public named_value<T> {
        using MyBase = named_value<T>;

        using MyBase::MyBase;

        T value_or(T&& t) const {
            return this->is_set() ? (*this)() : t;
        }
        // do not add to boost::options. We only care about yaml config
        void add_command_line_option(boost::program_options::options_description_easy_init&) override {}
    };

    log_legacy_value<seastar::log_level> default_log_level;
    log_legacy_value<bool> log_to_stdout;
};

}
