/*
 * Copyright (C) 2017-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include <algorithm>
#include <stdexcept>

#include <yaml-cpp/yaml.h>

#include <seastar/core/file.hh>
#include <seastar/core/fstream.hh>
#include <seastar/core/seastar.hh>
#include <seastar/core/coroutine.hh>

#include "utils/config_file.hh"

namespace utils {

sstring hyphenate(std::string_view v) {
    sstring result(v.begin(), v.end());
    std::replace(result.begin(), result.end(), '_', '-');
    return result;
}

config_file::config_file(std::initializer_list<cfg_ref> cfgs)
    : _cfgs(cfgs)
{}

void config_file::add(cfg_ref cfg) {
    _cfgs.emplace_back(cfg);
}

void config_file::add(std::initializer_list<cfg_ref> cfgs) {
    _cfgs.insert(_cfgs.end(), cfgs.begin(), cfgs.end());
}

bpo::options_description config_file::get_options_description() {
    bpo::options_description opts("");
    return get_options_description(opts);
}

bpo::options_description config_file::get_options_description(bpo::options_description opts) {
    auto init = opts.add_options();
    add_options(init);
    return opts;
}

bpo::options_description_easy_init&
config_file::add_options(bpo::options_description_easy_init& init) {
    for (config_src& src : _cfgs) {
        if (src.status() == value_status::Used) {
            src.add_command_line_option(init);
        }
    }
    return init;
}

void config_file::read_from_yaml(const sstring& yaml, error_handler h) {
    read_from_yaml(yaml, std::move(h), false, nullptr);
}

void config_file::read_from_yaml(const char* yaml, error_handler h) {
    read_from_yaml(sstring(yaml), std::move(h), false, nullptr);
}

size_t config_file::reload_live_values(const sstring& yaml, error_handler h) {
    size_t applied = 0;
    read_from_yaml(yaml, std::move(h), true, &applied);
    return applied;
}

void config_file::read_from_yaml(const sstring& yaml, error_handler h, bool live_only, size_t* applied) {
    if (!h) {
        h = [](auto& opt, auto& msg, auto) {
            throw std::invalid_argument(msg + " : " + opt);
        };
    }
    auto doc = YAML::Load(yaml.c_str());
    if (doc.IsNull()) {
        return;
    }
    if (!doc.IsMap()) {
        h("", "Configuration is not a map", std::nullopt);
        return;
    }
    for (auto node : doc) {
        auto label = sstring(node.first.as<std::string>());
        auto i = std::find_if(_cfgs.begin(), _cfgs.end(), [&label](const config_src& cfg) {
            return cfg.name() == std::string_view(label);
        });
        if (i == _cfgs.end()) {
            h(label, "Unknown option", std::nullopt);
            continue;
        }
        config_src& cfg = *i;
        if (live_only && !cfg.is_live()) {
            continue;
        }
        // Command line wins over the settings file, but not over a reload.
        if (!live_only && cfg.source() > config_source::SettingsFile) {
            continue;
        }
        if (cfg.status() == value_status::Invalid) {
            h(label, "Option is not applicable", cfg.status());
            continue;
        }
        if (node.second.IsNull()) {
            continue;
        }
        // Still, a syntax error is an error warning, not a fail
        try {
            cfg.set_value(node.second, config_source::SettingsFile);
            if (applied) {
                ++*applied;
            }
        } catch (std::exception& e) {
            h(label, e.what(), cfg.status());
        }
    }
}

future<> config_file::read_from_file(file f, error_handler h) {
    auto s = co_await f.size();
    auto in = make_file_input_stream(f);
    std::exception_ptr ex;
    try {
        auto buf = co_await in.read_exactly(s);
        read_from_yaml(sstring(buf.begin(), buf.end()), std::move(h));
    } catch (...) {
        ex = std::current_exception();
    }
    co_await in.close();
    if (ex) {
        std::rethrow_exception(std::move(ex));
    }
}

future<> config_file::read_from_file(const sstring& filename, error_handler h) {
    auto f = co_await open_file_dma(filename, open_flags::ro);
    co_await read_from_file(std::move(f), std::move(h));
}

config_file::configs config_file::set_values() const {
    configs res;
    std::copy_if(_cfgs.begin(), _cfgs.end(), std::back_inserter(res), [](const config_src& cfg) {
        return cfg.source() > config_source::None;
    });
    return res;
}

config_file::configs config_file::unset_values() const {
    configs res;
    std::copy_if(_cfgs.begin(), _cfgs.end(), std::back_inserter(res), [](const config_src& cfg) {
        return cfg.source() == config_source::None;
    });
    return res;
}

}
