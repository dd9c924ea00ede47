/*
 * Copyright (C) 2017-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#pragma once

#include <string>

#include <boost/lexical_cast.hpp>
#include <boost/program_options.hpp>
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>

#include <seastar/core/sstring.hh>
#include <seastar/util/log.hh>

#include "utils/config_file.hh"

namespace YAML {

template<>
struct convert<seastar::sstring> {
    static Node encode(const seastar::sstring& rhs) {
        auto p = rhs.c_str();
        return convert<const char*>::encode(p);
    }
    static bool decode(const Node& node, seastar::sstring& rhs) {
        std::string tmp;
        if (!convert<std::string>::decode(node, tmp)) {
            return false;
        }
        rhs = tmp;
        return true;
    }
};

// yaml-cpp conversion would do well to have some enable_if-stuff to make it possible
// to do more broad spectrum converters.
template<>
struct convert<seastar::log_level> {
    static bool decode(const Node& node, seastar::log_level& rhs) {
        std::string tmp;
        if (!convert<std::string>::decode(node, tmp)) {
            return false;
        }
        rhs = boost::lexical_cast<seastar::log_level>(tmp);
        return true;
    }
};

}

namespace utils {

template<typename T>
config_file::named_value<T>::named_value(config_file* file, std::string_view name, liveness l, value_status vs, const T& t, std::string_view desc)
    : config_src(name, typeid(T).name(), l, desc)
    , _value(t)
    , _value_status(vs)
{
    file->add(*this);
}

template<typename T>
void config_file::named_value<T>::add_command_line_option(bpo::options_description_easy_init& init) {
    init(hyphenate(name()).c_str(),
            bpo::value<T>()->notifier([this](T new_val) {
                set(std::move(new_val), config_source::CommandLine);
            }),
            sstring(desc()).c_str());
}

template<typename T>
void config_file::named_value<T>::set_value(const YAML::Node& node, config_source src) {
    set(node.as<T>(), src);
}

template<typename T>
sstring config_file::named_value<T>::value_as_string() const {
    return fmt::format("{}", (*this)());
}

}
