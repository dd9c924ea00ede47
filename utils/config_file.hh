/*
 * Copyright (C) 2017-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#pragma once

#include <functional>
#include <optional>
#include <string_view>
#include <vector>

#include <boost/program_options.hpp>

#include <seastar/core/sstring.hh>
#include <seastar/core/future.hh>

#include "seastarx.hh"
#include "utils/updateable_value.hh"

namespace seastar { class file; }
namespace YAML { class Node; }

namespace utils {

namespace bpo = boost::program_options;

// "stream_throughput" -> "stream-throughput"
sstring hyphenate(std::string_view);

class config_file {
public:
    enum class value_status {
        Used,
        Unused,
        Invalid,
    };

    enum class liveness {
        LiveUpdate,
        MustRestart,
    };

    enum class config_source : uint8_t {
        None,
        SettingsFile,
        CommandLine,
        Internal,
    };

    struct config_src {
        std::string_view _name, _desc;
        std::string_view _type_name;
        liveness _liveness;
    public:
        config_src(std::string_view name, std::string_view type_name, liveness l, std::string_view desc)
            : _name(name)
            , _desc(desc)
            , _type_name(type_name)
            , _liveness(l)
        {}
        virtual ~config_src() {}

        const std::string_view& name() const {
            return _name;
        }
        const std::string_view& desc() const {
            return _desc;
        }
        const std::string_view& type_name() const {
            return _type_name;
        }
        bool is_live() const {
            return _liveness == liveness::LiveUpdate;
        }

        virtual void add_command_line_option(bpo::options_description_easy_init&) = 0;
        virtual void set_value(const YAML::Node&, config_source) = 0;
        virtual value_status status() const = 0;
        virtual config_source source() const = 0;
        virtual sstring value_as_string() const = 0;
    };

    template<typename T>
    struct named_value : public config_src {
    private:
        updateable_value_source<T> _value;
        config_source _source = config_source::None;
        value_status _value_status;
    public:
        typedef T type;
        typedef named_value<T> MyType;

        named_value(config_file* file, std::string_view name, liveness l, value_status vs, const T& t = T(), std::string_view desc = {});
        named_value(config_file* file, std::string_view name, value_status vs, const T& t = T(), std::string_view desc = {})
            : named_value(file, name, liveness::MustRestart, vs, t, desc)
        {}

        value_status status() const override {
            return _value_status;
        }
        config_source source() const override {
            return _source;
        }
        bool is_set() const {
            return _source > config_source::None;
        }
        void set(T t, config_source src = config_source::Internal) {
            _value.set(std::move(t));
            if (src > config_source::None) {
                _source = src;
            }
        }
        MyType& operator()(T t) {
            set(std::move(t));
            return *this;
        }
        T operator()() const {
            return _value.get();
        }
        // A handle that follows updates of live values.
        operator updateable_value<T>() const {
            return updateable_value<T>(_value);
        }

        void add_command_line_option(bpo::options_description_easy_init&) override;
        void set_value(const YAML::Node&, config_source) override;
        sstring value_as_string() const override;
    };

    typedef std::reference_wrapper<config_src> cfg_ref;

    config_file(std::initializer_list<cfg_ref> = {});
    virtual ~config_file() = default;

    void add(cfg_ref);
    void add(std::initializer_list<cfg_ref>);

    bpo::options_description get_options_description();
    bpo::options_description get_options_description(bpo::options_description);

    bpo::options_description_easy_init&
    add_options(bpo::options_description_easy_init&);

    /**
     * Default behaviour for yaml parser is to throw on
     * unknown stuff, invalid opts or conversion errors.
     *
     * Error handling function allows overriding this.
     *
     * error: <option name>, <message>, <optional value_status>
     *
     * The last arg, opt value_status will tell you the type of
     * error occurred. If not set, the option found does not exist.
     * If invalid, it is invalid. Otherwise, a parse error.
     */
    using error_handler = std::function<void(const sstring&, const sstring&, std::optional<value_status>)>;

    void read_from_yaml(const sstring&, error_handler = {});
    void read_from_yaml(const char*, error_handler = {});
    future<> read_from_file(const sstring&, error_handler = {});
    future<> read_from_file(file, error_handler = {});

    // Re-reads the given yaml, applying only values marked LiveUpdate.
    // Returns the number of live values that were present.
    size_t reload_live_values(const sstring&, error_handler = {});

    using configs = std::vector<cfg_ref>;

    configs set_values() const;
    configs unset_values() const;
    const configs& values() const {
        return _cfgs;
    }
private:
    void read_from_yaml(const sstring&, error_handler, bool live_only, size_t* applied);

    configs _cfgs;
};

}
