/*
 * Copyright (C) 2019-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#pragma once

#include <seastar/core/sstring.hh>
#include <fmt/format.h>

#include "seastarx.hh"
#include "utils/UUID.hh"

using table_id = utils::tagged_uuid<struct table_id_tag>;

// Identifies a table by its qualified name. Nodes derive the same id for
// the same name, so the id can be sent over the wire in place of the names.
inline table_id make_table_id(std::string_view keyspace, std::string_view table) {
    auto qualified = fmt::format("{}.{}", keyspace, table);
    return table_id(utils::make_name_uuid(qualified));
}

struct table_info {
    sstring keyspace;
    sstring name;
    table_id id;
};

template <>
struct fmt::formatter<table_info> : fmt::formatter<string_view> {
    template <typename FormatContext>
    auto format(const table_info& ti, FormatContext& ctx) const {
        return fmt::format_to(ctx.out(), "{}.{} id={}", ti.keyspace, ti.name, ti.id);
    }
};
