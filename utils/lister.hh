/*
 * Copyright (C) 2017-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#pragma once

#include <filesystem>
#include <functional>
#include <unordered_set>
#include <seastar/core/file.hh>
#include <seastar/core/enum.hh>
#include <seastar/util/bool_class.hh>

#include "seastarx.hh"

namespace fs = std::filesystem;

namespace utils {

class lister final {
public:
    /**
     * Types of entries to list. If empty - list all present entries.
     */
    using dir_entry_types = std::unordered_set<directory_entry_type, enum_hash<directory_entry_type>>;
    /**
     * Called for each listed entry. The first parameter is the directory
     * being scanned.
     */
    using walker_type = std::function<future<> (fs::path, directory_entry)>;

    // Whether entries whose name starts with a dot are listed.
    struct show_hidden_tag {};
    using show_hidden = bool_class<show_hidden_tag>;

private:
    file _f;
    walker_type _walker;
    dir_entry_types _expected_type;
    fs::path _dir;
    show_hidden _show_hidden;
    future<> _listing_done;

public:
    /**
     * Scans the directory calling the walker for each entry of the given types.
     *
     * @return A future that resolves when all entries were processed, or
     * with the first error of the listing or of the walker.
     */
    static future<> scan_dir(fs::path dir, dir_entry_types type, walker_type walker, show_hidden do_show_hidden = show_hidden::no);

    lister(file f, dir_entry_types type, walker_type walker, fs::path dir, show_hidden do_show_hidden);

    future<> done();

private:
    future<> visit(directory_entry de);
    // Fills in the entry type when the file system did not report it.
    future<directory_entry> guarantee_type(directory_entry de);
};

} // namespace utils
