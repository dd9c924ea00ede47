/*
 * Copyright (C) 2017-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include <seastar/core/seastar.hh>
#include <seastar/core/coroutine.hh>

#include "utils/lister.hh"

namespace utils {

lister::lister(file f, dir_entry_types type, walker_type walker, fs::path dir, show_hidden do_show_hidden)
        : _f(std::move(f))
        , _walker(std::move(walker))
        , _expected_type(std::move(type))
        , _dir(std::move(dir))
        , _show_hidden(do_show_hidden)
        , _listing_done(_f.list_directory([this] (directory_entry de) { return visit(std::move(de)); }).done()) {
}

future<> lister::visit(directory_entry de) {
    de = co_await guarantee_type(std::move(de));
    if ((!_expected_type.empty() && !_expected_type.contains(*de.type)) || (!_show_hidden && de.name[0] == '.')) {
        co_return;
    }
    co_await _walker(_dir, std::move(de));
}

future<> lister::done() {
    return _listing_done.finally([this] {
        return _f.close();
    });
}

future<directory_entry> lister::guarantee_type(directory_entry de) {
    if (de.type) {
        co_return de;
    }
    auto path = _dir / de.name.c_str();
    auto t = co_await file_type(path.native(), follow_symlink::no);
    if (!t) {
        throw std::runtime_error(format("Failed to get {} type.", path.native()));
    }
    de.type = t;
    co_return de;
}

future<> lister::scan_dir(fs::path dir, dir_entry_types type, walker_type walker, show_hidden do_show_hidden) {
    auto f = co_await open_directory(dir.native());
    auto l = std::make_unique<lister>(std::move(f), std::move(type), std::move(walker), std::move(dir), do_show_hidden);
    co_await l->done();
}

} // namespace utils
