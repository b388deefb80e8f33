#include "common/path.hpp"

#include <filesystem>
#include <system_error>

namespace parsediag {

namespace fs = std::filesystem;

std::string relative_to(std::string_view path, std::string_view base) {
    fs::path target(path);
    fs::path root(base);
    if (!target.is_absolute() || !root.is_absolute()) {
        return std::string(path);
    }

    target = target.lexically_normal();
    root = root.lexically_normal();

    // Compare component-wise so "/work/app" does not match "/work/application".
    auto t = target.begin();
    for (auto r = root.begin(); r != root.end(); ++r) {
        if (r->empty()) continue; // trailing separator
        if (t == target.end() || *t != *r) {
            return std::string(path);
        }
        ++t;
    }
    if (t == target.end()) {
        return std::string(path);
    }

    fs::path rest;
    for (; t != target.end(); ++t) {
        rest /= *t;
    }
    return rest.generic_string();
}

std::string relative_to_cwd(std::string_view path) {
    std::error_code ec;
    auto cwd = fs::current_path(ec);
    if (ec) {
        return std::string(path);
    }
    return relative_to(path, cwd.string());
}

} // namespace parsediag
