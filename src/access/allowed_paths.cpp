// ==============================================================================
// allowed_paths.cpp - Разрешённые директории
// ==============================================================================

#include "pathaction/access.hpp"

#include "pathaction/context.hpp"
#include "pathaction/error.hpp"

#include <fstream>
#include <iterator>
#include <yaml-cpp/yaml.h>

namespace pathaction::access {

namespace {

/// candidate == base или candidate внутри base (по компонентам)
bool is_within(const std::filesystem::path& candidate, const std::filesystem::path& base) {
    auto c = candidate.begin();
    for (auto b = base.begin(); b != base.end(); ++b, ++c) {
        if (c == candidate.end() || *c != *b) {
            return false;
        }
    }
    return true;
}

}  // namespace

std::filesystem::path default_permissions_file(const platform::Environment& env) {
    return platform::home_dir(env) / PERMISSIONS_FILE;
}

std::filesystem::path normalize(const std::filesystem::path& path) {
    const auto abs = absolute_path(path, std::filesystem::current_path());
    std::error_code ec;
    const auto canonical = std::filesystem::weakly_canonical(abs, ec);
    if (ec) {
        return abs;
    }
    return absolute_path(canonical, std::filesystem::path("/"));
}

void AllowedPaths::add(const std::filesystem::path& path, bool permanent) {
    const auto p = normalize(path);
    if (permanent) {
        permanent_.insert(p);
        temporary_.erase(p);
    } else {
        temporary_.insert(p);
        permanent_.erase(p);
    }
}

void AllowedPaths::remove(const std::filesystem::path& path) {
    const auto p = normalize(path);
    permanent_.erase(p);
    temporary_.erase(p);
}

void AllowedPaths::reset() {
    temporary_.clear();
    permanent_.clear();
}

std::set<std::filesystem::path> AllowedPaths::all() const {
    std::set<std::filesystem::path> result = temporary_;
    result.insert(permanent_.begin(), permanent_.end());
    return result;
}

bool AllowedPaths::is_allowed(const std::filesystem::path& path) const {
    const auto p = normalize(path);
    for (const auto& allowed : all()) {
        if (is_within(p, allowed)) {
            return true;
        }
    }
    return false;
}

void AllowedPaths::load_string(std::string_view yaml) {
    YAML::Node root;
    try {
        root = YAML::Load(std::string(yaml));
    } catch (const YAML::Exception& e) {
        throw Exception(ErrorKind::Config, std::string("cannot load permissions: ") + e.what());
    }

    std::set<std::filesystem::path> loaded;
    if (root && root.IsMap()) {
        const YAML::Node list = root["permanently_allowed"];
        if (list && !list.IsNull()) {
            if (!list.IsSequence()) {
                throw Exception(ErrorKind::Config, "'permanently_allowed' must be a list");
            }
            for (const auto& item : list) {
                if (!item.IsScalar()) {
                    throw Exception(ErrorKind::Config,
                                    "'permanently_allowed' must be a list of paths");
                }
                loaded.insert(absolute_path(platform::path_from_utf8(item.Scalar()),
                                            std::filesystem::path("/")));
            }
        }
    } else if (root && !root.IsNull()) {
        throw Exception(ErrorKind::Config, "the permissions file must contain a mapping");
    }

    permanent_ = std::move(loaded);
}

bool AllowedPaths::load_file(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return false;
    }

    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw Exception(ErrorKind::Config, "cannot open the permissions file",
                        platform::path_to_utf8(path));
    }
    const std::string content((std::istreambuf_iterator<char>(in)),
                              std::istreambuf_iterator<char>());
    try {
        load_string(content);
    } catch (const Exception& e) {
        Error err = e.error();
        err.path = platform::path_to_utf8(path);
        throw Exception(err);
    }
    return true;
}

std::string AllowedPaths::dump() const {
    YAML::Emitter out;
    out << YAML::BeginMap;
    out << YAML::Key << "permanently_allowed";
    out << YAML::Value << YAML::BeginSeq;
    for (const auto& p : permanent_) {
        out << platform::path_to_utf8(p);
    }
    out << YAML::EndSeq;
    out << YAML::EndMap;

    std::string text = out.c_str();
    text += "\n";
    return text;
}

void AllowedPaths::save_file(const std::filesystem::path& path) const {
    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            throw Exception(ErrorKind::Config, "cannot create directory: " + ec.message(),
                            platform::path_to_utf8(path.parent_path()));
        }
    }

    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file) {
        throw Exception(ErrorKind::Config, "cannot write the permissions file",
                        platform::path_to_utf8(path));
    }
    file << dump();
    if (!file) {
        throw Exception(ErrorKind::Config, "cannot write the permissions file",
                        platform::path_to_utf8(path));
    }
}

}  // namespace pathaction::access
