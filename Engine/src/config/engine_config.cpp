#include <config/engine_config.hpp>
#include <core/errors.hpp>
#include <cstdlib>
#include <cerrno>
#include <climits>
#include <sstream>

namespace Lexigraph {

namespace {

std::optional<std::string> env(const char* name) {
    const char* value = std::getenv(name);
    if (!value || *value == '\0') return std::nullopt;
    return std::string(value);
}

// Single-quote a conninfo value, escaping \ and '
std::string quote(const std::string& value) {
    std::string out = "'";
    for (char c : value) {
        if (c == '\\' || c == '\'') out.push_back('\\');
        out.push_back(c);
    }
    out.push_back('\'');
    return out;
}

void override_int(int& field, const char* name) {
    if (auto value = env(name)) {
        field = parse_int(*value, name);
    }
}

} // namespace

int parse_int(const std::string& text, const std::string& what) {
    if (text.empty()) {
        throw InvalidArgumentError(what + ": expected an integer, got an empty value");
    }

    errno = 0;
    char* end = nullptr;
    long value = std::strtol(text.c_str(), &end, 10);

    if (errno == ERANGE || value < INT_MIN || value > INT_MAX) {
        throw InvalidArgumentError(what + ": value out of range: " + text);
    }
    if (end == text.c_str() || *end != '\0') {
        throw InvalidArgumentError(what + ": expected an integer, got '" + text + "'");
    }
    return static_cast<int>(value);
}

DatabaseConfig DatabaseConfig::from_env() {
    DatabaseConfig config;

    config.url = env("LEXIGRAPH_DB_URL");
    if (auto v = env("PGHOST")) config.host = *v;
    if (auto v = env("PGPORT")) config.port = *v;
    if (auto v = env("PGDATABASE")) config.dbname = *v;
    if (auto v = env("PGUSER")) config.user = *v;
    config.password = env("PGPASSWORD");

    return config;
}

std::string DatabaseConfig::conninfo() const {
    if (url) return *url;

    std::ostringstream out;
    out << "host=" << quote(host) << " ";
    out << "port=" << quote(port) << " ";
    out << "dbname=" << quote(dbname) << " ";
    out << "user=" << quote(user);

    if (password) {
        out << " password=" << quote(*password);
    }

    out << " application_name='lexigraph'";
    return out.str();
}

TraversalConfig TraversalConfig::from_env() {
    TraversalConfig config;

    override_int(config.max_paths, "LEXIGRAPH_MAX_PATHS");
    override_int(config.max_length, "LEXIGRAPH_MAX_LENGTH");
    override_int(config.max_level, "LEXIGRAPH_MAX_LEVEL");
    override_int(config.max_nodes, "LEXIGRAPH_MAX_NODES");
    override_int(config.max_edges_per_node, "LEXIGRAPH_MAX_EDGES");
    override_int(config.max_paths_limit, "LEXIGRAPH_MAX_PATHS_LIMIT");
    override_int(config.max_length_limit, "LEXIGRAPH_MAX_LENGTH_LIMIT");

    return config;
}

} // namespace Lexigraph
