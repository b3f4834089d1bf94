// main.cpp
#include "CacheErrors.hpp"
#include "requirements.hpp"
#include <cerrno>
#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

void print_help() {
    std::cout << "Usage:\n"
              << "  kvstash [-c config.json] [-t tag] <command> [args]\n"
              << "\n"
              << "Commands:\n"
              << "  set <key> <value> [timeout]   Store value (timeout in seconds)\n"
              << "  get <key>                     Print value, exit 1 on miss\n"
              << "  delete <key>                  Remove key\n"
              << "  ttl <key>                     Seconds left, 'none' or -1\n"
              << "  touch <key> <timeout>         Replace expiry of a live key\n"
              << "  incr <key> [delta]            Add delta (default 1)\n"
              << "  decr <key> [delta]            Subtract delta (default 1)\n"
              << "  exists <key>                  Exit 0 when present\n"
              << "  keys                          List keys by insertion time\n"
              << "  len                           Approximate entry count\n"
              << "  clear                         Remove every entry of the tag\n"
              << "  drop                          Delete the tag's store\n"
              << "  -h, --help                    Show this help message\n";
}

// integer-looking text is stored as a number
static Value parse_value(const std::string& s) {
    if (!s.empty()) {
        char* end = nullptr;
        errno = 0;
        const long long n = std::strtoll(s.c_str(), &end, 10);
        if (errno == 0 && end && *end == '\0') return Value(n);
    }
    return Value(s);
}

static Timeout parse_timeout(const std::string& s) {
    if (s == "none") return std::nullopt;
    char* end = nullptr;
    const double t = std::strtod(s.c_str(), &end);
    if (!end || *end != '\0' || s.empty()) throw ValidationError("invalid timeout '" + s + "'");
    return t;
}

static int run_command(NamespaceRouter& router, const std::string& tag,
                       const std::string& cmd, const std::vector<std::string>& args) {
    auto need = [&](size_t n) {
        if (args.size() < n) throw ValidationError("'" + cmd + "' needs " + std::to_string(n) + " argument(s)");
    };

    if (cmd == "set") {
        need(2);
        const Timeout t = args.size() > 2 ? parse_timeout(args[2]) : Timeout();
        return router.set(parse_value(args[0]), parse_value(args[1]), t, tag) ? 0 : 1;
    }
    if (cmd == "get") {
        need(1);
        auto v = router.get(parse_value(args[0]), tag);
        if (!v) return 1;
        std::cout << v->to_string() << "\n";
        return 0;
    }
    if (cmd == "delete") {
        need(1);
        return router.erase(parse_value(args[0]), tag) ? 0 : 1;
    }
    if (cmd == "ttl") {
        need(1);
        auto t = router.ttl(parse_value(args[0]), tag);
        if (t) std::cout << *t << "\n";
        else std::cout << "none\n";
        return 0;
    }
    if (cmd == "touch") {
        need(2);
        return router.touch(parse_value(args[0]), parse_timeout(args[1]), tag) ? 0 : 1;
    }
    if (cmd == "incr" || cmd == "decr") {
        need(1);
        const Value delta = args.size() > 1 ? parse_value(args[1]) : Value(1);
        const Value key = parse_value(args[0]);
        const Value r = cmd == "incr" ? router.incr(key, delta, tag) : router.decr(key, delta, tag);
        std::cout << r.to_string() << "\n";
        return 0;
    }
    if (cmd == "exists") {
        need(1);
        return router.exists(parse_value(args[0]), tag) ? 0 : 1;
    }
    if (cmd == "keys") {
        for (const auto& k : router.keys(tag)) std::cout << k.to_string() << "\n";
        return 0;
    }
    if (cmd == "len") {
        std::cout << router.get_recipe(tag)->len() << "\n";
        return 0;
    }
    if (cmd == "clear") {
        router.get_recipe(tag)->clear();
        return 0;
    }
    if (cmd == "drop") {
        router.drop(tag);
        return 0;
    }

    std::cerr << "[Main] unknown command: " << cmd << "\n";
    print_help();
    return 2;
}

int main(int argc, char** argv) {
    std::string config_path;
    std::string tag = NamespaceRouter::kDefaultTag;
    std::vector<std::string> rest;

    for (int i = 1; i < argc; ++i) {
        const std::string a = argv[i];
        if (a == "-h" || a == "--help") {
            print_help();
            return 0;
        }
        if ((a == "-c" || a == "-t") && i + 1 < argc) {
            (a == "-c" ? config_path : tag) = argv[++i];
            continue;
        }
        rest.push_back(a);
    }
    if (rest.empty()) {
        print_help();
        return 2;
    }
    if (config_path.empty()) {
        const char* env = std::getenv("KVSTASH_CONFIG");
        if (env) config_path = env;
    }

    auto boot = Requirements::run(config_path);
    if (!boot.ok) {
        std::cerr << "[Main] aborted: " << boot.error << "\n";
        return 1;
    }

    const std::string cmd = rest.front();
    const std::vector<std::string> args(rest.begin() + 1, rest.end());
    try {
        return run_command(*boot.router, tag, cmd, args);
    } catch (const NotFoundError& e) {
        std::cerr << "[Main] " << e.what() << "\n";
        return 1;
    } catch (const CacheError& e) {
        std::cerr << "[Main] " << cmd << " failed: " << e.what() << "\n";
        return 2;
    }
}
