#include "commands/Args.hpp"

#include <cmath>
#include <stdexcept>

#include "match/Errors.hpp"

bool has_flag(int argc, char** argv, const std::string& key) {
    for (int i = 0; i < argc; ++i) {
        if (std::string(argv[i]) == key) return true;
    }
    return false;
}

std::string get_arg(int argc, char** argv, const std::string& key, const std::string& def) {
    for (int i = 0; i + 1 < argc; ++i) {
        if (std::string(argv[i]) == key) return std::string(argv[i + 1]);
    }
    return def;
}

int get_arg_int(int argc, char** argv, const std::string& key, int def) {
    const std::string s = get_arg(argc, argv, key, "");
    if (s.empty()) return def;

    size_t used = 0;
    int v = 0;
    try {
        v = std::stoi(s, &used);
    } catch (const std::exception&) {
        throw match::ValidationError(key + " expects an integer, got '" + s + "'");
    }
    if (used != s.size()) throw match::ValidationError(key + " expects an integer, got '" + s + "'");
    return v;
}

double get_arg_double(int argc, char** argv, const std::string& key, double def) {
    const std::string s = get_arg(argc, argv, key, "");
    if (s.empty()) return def;

    size_t used = 0;
    double v = 0.0;
    try {
        v = std::stod(s, &used);
    } catch (const std::exception&) {
        throw match::ValidationError(key + " expects a number, got '" + s + "'");
    }
    // stod accepts "nan" and "inf"
    if (used != s.size() || !std::isfinite(v)) {
        throw match::ValidationError(key + " expects a number, got '" + s + "'");
    }
    return v;
}
