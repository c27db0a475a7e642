#pragma once

#include <string>

// argv helpers shared by the subcommands. Numeric parsers throw
// match::ValidationError unless the whole value parses.
bool has_flag(int argc, char** argv, const std::string& key);
std::string get_arg(int argc, char** argv, const std::string& key, const std::string& def);
int get_arg_int(int argc, char** argv, const std::string& key, int def);
double get_arg_double(int argc, char** argv, const std::string& key, double def);
