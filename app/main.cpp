#include "commands/allocate.hpp"
#include "commands/analytics.hpp"
#include "commands/demo.hpp"
#include "commands/recommend.hpp"

#include <iostream>
#include <string>

static int print_usage() {
    std::cerr
        << "usage:\n"
        << "  intern-match recommend --candidate <path> --internships <path> [args]\n"
        << "  intern-match report --candidate <path> --internships <path> [args]\n"
        << "  intern-match allocate --internships <path> --requests <path> [args]\n"
        << "  intern-match analytics --candidates <path> --internships <path> [args]\n"
        << "  intern-match demo [--topk <n>]\n"
        << "  intern-match help\n"
        << "\n"
        << "  intern-match <command> --help   for command options\n";
    return 1;
}

int main(int argc, char** argv) {
    if (argc < 2) return print_usage();

    const std::string cmd = argv[1];

    if (cmd == "help" || cmd == "--help") {
        return print_usage();
    }

    if (cmd == "recommend") return cmd_recommend(argc - 1, argv + 1);
    if (cmd == "report")    return cmd_report(argc - 1, argv + 1);
    if (cmd == "allocate")  return cmd_allocate(argc - 1, argv + 1);
    if (cmd == "analytics") return cmd_analytics(argc - 1, argv + 1);
    if (cmd == "demo")      return cmd_demo(argc - 1, argv + 1);

    std::cerr << "unknown command: " << cmd << "\n";
    return print_usage();
}
