#include "cmd_check.h"
#include "cmd_run.h"

#include <iostream>
#include <string>

int main(int argc, char** argv) {
    if (argc < 2) {
        std::cerr << "reviser_cli <run|list|lint|test> ...\n";
        return 2;
    }
    std::string cmd = argv[1];
    if (cmd == "run") return cmd_run(argc, argv);
    if (cmd == "list") return cmd_list(argc, argv);
    if (cmd == "lint") return cmd_lint(argc, argv);
    if (cmd == "test") return cmd_test(argc, argv);
    std::cerr << "unknown command: " << cmd << "\n";
    return 2;
}
