#include "cmd_client.h"
#include "cmd_serve.h"

#include <iostream>
#include <string>

int main(int argc, char** argv) {
    if (argc < 2) {
        std::cerr << "sheetrun_cli <serve|submit|resubmit|status|list|artifact|output> ...\n";
        return 2;
    }
    std::string cmd = argv[1];
    if (cmd == "serve") return cmd_serve(argc, argv);
    if (cmd == "submit") return cmd_submit(argc, argv);
    if (cmd == "resubmit") return cmd_resubmit(argc, argv);
    if (cmd == "status") return cmd_status(argc, argv);
    if (cmd == "list") return cmd_list(argc, argv);
    if (cmd == "artifact") return cmd_artifact(argc, argv);
    if (cmd == "output") return cmd_output(argc, argv);
    std::cerr << "unknown command: " << cmd << "\n";
    return 2;
}
