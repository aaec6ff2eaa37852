#include "commands.h"
#include "runner_utils.h"

#include "warden/config.h"

#include <iostream>
#include <string>

int main(int argc, char** argv) {
    warden::apply_profile_defaults(warden::detect_profile());

    if (argc < 2) {
        std::cerr << "warden_cli <run|submit|status|audit|verify|recover|check-policy> ...\n";
        return warden::kExitUsage;
    }
    std::string cmd = argv[1];
    if (cmd == "run") return cmd_run(argc, argv);
    if (cmd == "submit") return cmd_submit(argc, argv);
    if (cmd == "status") return cmd_status(argc, argv);
    if (cmd == "audit") return cmd_audit(argc, argv);
    if (cmd == "verify") return cmd_verify(argc, argv);
    if (cmd == "recover") return cmd_recover(argc, argv);
    if (cmd == "check-policy") return cmd_check_policy(argc, argv);
    std::cerr << "unknown command: " << cmd << "\n";
    return warden::kExitUsage;
}
