#include "commands.h"
#include "runner_utils.h"

#include "warden/log.h"
#include "warden/orchestrator.h"
#include "warden/serialization.h"

#include <iostream>
#include <stdexcept>
#include <string>

using namespace warden;

namespace {

struct SubmitArgs {
    std::string code;
    std::string image;
    int priority{kDefaultPriority};
};

// --code <file|-> --image <image> [--priority N]
int parse_submit_args(int argc, char** argv, const char* usage, SubmitArgs* out) {
    auto code_path = flag_value(argc, argv, 2, "--code");
    auto image = flag_value(argc, argv, 2, "--image");
    if (!code_path || !image || image->empty()) {
        std::cerr << usage;
        return kExitUsage;
    }
    if (auto p = flag_value(argc, argv, 2, "--priority")) {
        try {
            out->priority = std::stoi(*p);
        } catch (const std::exception&) {
            std::cerr << "invalid --priority: " << *p << "\n";
            return kExitUsage;
        }
    }
    try {
        out->code = slurp(*code_path);
    } catch (const std::exception& e) {
        std::cerr << e.what() << "\n";
        return kExitUsage;
    }
    out->image = *image;
    return kExitOk;
}

// Starts an orchestrator (recovery first), submits one job and waits for it.
int submit_and_wait(const SubmitArgs& args, bool print_full_job) {
    Services svc;
    int rc = open_services(&svc, true, StoreAccess::OWNER, true);
    if (rc != kExitOk) return rc;

    Orchestrator orch(*svc.policy, *svc.store, *svc.backend, OrchestratorConfig{svc.settings.workers});
    RecoveryReport rep = orch.start();
    if (rep.orphaned > 0) {
        log_warn("cli", "reconciled " + std::to_string(rep.orphaned) + " orphaned jobs");
    }

    std::string err;
    auto job_id = orch.submit(args.code, args.image, args.priority, &err);
    if (!job_id) {
        log_error("cli", "submit failed: " + err);
        return kExitJobFailed;
    }
    if (!print_full_job) {
        json_object* o = json_object_new_object();
        json_object_object_add(o, "job_id", json_object_new_string(job_id->c_str()));
        print_json(o);
    }

    auto job = orch.wait(*job_id);
    orch.stop();
    if (!job) {
        log_error("cli", "job " + *job_id + " vanished from the store");
        return kExitJobFailed;
    }
    if (!print_full_job) return kExitOk;

    print_json(job_to_json(*job));
    return exit_code_for(*job);
}

} // namespace

int cmd_run(int argc, char** argv) {
    SubmitArgs args;
    int rc = parse_submit_args(argc, argv,
        "usage: warden_cli run --code <file|-> --image <image> [--priority 0..9999]\n", &args);
    if (rc != kExitOk) return rc;
    return submit_and_wait(args, true);
}

int cmd_submit(int argc, char** argv) {
    SubmitArgs args;
    int rc = parse_submit_args(argc, argv,
        "usage: warden_cli submit --code <file|-> --image <image> [--priority 0..9999]\n", &args);
    if (rc != kExitOk) return rc;
    return submit_and_wait(args, false);
}
