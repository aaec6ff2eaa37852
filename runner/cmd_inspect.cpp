#include "commands.h"
#include "runner_utils.h"

#include "warden/job_store.h"
#include "warden/orchestrator.h"
#include "warden/serialization.h"

#include <iostream>
#include <string>
#include <vector>

using namespace warden;

int cmd_status(int argc, char** argv) {
    if (argc < 3) {
        std::cerr << "usage: warden_cli status <job_id>\n";
        return kExitUsage;
    }
    Services svc;
    int rc = open_services(&svc, false, StoreAccess::READ_ONLY, false);
    if (rc != kExitOk) return rc;

    auto job = svc.store->get(argv[2]);
    if (!job) {
        std::cerr << "job not found: " << argv[2] << "\n";
        return kExitJobFailed;
    }
    print_json(job_to_json(*job));
    return kExitOk;
}

int cmd_audit(int argc, char** argv) {
    Services svc;
    int rc = open_services(&svc, false, StoreAccess::READ_ONLY, false);
    if (rc != kExitOk) return rc;

    std::vector<TransitionRecord> records;
    if (argc >= 3) {
        if (!svc.store->get(argv[2])) {
            std::cerr << "job not found: " << argv[2] << "\n";
            return kExitJobFailed;
        }
        records = svc.store->audit(argv[2]);
    } else {
        records = svc.store->audit_all();
    }
    for (const auto& rec : records) print_json(record_to_json(rec));
    return kExitOk;
}

int cmd_verify(int argc, char** argv) {
    (void)argc;
    (void)argv;
    std::string warn;
    Settings s = load_settings(&warn);
    ChainReport rep = verify_audit_chain(s.state_dir / "jobs.jsonl");

    json_object* o = json_object_new_object();
    json_object_object_add(o, "ok", json_object_new_boolean(rep.ok));
    json_object_object_add(o, "records", json_object_new_int64(static_cast<int64_t>(rep.records)));
    if (!rep.ok) {
        json_object_object_add(o, "first_bad_line", json_object_new_int64(static_cast<int64_t>(rep.first_bad_line)));
        json_object_object_add(o, "error", json_object_new_string(rep.error.c_str()));
    }
    print_json(o);
    return rep.ok ? kExitOk : kExitJobFailed;
}

int cmd_recover(int argc, char** argv) {
    (void)argc;
    (void)argv;
    Services svc;
    int rc = open_services(&svc, false, StoreAccess::OWNER, true);
    if (rc != kExitOk) return rc;

    // recover() never consults the policy; an unloaded policy store is enough.
    PolicyStore unused_policy(svc.settings.policy_file);
    Orchestrator orch(unused_policy, *svc.store, *svc.backend, OrchestratorConfig{0});
    RecoveryReport rep = orch.recover();

    json_object* o = json_object_new_object();
    json_object_object_add(o, "orphaned", json_object_new_int64(static_cast<int64_t>(rep.orphaned)));
    json_object_object_add(o, "pending", json_object_new_int64(static_cast<int64_t>(rep.requeued)));
    print_json(o);
    return kExitOk;
}

int cmd_check_policy(int argc, char** argv) {
    if (argc < 3) {
        std::cerr << "usage: warden_cli check-policy <policy.json>\n";
        return kExitUsage;
    }
    try {
        Policy p = load_policy_file(argv[2]);
        json_object* o = json_object_new_object();
        json_object* imgs = json_object_new_array();
        for (const auto& img : p.allowed_images) json_object_array_add(imgs, json_object_new_string(img.c_str()));
        json_object_object_add(o, "allowed_images", imgs);
        json_object_object_add(o, "cpu_limit", json_object_new_double(p.cpu_limit));
        json_object_object_add(o, "memory_limit_bytes", json_object_new_int64(static_cast<int64_t>(p.memory_limit_bytes)));
        json_object_object_add(o, "timeout_ms", json_object_new_int64(p.timeout_ms));
        json_object_object_add(o, "network_allowed", json_object_new_boolean(p.network_allowed));
        print_json(o);
    } catch (const PolicyError& e) {
        std::cerr << "policy error: " << e.what() << "\n";
        return kExitStartup;
    }
    return kExitOk;
}
