#include "warden/serialization.h"
#include "warden/json_util.h"

namespace warden {

std::string json_quote(const std::string& s) {
    json::Doc d(json::new_string(s));
    if (!d) return "\"\"";
    return json::to_string(d.root);
}

json_object* result_to_json(const Result& r) {
    json_object* o = json_object_new_object();
    json_object_object_add(o, "allowed", json_object_new_boolean(r.allowed));
    json_object_object_add(o, "exit_code", json_object_new_int(r.exit_code));
    json_object_object_add(o, "stdout", json::new_string(r.stdout_data));
    json_object_object_add(o, "stderr", json::new_string(r.stderr_data));
    json_object_object_add(o, "reason", json_object_new_string(reason_to_str(r.reason)));
    json_object_object_add(o, "truncated", json_object_new_boolean(r.truncated));
    return o;
}

bool result_from_json(json_object* o, Result* out) {
    if (!o || !json_object_is_type(o, json_type_object) || !out) return false;
    auto allowed = json::get_bool(o, "allowed");
    auto exit_code = json::get_int(o, "exit_code");
    auto reason_s = json::get_string(o, "reason");
    if (!allowed || !exit_code || !reason_s) return false;
    auto reason = reason_from_str(*reason_s);
    if (!reason) return false;

    Result r;
    r.allowed = *allowed;
    r.exit_code = static_cast<int>(*exit_code);
    r.reason = *reason;
    r.stdout_data = json::get_string(o, "stdout").value_or("");
    r.stderr_data = json::get_string(o, "stderr").value_or("");
    r.truncated = json::get_bool(o, "truncated").value_or(false);
    *out = std::move(r);
    return true;
}

json_object* job_to_json(const Job& j) {
    json_object* o = json_object_new_object();
    json_object_object_add(o, "job_id", json::new_string(j.job_id));
    json_object_object_add(o, "payload_ref", json::new_string(j.payload_ref));
    json_object_object_add(o, "image", json::new_string(j.image));
    json_object_object_add(o, "created_at", json_object_new_string(iso8601_ms(j.created_at_ms).c_str()));
    json_object_object_add(o, "created_at_ms", json_object_new_int64(j.created_at_ms));
    json_object_object_add(o, "priority", json_object_new_int(j.priority));
    json_object_object_add(o, "state", json_object_new_string(state_to_str(j.state)));
    if (j.result) json_object_object_add(o, "result", result_to_json(*j.result));
    return o;
}

bool job_from_json(json_object* o, Job* out) {
    if (!o || !json_object_is_type(o, json_type_object) || !out) return false;
    auto id = json::get_string(o, "job_id");
    auto image = json::get_string(o, "image");
    auto state_s = json::get_string(o, "state");
    if (!id || !image || !state_s) return false;
    auto state = state_from_str(*state_s);
    if (!state) return false;

    Job j;
    j.job_id = *id;
    j.image = *image;
    j.state = *state;
    j.payload_ref = json::get_string(o, "payload_ref").value_or("");
    j.created_at_ms = json::get_int(o, "created_at_ms").value_or(0);
    j.priority = static_cast<int>(json::get_int(o, "priority").value_or(5000));
    if (json_object* r = json::member(o, "result")) {
        Result res;
        if (!result_from_json(r, &res)) return false;
        j.result = std::move(res);
    }
    *out = std::move(j);
    return true;
}

json_object* record_to_json(const TransitionRecord& rec) {
    json_object* o = json_object_new_object();
    json_object_object_add(o, "job_id", json::new_string(rec.job_id));
    json_object_object_add(o, "from_state", json_object_new_string(state_to_str(rec.from)));
    json_object_object_add(o, "to_state", json_object_new_string(state_to_str(rec.to)));
    json_object_object_add(o, "at", json_object_new_string(iso8601_ms(rec.at_ms).c_str()));
    json_object_object_add(o, "at_ms", json_object_new_int64(rec.at_ms));
    if (!rec.detail.empty()) json_object_object_add(o, "detail", json::new_string(rec.detail));
    return o;
}

bool record_from_json(json_object* o, TransitionRecord* out) {
    if (!o || !json_object_is_type(o, json_type_object) || !out) return false;
    auto id = json::get_string(o, "job_id");
    auto from_s = json::get_string(o, "from_state");
    auto to_s = json::get_string(o, "to_state");
    auto at = json::get_int(o, "at_ms");
    if (!id || !from_s || !to_s || !at) return false;
    auto from = state_from_str(*from_s);
    auto to = state_from_str(*to_s);
    if (!from || !to) return false;

    TransitionRecord rec;
    rec.job_id = *id;
    rec.from = *from;
    rec.to = *to;
    rec.at_ms = *at;
    rec.detail = json::get_string(o, "detail").value_or("");
    *out = std::move(rec);
    return true;
}

} // namespace warden
