#pragma once

#include "types.h"

#include <json-c/json.h>

#include <string>

namespace warden {

// --- Result / Job / TransitionRecord <-> JSON (json-c) ---
// *_to_json return a new reference owned by the caller.

json_object* result_to_json(const Result& r);
bool result_from_json(json_object* o, Result* out);

json_object* job_to_json(const Job& j);
bool job_from_json(json_object* o, Job* out);

json_object* record_to_json(const TransitionRecord& rec);
bool record_from_json(json_object* o, TransitionRecord* out);

std::string json_quote(const std::string& s);

} // namespace warden
