#include "warden/job_store.h"
#include "warden/hash.h"
#include "warden/json_util.h"
#include "warden/log.h"
#include "warden/serialization.h"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fstream>

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace warden {

namespace {

const char* const kWalName = "jobs.jsonl";
const char* const kLockName = "LOCK";
const char* const kPayloadDir = "payloads";
const char* const kTypeCreate = "CREATE";
const char* const kTypeTransition = "TRANSITION";

std::string genesis_hash() {
    return std::string(64, '0');
}

bool valid_job_id(const std::string& id) {
    if (id.empty() || id.size() > 128) return false;
    for (char c : id) {
        bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '-' || c == '_';
        if (!ok) return false;
    }
    return true;
}

// Hash input for a record: the canonical form without its chain fields.
std::string chain_body(json_object* rec) {
    json::Doc copy;
    if (json_object_deep_copy(rec, &copy.root, nullptr) != 0 || !copy) return "";
    json_object_object_del(copy.root, "chain_hash");
    json_object_object_del(copy.root, "chain_prev");
    return json::canonical(copy.root);
}

bool write_file_atomic(const fs::path& path, const std::string& data, bool do_fsync, std::string* err) {
    fs::path tmp = path;
    tmp += ".tmp";
    int fd = ::open(tmp.c_str(), O_CREAT | O_TRUNC | O_WRONLY | O_CLOEXEC, 0600);
    if (fd < 0) {
        *err = "open " + tmp.string() + ": " + std::strerror(errno);
        return false;
    }
    size_t off = 0;
    while (off < data.size()) {
        ssize_t w = ::write(fd, data.data() + off, data.size() - off);
        if (w < 0) {
            if (errno == EINTR) continue;
            *err = "write " + tmp.string() + ": " + std::strerror(errno);
            ::close(fd);
            return false;
        }
        off += static_cast<size_t>(w);
    }
    if (do_fsync && ::fsync(fd) != 0) {
        *err = std::string("fsync: ") + std::strerror(errno);
        ::close(fd);
        return false;
    }
    if (::close(fd) != 0) {
        *err = std::string("close: ") + std::strerror(errno);
        return false;
    }
    std::error_code ec;
    fs::rename(tmp, path, ec);
    if (ec) {
        *err = "rename " + tmp.string() + ": " + ec.message();
        return false;
    }
    return true;
}

} // namespace

const char* transition_status_str(TransitionStatus s) {
    switch (s) {
        case TransitionStatus::OK:                 return "ok";
        case TransitionStatus::INVALID_TRANSITION: return "invalid transition";
        case TransitionStatus::NOT_FOUND:          return "not found";
        case TransitionStatus::STORAGE_ERROR:      return "storage error";
    }
    return "storage error";
}

JobStore::JobStore(JobStoreOptions opts)
    : opts_(std::move(opts)), wal_(opts_.state_dir / kWalName), chain_prev_(genesis_hash()) {
    if (opts_.read_only) {
        replay();
        return;
    }

    std::error_code ec;
    fs::create_directories(opts_.state_dir / kPayloadDir, ec);
    if (ec) throw StoreError("cannot create state directory " + opts_.state_dir.string() + ": " + ec.message());

    lock_dir();
    try {
        replay();
    } catch (...) {
        ::close(lock_fd_);
        lock_fd_ = -1;
        throw;
    }

    wal_.set_fsync(opts_.fsync);
    std::string err = wal_.open();
    if (!err.empty()) {
        ::close(lock_fd_);
        lock_fd_ = -1;
        throw StoreError("cannot open " + wal_path().string() + ": " + err);
    }
}

JobStore::~JobStore() {
    if (lock_fd_ >= 0) ::close(lock_fd_);
}

fs::path JobStore::wal_path() const {
    return opts_.state_dir / kWalName;
}

void JobStore::lock_dir() {
    const fs::path p = opts_.state_dir / kLockName;
    lock_fd_ = ::open(p.c_str(), O_CREAT | O_RDWR | O_CLOEXEC, 0600);
    if (lock_fd_ < 0) throw StoreError("open " + p.string() + ": " + std::strerror(errno));
    if (::flock(lock_fd_, LOCK_EX | LOCK_NB) != 0) {
        int e = errno;
        ::close(lock_fd_);
        lock_fd_ = -1;
        if (e == EWOULDBLOCK) {
            throw StoreError("state directory " + opts_.state_dir.string() + " is owned by another process");
        }
        throw StoreError("flock " + p.string() + ": " + std::strerror(e));
    }
}

void JobStore::replay() {
    std::vector<WalLine> lines;
    std::string err = read_wal_lines(wal_path(), &lines);
    if (!err.empty()) throw StoreError(err);

    size_t offset = 0;
    size_t applied = 0;
    bool chain_warned = false;
    for (const auto& l : lines) {
        std::string perr;
        json::Doc d = json::parse(l.text, &perr);
        if (!d || !json_object_is_type(d.root, json_type_object)) {
            if (!l.complete && opts_.read_only) {
                // The owner may be mid-append.
                log_debug("store", "ignoring incomplete record at line " + std::to_string(l.line_no));
                break;
            }
            if (!l.complete) {
                log_warn("store", "ignoring torn record at line " + std::to_string(l.line_no) + " of " + wal_path().string());
                std::error_code ec;
                fs::resize_file(wal_path(), offset, ec);
                if (ec) throw StoreError("cannot drop torn record: " + ec.message());
                break;
            }
            throw StoreError("corrupt record at line " + std::to_string(l.line_no) + ": " + perr);
        }
        offset += l.text.size() + 1;

        auto prev = json::get_string(d.root, "chain_prev").value_or("");
        auto hash = json::get_string(d.root, "chain_hash").value_or("");
        if (!chain_warned && (prev != chain_prev_ || hash != hash::sha256_hex(prev + chain_body(d.root)))) {
            log_error("store", "audit chain broken at line " + std::to_string(l.line_no) + "; run `warden_cli verify`");
            chain_warned = true;
        }
        chain_prev_ = hash;

        auto type = json::get_string(d.root, "type").value_or("");
        if (type == kTypeCreate) {
            auto e = std::make_shared<Entry>();
            e->job.job_id = json::get_string(d.root, "job_id").value_or("");
            e->job.payload_ref = json::get_string(d.root, "payload_ref").value_or("");
            e->job.image = json::get_string(d.root, "image").value_or("");
            e->job.priority = static_cast<int>(json::get_int(d.root, "priority").value_or(5000));
            e->job.created_at_ms = json::get_int(d.root, "at_ms").value_or(0);
            e->job.state = State::QUEUED;
            if (e->job.job_id.empty() || jobs_.count(e->job.job_id)) {
                log_warn("store", "skipping duplicate or anonymous CREATE at line " + std::to_string(l.line_no));
                continue;
            }
            jobs_.emplace(e->job.job_id, std::move(e));
            applied++;
        } else if (type == kTypeTransition) {
            TransitionRecord rec;
            if (!record_from_json(d.root, &rec)) {
                throw StoreError("malformed transition at line " + std::to_string(l.line_no));
            }
            auto it = jobs_.find(rec.job_id);
            if (it == jobs_.end() || it->second->job.state != rec.from || !transition_allowed(rec.from, rec.to)) {
                log_warn("store", "skipping inconsistent transition at line " + std::to_string(l.line_no) +
                         " for job " + rec.job_id);
                continue;
            }
            Entry& e = *it->second;
            e.job.state = rec.to;
            if (json_object* r = json::member(d.root, "result")) {
                Result res;
                if (!result_from_json(r, &res)) {
                    throw StoreError("malformed result at line " + std::to_string(l.line_no));
                }
                e.job.result = std::move(res);
            }
            e.history.push_back(std::move(rec));
            applied++;
        } else {
            log_warn("store", "unknown record type '" + type + "' at line " + std::to_string(l.line_no));
        }
    }
    if (applied > 0) {
        log_info("store", "replayed " + std::to_string(applied) + " records, " + std::to_string(jobs_.size()) + " jobs");
    }
}

std::string JobStore::append_chained(json_object* rec) {
    std::lock_guard<std::mutex> lk(chain_mu_);
    const std::string hash = hash::sha256_hex(chain_prev_ + json::canonical(rec));
    json_object_object_add(rec, "chain_prev", json::new_string(chain_prev_));
    json_object_object_add(rec, "chain_hash", json::new_string(hash));
    std::string err = wal_.append_json_line(json::canonical(rec));
    if (err.empty()) chain_prev_ = hash;
    return err;
}

std::shared_ptr<JobStore::Entry> JobStore::find(const std::string& job_id) const {
    std::shared_lock<std::shared_mutex> lk(map_mu_);
    auto it = jobs_.find(job_id);
    return it == jobs_.end() ? nullptr : it->second;
}

std::string JobStore::put_payload(const std::string& job_id, const std::string& payload, std::string* err) {
    if (opts_.read_only) {
        if (err) *err = "job store is read-only";
        return "";
    }
    if (!valid_job_id(job_id)) {
        if (err) *err = "invalid job id";
        return "";
    }
    const fs::path p = opts_.state_dir / kPayloadDir / job_id;
    std::string e;
    if (!write_file_atomic(p, payload, opts_.fsync, &e)) {
        if (err) *err = e;
        return "";
    }
    return p.string();
}

bool JobStore::read_payload(const Job& job, std::string* out, std::string* err) const {
    std::ifstream in(job.payload_ref, std::ios::binary);
    if (!in) {
        if (err) *err = "cannot open payload " + job.payload_ref;
        return false;
    }
    out->assign((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) {
        if (err) *err = "read failed: " + job.payload_ref;
        return false;
    }
    return true;
}

std::optional<Job> JobStore::create(const std::string& job_id, const std::string& payload_ref,
                                    const std::string& image, int priority, std::string* err) {
    if (opts_.read_only) {
        if (err) *err = "job store is read-only";
        return std::nullopt;
    }
    if (!valid_job_id(job_id)) {
        if (err) *err = "invalid job id";
        return std::nullopt;
    }

    auto e = std::make_shared<Entry>();
    e->job.job_id = job_id;
    e->job.payload_ref = payload_ref;
    e->job.image = image;
    e->job.priority = priority;
    e->job.created_at_ms = now_ms();
    e->job.state = State::QUEUED;

    // Reserve the id so a concurrent create of the same id cannot write a
    // second CREATE record; the append itself runs without the map lock.
    {
        std::unique_lock<std::shared_mutex> lk(map_mu_);
        if (jobs_.count(job_id) || !reserved_.insert(job_id).second) {
            if (err) *err = "duplicate job id " + job_id;
            return std::nullopt;
        }
    }

    json::Doc rec(json_object_new_object());
    json_object_object_add(rec.root, "type", json_object_new_string(kTypeCreate));
    json_object_object_add(rec.root, "job_id", json::new_string(job_id));
    json_object_object_add(rec.root, "payload_ref", json::new_string(payload_ref));
    json_object_object_add(rec.root, "image", json::new_string(image));
    json_object_object_add(rec.root, "priority", json_object_new_int(priority));
    json_object_object_add(rec.root, "at_ms", json_object_new_int64(e->job.created_at_ms));
    std::string werr = append_chained(rec.root);

    Job out = e->job;
    std::unique_lock<std::shared_mutex> lk(map_mu_);
    reserved_.erase(job_id);
    if (!werr.empty()) {
        if (err) *err = "wal append: " + werr;
        return std::nullopt;
    }
    jobs_.emplace(job_id, std::move(e));
    return out;
}

TransitionStatus JobStore::transition(const std::string& job_id, State to,
                                      const std::optional<Result>& result,
                                      const std::string& detail) {
    auto e = find(job_id);
    if (!e) return TransitionStatus::NOT_FOUND;
    if (opts_.read_only) return TransitionStatus::STORAGE_ERROR;

    std::lock_guard<std::mutex> lk(e->mu);
    const State from = e->job.state;
    if (!transition_allowed(from, to)) {
        log_debug("store", "rejected transition " + job_id + " " + state_to_str(from) + " -> " + state_to_str(to));
        return TransitionStatus::INVALID_TRANSITION;
    }

    TransitionRecord rec;
    rec.job_id = job_id;
    rec.from = from;
    rec.to = to;
    rec.at_ms = now_ms();
    rec.detail = detail;

    json::Doc line(record_to_json(rec));
    json_object_object_add(line.root, "type", json_object_new_string(kTypeTransition));
    if (result) json_object_object_add(line.root, "result", result_to_json(*result));
    std::string werr = append_chained(line.root);
    if (!werr.empty()) {
        log_error("store", "wal append failed for " + job_id + ": " + werr);
        return TransitionStatus::STORAGE_ERROR;
    }

    e->job.state = to;
    if (result) e->job.result = *result;
    e->history.push_back(std::move(rec));
    return TransitionStatus::OK;
}

std::optional<Job> JobStore::get(const std::string& job_id) const {
    auto e = find(job_id);
    if (!e) return std::nullopt;
    std::lock_guard<std::mutex> lk(e->mu);
    return e->job;
}

std::vector<Job> JobStore::list_all() const {
    std::vector<std::shared_ptr<Entry>> entries;
    {
        std::shared_lock<std::shared_mutex> lk(map_mu_);
        entries.reserve(jobs_.size());
        for (const auto& kv : jobs_) entries.push_back(kv.second);
    }
    std::vector<Job> out;
    out.reserve(entries.size());
    for (const auto& e : entries) {
        std::lock_guard<std::mutex> lk(e->mu);
        out.push_back(e->job);
    }
    std::sort(out.begin(), out.end(), [](const Job& a, const Job& b) {
        if (a.created_at_ms != b.created_at_ms) return a.created_at_ms < b.created_at_ms;
        return a.job_id < b.job_id;
    });
    return out;
}

std::vector<Job> JobStore::list(State state) const {
    std::vector<Job> all = list_all();
    std::vector<Job> out;
    for (auto& j : all) {
        if (j.state == state) out.push_back(std::move(j));
    }
    return out;
}

std::vector<TransitionRecord> JobStore::audit(const std::string& job_id) const {
    auto e = find(job_id);
    if (!e) return {};
    std::lock_guard<std::mutex> lk(e->mu);
    return e->history;
}

std::vector<TransitionRecord> JobStore::audit_all() const {
    std::vector<WalLine> lines;
    std::string err = read_wal_lines(wal_path(), &lines);
    if (!err.empty()) {
        log_warn("store", "audit read failed: " + err);
        return {};
    }
    std::vector<TransitionRecord> out;
    for (const auto& l : lines) {
        json::Doc d = json::parse(l.text);
        if (!d) continue;
        if (json::get_string(d.root, "type").value_or("") != kTypeTransition) continue;
        TransitionRecord rec;
        if (record_from_json(d.root, &rec)) out.push_back(std::move(rec));
    }
    return out;
}

ChainReport verify_audit_chain(const fs::path& wal_path) {
    ChainReport rep;
    std::vector<WalLine> lines;
    std::string err = read_wal_lines(wal_path, &lines);
    if (!err.empty()) {
        rep.ok = false;
        rep.error = err;
        return rep;
    }

    std::string prev = genesis_hash();
    for (const auto& l : lines) {
        std::string perr;
        json::Doc d = json::parse(l.text, &perr);
        if (!d || !json_object_is_type(d.root, json_type_object)) {
            if (!l.complete) break;
            rep.ok = false;
            rep.first_bad_line = l.line_no;
            rep.error = "unparsable record: " + perr;
            return rep;
        }
        auto chain_prev = json::get_string(d.root, "chain_prev");
        auto chain_hash = json::get_string(d.root, "chain_hash");
        if (!chain_prev || !chain_hash) {
            rep.ok = false;
            rep.first_bad_line = l.line_no;
            rep.error = "missing chain fields";
            return rep;
        }
        if (*chain_prev != prev) {
            rep.ok = false;
            rep.first_bad_line = l.line_no;
            rep.error = "chain_prev does not match previous record";
            return rep;
        }
        if (*chain_hash != hash::sha256_hex(prev + chain_body(d.root))) {
            rep.ok = false;
            rep.first_bad_line = l.line_no;
            rep.error = "chain_hash mismatch (record modified)";
            return rep;
        }
        prev = *chain_hash;
        rep.records++;
    }
    return rep;
}

} // namespace warden
