#include "matreg/session/guarded_store.hpp"

namespace matreg::session {

using namespace matreg::core;

Status GuardedStore::admit(security::Permission p) noexcept {
    const Status s = require_permission(session_, p);
    if (is_ok(s)) {
        store_.set_actor(session_.principal());
    }
    return s;
}

Status GuardedStore::create(const Record& fields, RecordId* out_id) noexcept {
    const Status s = admit(security::Permission::Write);
    return is_ok(s) ? store_.create(fields, out_id) : s;
}

Status GuardedStore::read(RecordId id, std::optional<Record>* out) noexcept {
    const Status s = admit(security::Permission::Read);
    return is_ok(s) ? store_.read(id, out) : s;
}

Status GuardedStore::update(RecordId id, const Record& fields, bool* out_updated) noexcept {
    const Status s = admit(security::Permission::Write);
    return is_ok(s) ? store_.update(id, fields, out_updated) : s;
}

Status GuardedStore::remove(RecordId id, bool* out_removed) noexcept {
    const Status s = admit(security::Permission::Delete);
    return is_ok(s) ? store_.remove(id, out_removed) : s;
}

Status GuardedStore::find(const store::FindQuery& q, std::vector<Record>* out) noexcept {
    const Status s = admit(security::Permission::Read);
    return is_ok(s) ? store_.find(q, out) : s;
}

Status GuardedStore::count(const store::Criteria& where, u64* out) noexcept {
    const Status s = admit(security::Permission::Read);
    return is_ok(s) ? store_.count(where, out) : s;
}

Status GuardedStore::exists(const store::Criteria& where, bool* out) noexcept {
    const Status s = admit(security::Permission::Read);
    return is_ok(s) ? store_.exists(where, out) : s;
}

} // namespace matreg::session
