#pragma once

#include <optional>
#include <vector>

#include "matreg/core/errors.hpp"
#include "matreg/core/types.hpp"
#include "matreg/core/value.hpp"
#include "matreg/db/connection.hpp"
#include "matreg/db/schema.hpp"
#include "matreg/session/session.hpp"
#include "matreg/store/record_store.hpp"

namespace matreg::session {
    using u64 = matreg::core::u64;

    // RecordStore gated by a Session: reads need Read, create and update need
    // Write, delete needs Delete. The session's principal is the audit actor,
    // looked up on every call so a logout takes effect immediately.
    class GuardedStore {
    public:
        GuardedStore(db::Connection& conn, const db::TableSpec& table, const Session& session) noexcept
            : store_(conn, table), session_(session) {}

        [[nodiscard]] matreg::core::Status create(const matreg::core::Record& fields,
            matreg::core::RecordId* out_id) noexcept;
        [[nodiscard]] matreg::core::Status read(matreg::core::RecordId id,
            std::optional<matreg::core::Record>* out) noexcept;
        [[nodiscard]] matreg::core::Status update(matreg::core::RecordId id,
            const matreg::core::Record& fields,
            bool* out_updated) noexcept;
        [[nodiscard]] matreg::core::Status remove(matreg::core::RecordId id, bool* out_removed) noexcept;
        [[nodiscard]] matreg::core::Status find(const store::FindQuery& q,
            std::vector<matreg::core::Record>* out) noexcept;
        [[nodiscard]] matreg::core::Status count(const store::Criteria& where, u64* out) noexcept;
        [[nodiscard]] matreg::core::Status exists(const store::Criteria& where, bool* out) noexcept;

    private:
        [[nodiscard]] matreg::core::Status admit(security::Permission p) noexcept;

        store::RecordStore store_;
        const Session& session_;
    };

} // namespace matreg::session
