#pragma once

#include <optional>
#include <vector>

#include "matreg/core/errors.hpp"
#include "matreg/core/types.hpp"
#include "matreg/core/value.hpp"
#include "matreg/db/connection.hpp"
#include "matreg/db/schema.hpp"
#include "matreg/store/query.hpp"

namespace matreg::store {
    using u64 = matreg::core::u64;

    // Generic CRUD over one table. Every mutation with a valid actor writes
    // exactly one audit entry in the same transaction as the change.
    //
    // The store borrows conn and must not outlive it. Like the connection, an
    // instance belongs to a single thread.
    class RecordStore {
    public:
        RecordStore(db::Connection& conn,
                    const db::TableSpec& table,
                    matreg::core::PrincipalId actor = matreg::core::PrincipalId::invalid()) noexcept
            : conn_(conn), table_(table), actor_(actor) {}

        [[nodiscard]] const db::TableSpec& table() const noexcept { return table_; }
        [[nodiscard]] matreg::core::PrincipalId actor() const noexcept { return actor_; }
        void set_actor(matreg::core::PrincipalId actor) noexcept { actor_ = actor; }

        // Fills created_at/updated_at when absent and created_by when an actor
        // is set. Constraint violations come back as {Conflict, Db}.
        [[nodiscard]] matreg::core::Status create(const matreg::core::Record& fields,
            matreg::core::RecordId* out_id) noexcept;

        // Absent (Ok) when no row has this id.
        [[nodiscard]] matreg::core::Status read(matreg::core::RecordId id,
            std::optional<matreg::core::Record>* out) noexcept;

        // *out_updated is false, with Ok status and no audit entry, when the row does not exist.
        [[nodiscard]] matreg::core::Status update(matreg::core::RecordId id,
            const matreg::core::Record& fields,
            bool* out_updated) noexcept;

        // Same not-found policy as update.
        [[nodiscard]] matreg::core::Status remove(matreg::core::RecordId id, bool* out_removed) noexcept;

        [[nodiscard]] matreg::core::Status find(const FindQuery& q,
            std::vector<matreg::core::Record>* out) noexcept;

        // Equality and NULL criteria only.
        [[nodiscard]] matreg::core::Status count(const Criteria& where, u64* out) noexcept;
        [[nodiscard]] matreg::core::Status exists(const Criteria& where, bool* out) noexcept;

    private:
        [[nodiscard]] matreg::core::Status check_writable(const matreg::core::Record& fields, bool updating) const;
        [[nodiscard]] matreg::core::Status fetch_row(matreg::core::RecordId id,
            std::optional<matreg::core::Record>* out) noexcept;

        db::Connection& conn_;
        const db::TableSpec& table_;
        matreg::core::PrincipalId actor_;
    };

} // namespace matreg::store
