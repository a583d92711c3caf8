#include <gtest/gtest.h>

// Every public header must compile when included together.

#include "matreg/cli/app.hpp"
#include "matreg/cli/commands.hpp"
#include "matreg/cli/options.hpp"
#include "matreg/core/config.hpp"
#include "matreg/core/errors.hpp"
#include "matreg/core/log.hpp"
#include "matreg/core/models.hpp"
#include "matreg/core/types.hpp"
#include "matreg/core/value.hpp"
#include "matreg/db/backup.hpp"
#include "matreg/db/connection.hpp"
#include "matreg/db/migrations.hpp"
#include "matreg/db/schema.hpp"
#include "matreg/security/password.hpp"
#include "matreg/security/policy.hpp"
#include "matreg/session/accounts.hpp"
#include "matreg/session/guarded_store.hpp"
#include "matreg/session/session.hpp"
#include "matreg/store/audit.hpp"
#include "matreg/store/query.hpp"
#include "matreg/store/record_store.hpp"

TEST(PublicHeaders, Compile) {
    SUCCEED();
}
