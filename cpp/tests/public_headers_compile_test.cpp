#include <gtest/gtest.h>

// Every public header must compile when included together.

#include "snap/cli/app.hpp"
#include "snap/cli/commands.hpp"
#include "snap/cli/options.hpp"
#include "snap/config/config.hpp"
#include "snap/core/async_service.hpp"
#include "snap/core/clock.hpp"
#include "snap/core/errors.hpp"
#include "snap/core/log.hpp"
#include "snap/core/secret.hpp"
#include "snap/core/types.hpp"
#include "snap/db/db.hpp"
#include "snap/ingest/adapter.hpp"
#include "snap/ingest/message.hpp"
#include "snap/ingest/queue.hpp"
#include "snap/ingest/sqlite_queue.hpp"
#include "snap/ingest/worker.hpp"
#include "snap/lifecycle/orchestrator.hpp"
#include "snap/security/challenge.hpp"
#include "snap/security/id.hpp"
#include "snap/store/memory_store.hpp"
#include "snap/store/secret_store.hpp"
#include "snap/store/sqlite_store.hpp"
#include "snap/store/sweeper.hpp"

TEST(PublicHeaders, Compile) {
    SUCCEED();
}
