#include <gtest/gtest.h>

// Every public header, included together.

#include "capsync/capture/backend.hpp"
#include "capsync/capture/controller.hpp"
#include "capsync/capture/synthetic_backend.hpp"
#include "capsync/cli/commands.hpp"
#include "capsync/cli/options.hpp"
#include "capsync/core/clock.hpp"
#include "capsync/core/config.hpp"
#include "capsync/core/errors.hpp"
#include "capsync/core/log.hpp"
#include "capsync/core/models.hpp"
#include "capsync/core/types.hpp"
#include "capsync/manifest/manifest.hpp"
#include "capsync/manifest/manifest_codec.hpp"
#include "capsync/manifest/manifest_store.hpp"
#include "capsync/store/buffer.hpp"
#include "capsync/store/chunk_store.hpp"
#include "capsync/store/file_io.hpp"
#include "capsync/store/hashing.hpp"
#include "capsync/upload/fs_transport.hpp"
#include "capsync/upload/handoff.hpp"
#include "capsync/upload/recovery.hpp"
#include "capsync/upload/retry_policy.hpp"
#include "capsync/upload/transport.hpp"
#include "capsync/upload/upload_queue.hpp"

TEST(PublicHeaders, Compile) {
    SUCCEED();
}
