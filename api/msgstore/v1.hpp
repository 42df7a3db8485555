#pragma once

#include "msgstore/v1/protocol.pb.h"
#include "msgstore/v1/server.pb.h"

#include "internal/stores/api/store.hpp"
#include "internal/stores/api/store_limits.hpp"
#include "internal/stores/file/file_store.hpp"
#include "internal/stores/file/file_store_options.hpp"
#include "internal/stores/memory/memory_store.hpp"
#include "internal/stores/store_factory.hpp"
#include "internal/util/errors.hpp"

namespace msgstore::v1 {
using ::msgstore::stores::ChannelStore;
using ::msgstore::stores::Client;
using ::msgstore::stores::MsgPtr;
using ::msgstore::stores::MsgStore;
using ::msgstore::stores::RecoveredState;
using ::msgstore::stores::Store;
using ::msgstore::stores::StoreLimits;
using ::msgstore::stores::SubStore;
}
