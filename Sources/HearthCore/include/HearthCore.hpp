#pragma once

// Umbrella header for the hearth data layer
#include "hearth/log.hpp"
#include "hearth/types.hpp"
#include "hearth/schema.hpp"
#include "hearth/db.hpp"
#include "hearth/config.hpp"
#include "hearth/scheduler.hpp"
#include "hearth/store.hpp"
#include "hearth/migration.hpp"
#include "hearth/storage.hpp"
#include "hearth/network.hpp"
#include "hearth/remote.hpp"
#include "hearth/sync.hpp"
#include "hearth/record.hpp"
#include "hearth/repository.hpp"
#include "hearth/query_builder.hpp"
#include "hearth/models.hpp"
#include "hearth/hearth.hpp"
