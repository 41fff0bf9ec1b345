#pragma once

// Public entry point: configure a source, open it, and pull batches.

#include "common/batch.hpp"
#include "common/errors.hpp"
#include "common/logging.hpp"
#include "common/types.hpp"
#include "config/source_config.hpp"
#include "hub/hub_client.hpp"
#include "source/batch_producer.hpp"
#include "source/filesystem_source.hpp"
#include "source/hub_source.hpp"
#include "source/path_classifier.hpp"
#include "source/snapshot_source.hpp"
#include "source/source_adapter.hpp"
#include "storage/filesystem.hpp"
#include "storage/snapshot.hpp"
