#pragma once

#include <shale/status.h>
#include <shale/logging.h>
#include <shale/object_store.h>
#include <shale/schema.h>
#include <shale/bitmap.h>
#include <shale/row_ids.h>
#include <shale/fragment.h>
#include <shale/deletion.h>
#include <shale/index.h>
#include <shale/manifest.h>
#include <shale/version_chain.h>
#include <shale/transaction.h>
#include <shale/options.h>
#include <shale/commit.h>
#include <shale/mem_wal.h>
#include <shale/dataset.h>
