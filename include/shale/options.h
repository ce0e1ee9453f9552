#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <string>
#include <shale/deletion.h>
#include <shale/fragment.h>
#include <shale/row_ids.h>

namespace shale {

// Reserved table config keys
constexpr const char* kConfigCommitMaxRetries = "shale.commit.max_retries";
constexpr const char* kConfigDeletionBitmapRatio = "shale.deletion.bitmap_ratio";
constexpr const char* kConfigRowIdInlineLimit = "shale.row_ids.inline_limit_bytes";

struct CommitOptions {
    // Rebases onto a newer head allowed before giving up with
    // ResourceExhausted
    size_t max_retries = 20;

    // Polled before every publish attempt. Returning true abandons the
    // commit without a trace.
    std::function<bool()> should_abort;

    // Optional tag recorded in the manifest
    std::string tag;

    std::map<std::string, std::string> transaction_properties;

    // Manifest timestamp override, 0 = now (for tests)
    uint64_t timestamp_nanos = 0;
};

struct WriteParams {
    // Deleted/physical ratio at or above which deletion files are bitmaps
    double deletion_bitmap_ratio = kDefaultDeletionBitmapRatio;

    // Encoded row id sequences above this size go to an external file
    size_t row_id_inline_limit = kDefaultRowIdInlineLimit;

    // Data file format generation for new files
    uint32_t file_major_version = kDefaultFileMajorVersion;
    uint32_t file_minor_version = kDefaultFileMinorVersion;

    // Only honoured when the dataset is created
    bool enable_stable_row_ids = false;
};

struct DatasetOptions {
    CommitOptions commit;
    WriteParams write;

    // Applies reserved keys of a table config on top of these options.
    // Unparseable values keep the current setting.
    static DatasetOptions FromConfig(const std::map<std::string, std::string>& config,
                                     DatasetOptions defaults = DatasetOptions());
};

} // namespace shale
