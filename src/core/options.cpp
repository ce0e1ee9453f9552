#include <shale/options.h>
#include <shale/logging.h>
#include <shale/util.h>

namespace shale {

SHALE_LOG_TAG(Options);

DatasetOptions DatasetOptions::FromConfig(const std::map<std::string, std::string>& config,
                                          DatasetOptions defaults) {
    DatasetOptions options = std::move(defaults);

    uint64_t u64_value = 0;
    if (ParseConfigU64(config, kConfigCommitMaxRetries, &u64_value)) {
        options.commit.max_retries = static_cast<size_t>(u64_value);
    } else if (config.count(kConfigCommitMaxRetries)) {
        SHALE_LOG_WARN(Options) << "Ignoring malformed " << kConfigCommitMaxRetries << "="
                                << config.at(kConfigCommitMaxRetries);
    }

    double ratio = 0.0;
    if (ParseConfigDouble(config, kConfigDeletionBitmapRatio, &ratio) && ratio > 0.0 && ratio <= 1.0) {
        options.write.deletion_bitmap_ratio = ratio;
    } else if (config.count(kConfigDeletionBitmapRatio)) {
        SHALE_LOG_WARN(Options) << "Ignoring malformed " << kConfigDeletionBitmapRatio << "="
                                << config.at(kConfigDeletionBitmapRatio);
    }

    if (ParseConfigU64(config, kConfigRowIdInlineLimit, &u64_value)) {
        options.write.row_id_inline_limit = static_cast<size_t>(u64_value);
    } else if (config.count(kConfigRowIdInlineLimit)) {
        SHALE_LOG_WARN(Options) << "Ignoring malformed " << kConfigRowIdInlineLimit << "="
                                << config.at(kConfigRowIdInlineLimit);
    }

    return options;
}

} // namespace shale
