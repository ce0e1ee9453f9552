/**
 * Dataset
 *
 * A handle pinned to one manifest. Reads see that snapshot only; every
 * write commits through the transaction engine with the pinned version as
 * its base and moves the handle to the committed version.
 */

#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <shale/commit.h>
#include <shale/index.h>
#include <shale/manifest.h>
#include <shale/options.h>
#include <shale/schema.h>
#include <shale/status.h>
#include <shale/version_chain.h>

namespace shale {

class ObjectStore;

// A data file already written by the columnar writer.
struct FragmentSource {
    std::string path;
    uint64_t physical_rows = 0;
    uint64_t file_size_bytes = 0;
};

// One-file fragment storing every field of an assigned schema.
Status MakeFragment(const Schema& schema, const FragmentSource& source, const WriteParams& params,
                    Fragment* fragment);

// Old fragment ids replaced by the given files.
struct CompactionGroup {
    std::vector<uint64_t> old_fragment_ids;
    std::vector<FragmentSource> new_files;
};

class Dataset {
public:
    /**
     * @brief Create a dataset at version 1
     *
     * Assigns field ids to the schema. AlreadyExists if a version is present.
     */
    static Status Create(std::shared_ptr<ObjectStore> store, const std::string& root,
                         Schema schema, const std::vector<FragmentSource>& sources,
                         const DatasetOptions& options, std::shared_ptr<CommitLock> lock,
                         std::unique_ptr<Dataset>* dataset);

    static Status Open(std::shared_ptr<ObjectStore> store, const std::string& root,
                       const VersionRef& ref, const DatasetOptions& options,
                       std::shared_ptr<CommitLock> lock, std::unique_ptr<Dataset>* dataset);

    const Manifest& manifest() const { return manifest_; }
    uint64_t version() const { return manifest_.version; }
    const Schema& schema() const { return manifest_.schema; }
    const DatasetOptions& options() const { return options_; }
    TransactionEngine* engine() { return engine_.get(); }
    const VersionChain& chain() const { return chain_; }

    uint64_t CountRows() const { return manifest_.NumLiveRows(); }

    // A new handle on another version of the same dataset.
    Status Checkout(const VersionRef& ref, std::unique_ptr<Dataset>* dataset) const;

    // Moves this handle to the latest version.
    Status Refresh();

    Status Append(const std::vector<FragmentSource>& sources, CommitResult* result);

    // Replaces schema and data. Fields without ids get new ones above the
    // dataset's maximum.
    Status Overwrite(Schema schema, const std::vector<FragmentSource>& sources,
                     CommitResult* result);

    // Deletes rows by offset within each fragment. Fragments left without
    // live rows are removed.
    Status DeleteRows(const std::map<uint64_t, std::vector<uint32_t>>& offsets_by_fragment,
                      const std::string& predicate, CommitResult* result);

    // Rewrites groups of fragments into new files, keeping row ids under
    // stable row ids.
    Status Compact(const std::vector<CompactionGroup>& groups, CommitResult* result);

    Status CreateIndex(const std::string& name, const std::vector<int32_t>& field_ids,
                       IndexDetails details, std::optional<int32_t> index_version,
                       std::string* uuid);
    Status DropIndex(const std::string& name);
    std::vector<IndexDescription> DescribeIndices(const IndexCriteria& criteria) const;

    Status UpdateConfig(const std::map<std::string, std::string>& upserts,
                        const std::vector<std::string>& delete_keys);
    Status UpdateSchemaMetadata(std::map<std::string, std::string> metadata, bool replace);

    Status CreateTag(const std::string& name, uint64_t version);
    Status DeleteTag(const std::string& name);
    Status ListTags(std::vector<TagInfo>* tags) const;
    Status ListVersions(std::vector<VersionInfo>* versions) const;

    // JSON document with the manifest summary of this version.
    std::string StatsJson() const;

private:
    Dataset(VersionChain chain, std::unique_ptr<TransactionEngine> engine, Manifest manifest,
            DatasetOptions options, std::shared_ptr<CommitLock> lock);

    Status Commit(Operation operation, CommitResult* result);

    VersionChain chain_;
    std::unique_ptr<TransactionEngine> engine_;
    Manifest manifest_;
    DatasetOptions base_options_;
    DatasetOptions options_;
    std::shared_ptr<CommitLock> lock_;
};

} // namespace shale
