/**
 * Version chain
 *
 * The history of a dataset is the sequence of manifests
 * {root}/_versions/{1..N}.manifest. There is no branching: writers race
 * for the next integer and exactly one wins. Tags are named pointers to a
 * version stored under {root}/_refs/tags.
 */

#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include <shale/manifest.h>
#include <shale/status.h>

namespace shale {

class ObjectStore;

// _versions/{version}.manifest
std::string ManifestPath(uint64_t version);
// _transactions/{read_version}-{uuid}.txn
std::string TransactionFileName(uint64_t read_version, const std::string& uuid);
std::string TransactionPath(const std::string& file_name);
// _refs/tags/{name}.json
std::string TagPath(const std::string& name);

// Letters, digits, '.', '_' and '-'; not starting with '.'.
Status ValidateTagName(const std::string& name);

struct VersionRef {
    enum class Kind { kLatest, kVersion, kTag };

    Kind kind = Kind::kLatest;
    uint64_t version = 0;
    std::string tag;

    static VersionRef Latest() { return VersionRef(); }
    static VersionRef Version(uint64_t version) {
        VersionRef ref;
        ref.kind = Kind::kVersion;
        ref.version = version;
        return ref;
    }
    static VersionRef Tag(std::string name) {
        VersionRef ref;
        ref.kind = Kind::kTag;
        ref.tag = std::move(name);
        return ref;
    }
};

struct VersionInfo {
    uint64_t version = 0;
    uint64_t timestamp_nanos = 0;
    std::string tag;
    ManifestSummary summary;
};

struct TagInfo {
    std::string name;
    uint64_t version = 0;
    uint64_t manifest_size = 0;
};

class VersionChain {
public:
    VersionChain(std::shared_ptr<ObjectStore> store, std::string root);

    ObjectStore* store() const { return store_.get(); }
    const std::shared_ptr<ObjectStore>& shared_store() const { return store_; }
    const std::string& root() const { return root_; }

    // NotFound when no version was ever committed.
    Status HeadVersion(uint64_t* version) const;

    Status Load(uint64_t version, Manifest* manifest) const;
    Status LoadLatest(Manifest* manifest) const;
    Status LoadTag(const std::string& name, Manifest* manifest) const;
    Status Load(const VersionRef& ref, Manifest* manifest) const;

    // Every committed version, ascending.
    Status ListVersions(std::vector<VersionInfo>* versions) const;

    Status CreateTag(const std::string& name, uint64_t version);
    Status DeleteTag(const std::string& name);
    Status GetTag(const std::string& name, TagInfo* tag) const;
    Status ListTags(std::vector<TagInfo>* tags) const;

private:
    Status ListVersionNumbers(std::vector<uint64_t>* versions) const;

    std::shared_ptr<ObjectStore> store_;
    std::string root_;
};

} // namespace shale
