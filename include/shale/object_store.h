#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <shale/status.h>

namespace shale {

// Metadata about one stored object
struct ObjectMeta {
    std::string path;
    uint64_t size = 0;
};

// Byte-addressable object store. Paths are '/'-separated and relative to
// the store's base.
class ObjectStore {
public:
    virtual ~ObjectStore() = default;

    virtual Status Get(const std::string& path, std::string* data) = 0;

    // Unconditional write, replacing any existing object.
    virtual Status Put(const std::string& path, const std::string& data) = 0;

    // Atomic conditional write. Returns AlreadyExists if an object is
    // already present at `path`; NotImplemented if the store cannot do this
    // atomically.
    virtual Status PutIfNotExists(const std::string& path, const std::string& data) = 0;

    // List objects whose path starts with `prefix`, sorted by path.
    virtual Status List(const std::string& prefix, std::vector<ObjectMeta>* objects) = 0;

    virtual Status Delete(const std::string& path) = 0;

    virtual Status Head(const std::string& path, ObjectMeta* meta) = 0;

    virtual bool SupportsConditionalPut() const = 0;

    virtual std::string GetName() const = 0;

    static std::unique_ptr<ObjectStore> CreateLocal(const std::string& base_dir);
    static std::unique_ptr<ObjectStore> CreateMemory(bool supports_conditional_put = true);
};

// POSIX filesystem store. Writes go through a temp file; conditional puts
// use link(2), which fails atomically when the target exists.
class LocalObjectStore : public ObjectStore {
public:
    explicit LocalObjectStore(const std::string& base_dir);
    ~LocalObjectStore() override = default;

    Status Get(const std::string& path, std::string* data) override;
    Status Put(const std::string& path, const std::string& data) override;
    Status PutIfNotExists(const std::string& path, const std::string& data) override;
    Status List(const std::string& prefix, std::vector<ObjectMeta>* objects) override;
    Status Delete(const std::string& path) override;
    Status Head(const std::string& path, ObjectMeta* meta) override;

    bool SupportsConditionalPut() const override { return true; }
    std::string GetName() const override { return "LocalObjectStore"; }

private:
    std::string FullPath(const std::string& path) const;
    Status WriteTempFile(const std::string& full_path, const std::string& data,
                         std::string* temp_path);

    std::string base_dir_;
};

// In-memory store (for testing). Can be configured to behave like an
// object store without conditional writes.
class MemoryObjectStore : public ObjectStore {
public:
    explicit MemoryObjectStore(bool supports_conditional_put = true);
    ~MemoryObjectStore() override = default;

    Status Get(const std::string& path, std::string* data) override;
    Status Put(const std::string& path, const std::string& data) override;
    Status PutIfNotExists(const std::string& path, const std::string& data) override;
    Status List(const std::string& prefix, std::vector<ObjectMeta>* objects) override;
    Status Delete(const std::string& path) override;
    Status Head(const std::string& path, ObjectMeta* meta) override;

    bool SupportsConditionalPut() const override { return supports_conditional_put_; }
    std::string GetName() const override { return "MemoryObjectStore"; }

    size_t ObjectCount() const;

private:
    bool supports_conditional_put_;
    mutable std::mutex mutex_;
    std::map<std::string, std::string> objects_;
};

// Join path segments with a single '/'.
std::string JoinPath(const std::string& base, const std::string& path);

} // namespace shale
