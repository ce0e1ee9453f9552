#include <shale/object_store.h>
#include <shale/logging.h>

#include <algorithm>
#include <atomic>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <fcntl.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace shale {

SHALE_LOG_TAG(ObjectStore);

std::string JoinPath(const std::string& base, const std::string& path) {
    if (base.empty()) return path;
    if (path.empty()) return base;
    bool base_slash = base.back() == '/';
    bool path_slash = path.front() == '/';
    if (base_slash && path_slash) return base + path.substr(1);
    if (base_slash || path_slash) return base + path;
    return base + "/" + path;
}

std::unique_ptr<ObjectStore> ObjectStore::CreateLocal(const std::string& base_dir) {
    return std::make_unique<LocalObjectStore>(base_dir);
}

std::unique_ptr<ObjectStore> ObjectStore::CreateMemory(bool supports_conditional_put) {
    return std::make_unique<MemoryObjectStore>(supports_conditional_put);
}

//==============================================================================
// LocalObjectStore
//==============================================================================

LocalObjectStore::LocalObjectStore(const std::string& base_dir)
    : base_dir_(base_dir) {}

std::string LocalObjectStore::FullPath(const std::string& path) const {
    return JoinPath(base_dir_, path);
}

Status LocalObjectStore::Get(const std::string& path, std::string* data) {
    std::string full_path = FullPath(path);
    std::ifstream in(full_path, std::ios::binary);
    if (!in.is_open()) {
        return Status::NotFound("Object not found: " + path);
    }
    data->assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    if (in.bad()) {
        return Status::IOError("Read failed: " + full_path);
    }
    return Status::OK();
}

Status LocalObjectStore::WriteTempFile(const std::string& full_path, const std::string& data,
                                       std::string* temp_path) {
    static std::atomic<uint64_t> counter{0};

    std::error_code ec;
    fs::create_directories(fs::path(full_path).parent_path(), ec);
    if (ec) {
        return Status::IOError("Failed to create directory for " + full_path + ": " + ec.message());
    }

    *temp_path = full_path + ".tmp." + std::to_string(getpid()) + "." +
                 std::to_string(counter.fetch_add(1));
    int fd = open(temp_path->c_str(), O_WRONLY | O_CREAT | O_EXCL, 0644);
    if (fd < 0) {
        return Status::IOError("Failed to create " + *temp_path + ": " + strerror(errno));
    }

    size_t written = 0;
    while (written < data.size()) {
        ssize_t n = write(fd, data.data() + written, data.size() - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            std::string err = strerror(errno);
            close(fd);
            unlink(temp_path->c_str());
            return Status::IOError("Write failed for " + *temp_path + ": " + err);
        }
        written += static_cast<size_t>(n);
    }

    if (fsync(fd) != 0) {
        std::string err = strerror(errno);
        close(fd);
        unlink(temp_path->c_str());
        return Status::IOError("fsync failed for " + *temp_path + ": " + err);
    }
    close(fd);
    return Status::OK();
}

Status LocalObjectStore::Put(const std::string& path, const std::string& data) {
    std::string full_path = FullPath(path);
    std::string temp_path;
    auto status = WriteTempFile(full_path, data, &temp_path);
    if (!status.ok()) {
        return status;
    }

    if (rename(temp_path.c_str(), full_path.c_str()) != 0) {
        std::string err = strerror(errno);
        unlink(temp_path.c_str());
        return Status::IOError("Rename failed for " + full_path + ": " + err);
    }
    return Status::OK();
}

Status LocalObjectStore::PutIfNotExists(const std::string& path, const std::string& data) {
    std::string full_path = FullPath(path);
    std::string temp_path;
    auto status = WriteTempFile(full_path, data, &temp_path);
    if (!status.ok()) {
        return status;
    }

    int rc = link(temp_path.c_str(), full_path.c_str());
    int err = errno;
    unlink(temp_path.c_str());
    if (rc != 0) {
        if (err == EEXIST) {
            return Status::AlreadyExists("Object already exists: " + path);
        }
        return Status::IOError("Link failed for " + full_path + ": " + strerror(err));
    }
    return Status::OK();
}

Status LocalObjectStore::List(const std::string& prefix, std::vector<ObjectMeta>* objects) {
    objects->clear();

    // Walk the deepest directory named by the prefix.
    std::string dir_part = prefix;
    auto slash = dir_part.find_last_of('/');
    dir_part = slash == std::string::npos ? "" : dir_part.substr(0, slash);
    fs::path dir = dir_part.empty() ? fs::path(base_dir_) : fs::path(FullPath(dir_part));

    std::error_code ec;
    if (!fs::exists(dir, ec)) {
        return Status::OK();
    }

    fs::path base(base_dir_);
    for (fs::recursive_directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        if (!it->is_regular_file(ec)) continue;
        std::string rel = fs::relative(it->path(), base, ec).generic_string();
        if (ec) break;
        if (rel.compare(0, prefix.size(), prefix) != 0) continue;
        if (rel.find(".tmp.") != std::string::npos) continue;
        ObjectMeta meta;
        meta.path = rel;
        meta.size = it->file_size(ec);
        objects->push_back(std::move(meta));
    }
    if (ec) {
        return Status::IOError("Failed to list " + dir.string() + ": " + ec.message());
    }

    std::sort(objects->begin(), objects->end(),
              [](const ObjectMeta& a, const ObjectMeta& b) { return a.path < b.path; });
    return Status::OK();
}

Status LocalObjectStore::Delete(const std::string& path) {
    std::error_code ec;
    if (!fs::remove(FullPath(path), ec)) {
        if (ec) {
            return Status::IOError("Failed to delete " + path + ": " + ec.message());
        }
        return Status::NotFound("Object not found: " + path);
    }
    return Status::OK();
}

Status LocalObjectStore::Head(const std::string& path, ObjectMeta* meta) {
    std::error_code ec;
    std::string full_path = FullPath(path);
    if (!fs::is_regular_file(full_path, ec)) {
        return Status::NotFound("Object not found: " + path);
    }
    meta->path = path;
    meta->size = fs::file_size(full_path, ec);
    if (ec) {
        return Status::IOError("Failed to stat " + path + ": " + ec.message());
    }
    return Status::OK();
}

//==============================================================================
// MemoryObjectStore
//==============================================================================

MemoryObjectStore::MemoryObjectStore(bool supports_conditional_put)
    : supports_conditional_put_(supports_conditional_put) {}

Status MemoryObjectStore::Get(const std::string& path, std::string* data) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = objects_.find(path);
    if (it == objects_.end()) {
        return Status::NotFound("Object not found: " + path);
    }
    *data = it->second;
    return Status::OK();
}

Status MemoryObjectStore::Put(const std::string& path, const std::string& data) {
    std::lock_guard<std::mutex> lock(mutex_);
    objects_[path] = data;
    return Status::OK();
}

Status MemoryObjectStore::PutIfNotExists(const std::string& path, const std::string& data) {
    if (!supports_conditional_put_) {
        return Status::NotImplemented("MemoryObjectStore configured without conditional put");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    if (!objects_.emplace(path, data).second) {
        SHALE_LOG_DEBUG(ObjectStore) << "conditional put lost for " << path;
        return Status::AlreadyExists("Object already exists: " + path);
    }
    return Status::OK();
}

Status MemoryObjectStore::List(const std::string& prefix, std::vector<ObjectMeta>* objects) {
    std::lock_guard<std::mutex> lock(mutex_);
    objects->clear();
    for (auto it = objects_.lower_bound(prefix); it != objects_.end(); ++it) {
        if (it->first.compare(0, prefix.size(), prefix) != 0) break;
        objects->push_back(ObjectMeta{it->first, it->second.size()});
    }
    return Status::OK();
}

Status MemoryObjectStore::Delete(const std::string& path) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (objects_.erase(path) == 0) {
        return Status::NotFound("Object not found: " + path);
    }
    return Status::OK();
}

Status MemoryObjectStore::Head(const std::string& path, ObjectMeta* meta) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = objects_.find(path);
    if (it == objects_.end()) {
        return Status::NotFound("Object not found: " + path);
    }
    meta->path = path;
    meta->size = it->second.size();
    return Status::OK();
}

size_t MemoryObjectStore::ObjectCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return objects_.size();
}

} // namespace shale
