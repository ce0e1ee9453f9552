#include <shale/version_chain.h>
#include <shale/logging.h>
#include <shale/object_store.h>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>

namespace shale {

SHALE_LOG_TAG(VersionChain);

namespace {

constexpr const char* kVersionsDir = "_versions/";
constexpr const char* kManifestSuffix = ".manifest";
constexpr const char* kTagsDir = "_refs/tags/";
constexpr const char* kTagSuffix = ".json";

bool EndsWith(const std::string& value, const std::string& suffix) {
    return value.size() >= suffix.size() &&
           value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// "{prefix}{name}{suffix}" relative to root -> name
bool StripAffixes(const std::string& path, const std::string& prefix, const std::string& suffix,
                  std::string* name) {
    size_t start = path.rfind(prefix);
    if (start == std::string::npos || !EndsWith(path, suffix)) {
        return false;
    }
    start += prefix.size();
    if (start + suffix.size() > path.size()) {
        return false;
    }
    *name = path.substr(start, path.size() - suffix.size() - start);
    return !name->empty() && name->find('/') == std::string::npos;
}

} // namespace

std::string ManifestPath(uint64_t version) {
    return std::string(kVersionsDir) + std::to_string(version) + kManifestSuffix;
}

std::string TransactionFileName(uint64_t read_version, const std::string& uuid) {
    return std::to_string(read_version) + "-" + uuid + ".txn";
}

std::string TransactionPath(const std::string& file_name) {
    return "_transactions/" + file_name;
}

std::string TagPath(const std::string& name) {
    return std::string(kTagsDir) + name + kTagSuffix;
}

Status ValidateTagName(const std::string& name) {
    if (name.empty()) {
        return Status::InvalidArgument("Tag name is empty");
    }
    if (name.front() == '.') {
        return Status::InvalidArgument("Tag name cannot start with '.': " + name);
    }
    for (char c : name) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '.' && c != '_' && c != '-') {
            return Status::InvalidArgument("Tag name has invalid character: " + name);
        }
    }
    if (name.find("..") != std::string::npos) {
        return Status::InvalidArgument("Tag name cannot contain '..': " + name);
    }
    return Status::OK();
}

VersionChain::VersionChain(std::shared_ptr<ObjectStore> store, std::string root)
    : store_(std::move(store)), root_(std::move(root)) {}

Status VersionChain::ListVersionNumbers(std::vector<uint64_t>* versions) const {
    std::vector<ObjectMeta> objects;
    auto status = store_->List(JoinPath(root_, kVersionsDir), &objects);
    if (!status.ok()) {
        return status;
    }
    versions->clear();
    for (const auto& object : objects) {
        std::string name;
        if (!StripAffixes(object.path, kVersionsDir, kManifestSuffix, &name)) continue;
        if (name.find_first_not_of("0123456789") != std::string::npos) continue;
        versions->push_back(std::stoull(name));
    }
    std::sort(versions->begin(), versions->end());
    return Status::OK();
}

Status VersionChain::HeadVersion(uint64_t* version) const {
    std::vector<uint64_t> versions;
    auto status = ListVersionNumbers(&versions);
    if (!status.ok()) {
        return status;
    }
    if (versions.empty()) {
        return Status::NotFound("No dataset at " + root_);
    }
    *version = versions.back();
    return Status::OK();
}

Status VersionChain::Load(uint64_t version, Manifest* manifest) const {
    std::string bytes;
    auto status = store_->Get(JoinPath(root_, ManifestPath(version)), &bytes);
    if (status.IsNotFound()) {
        return Status::NotFound("Version " + std::to_string(version) + " does not exist");
    }
    if (!status.ok()) {
        return status;
    }

    Manifest result;
    status = DeserializeManifest(bytes, &result);
    if (!status.ok()) {
        SHALE_LOG_WARN(VersionChain) << "Failed to load version " << version << ": "
                                     << status.ToString();
        return status;
    }
    if (result.version != version) {
        return Status::Corruption("Manifest " + ManifestPath(version) + " records version " +
                                  std::to_string(result.version));
    }
    *manifest = std::move(result);
    return Status::OK();
}

Status VersionChain::LoadLatest(Manifest* manifest) const {
    uint64_t head = 0;
    auto status = HeadVersion(&head);
    if (!status.ok()) {
        return status;
    }
    return Load(head, manifest);
}

Status VersionChain::LoadTag(const std::string& name, Manifest* manifest) const {
    TagInfo tag;
    auto status = GetTag(name, &tag);
    if (!status.ok()) {
        return status;
    }
    return Load(tag.version, manifest);
}

Status VersionChain::Load(const VersionRef& ref, Manifest* manifest) const {
    switch (ref.kind) {
        case VersionRef::Kind::kLatest:
            return LoadLatest(manifest);
        case VersionRef::Kind::kVersion:
            return Load(ref.version, manifest);
        case VersionRef::Kind::kTag:
            return LoadTag(ref.tag, manifest);
    }
    return Status::InvalidArgument("Unknown version reference");
}

Status VersionChain::ListVersions(std::vector<VersionInfo>* versions) const {
    std::vector<uint64_t> numbers;
    auto status = ListVersionNumbers(&numbers);
    if (!status.ok()) {
        return status;
    }
    std::vector<VersionInfo> result;
    for (uint64_t number : numbers) {
        Manifest manifest;
        status = Load(number, &manifest);
        if (!status.ok()) {
            return status;
        }
        VersionInfo info;
        info.version = manifest.version;
        info.timestamp_nanos = manifest.timestamp_nanos;
        info.tag = manifest.tag;
        info.summary = manifest.Summary();
        result.push_back(std::move(info));
    }
    *versions = std::move(result);
    return Status::OK();
}

Status VersionChain::CreateTag(const std::string& name, uint64_t version) {
    auto status = ValidateTagName(name);
    if (!status.ok()) {
        return status;
    }

    ObjectMeta manifest_meta;
    status = store_->Head(JoinPath(root_, ManifestPath(version)), &manifest_meta);
    if (status.IsNotFound()) {
        return Status::NotFound("Cannot tag missing version " + std::to_string(version));
    }
    if (!status.ok()) {
        return status;
    }

    nlohmann::json json;
    json["version"] = version;
    json["manifestSize"] = manifest_meta.size;

    std::string path = JoinPath(root_, TagPath(name));
    if (store_->SupportsConditionalPut()) {
        status = store_->PutIfNotExists(path, json.dump());
        if (status.IsAlreadyExists()) {
            return Status::AlreadyExists("Tag " + name + " already exists");
        }
        return status;
    }

    ObjectMeta existing;
    status = store_->Head(path, &existing);
    if (status.ok()) {
        return Status::AlreadyExists("Tag " + name + " already exists");
    }
    if (!status.IsNotFound()) {
        return status;
    }
    return store_->Put(path, json.dump());
}

Status VersionChain::DeleteTag(const std::string& name) {
    auto status = ValidateTagName(name);
    if (!status.ok()) {
        return status;
    }
    std::string path = JoinPath(root_, TagPath(name));
    ObjectMeta meta;
    status = store_->Head(path, &meta);
    if (status.IsNotFound()) {
        return Status::NotFound("Tag " + name + " does not exist");
    }
    if (!status.ok()) {
        return status;
    }
    return store_->Delete(path);
}

Status VersionChain::GetTag(const std::string& name, TagInfo* tag) const {
    auto status = ValidateTagName(name);
    if (!status.ok()) {
        return status;
    }
    std::string data;
    status = store_->Get(JoinPath(root_, TagPath(name)), &data);
    if (status.IsNotFound()) {
        return Status::NotFound("Tag " + name + " does not exist");
    }
    if (!status.ok()) {
        return status;
    }

    auto json = nlohmann::json::parse(data, nullptr, false);
    if (json.is_discarded() || !json.is_object() || !json.contains("version") ||
        !json["version"].is_number_unsigned()) {
        return Status::Corruption("Malformed tag file for " + name);
    }
    tag->name = name;
    tag->version = json["version"].get<uint64_t>();
    tag->manifest_size = json.value("manifestSize", uint64_t{0});
    return Status::OK();
}

Status VersionChain::ListTags(std::vector<TagInfo>* tags) const {
    std::vector<ObjectMeta> objects;
    auto status = store_->List(JoinPath(root_, kTagsDir), &objects);
    if (!status.ok()) {
        return status;
    }
    std::vector<TagInfo> result;
    for (const auto& object : objects) {
        std::string name;
        if (!StripAffixes(object.path, kTagsDir, kTagSuffix, &name)) continue;
        TagInfo tag;
        status = GetTag(name, &tag);
        if (!status.ok()) {
            return status;
        }
        result.push_back(std::move(tag));
    }
    *tags = std::move(result);
    return Status::OK();
}

} // namespace shale
