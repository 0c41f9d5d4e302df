#include "storage/object_store.hpp"
#include "detect/errors.hpp"

#include <iostream>
#include <system_error>
#include <utility>

namespace noisedet {

namespace fs = std::filesystem;

StagedObject::StagedObject(fs::path path, bool owned)
    : path_(std::move(path)), owned_(owned) {}

StagedObject::~StagedObject() {
    release();
}

StagedObject::StagedObject(StagedObject&& other) noexcept
    : path_(std::move(other.path_)), owned_(other.owned_) {
    other.owned_ = false;
}

StagedObject& StagedObject::operator=(StagedObject&& other) noexcept {
    if (this != &other) {
        release();
        path_ = std::move(other.path_);
        owned_ = other.owned_;
        other.owned_ = false;
    }
    return *this;
}

void StagedObject::release() {
    if (!owned_) return;
    owned_ = false;
    std::error_code ec;
    fs::remove(path_, ec);
    if (ec) {
        std::cerr << "Warning: could not remove staged file " << path_
                  << ": " << ec.message() << std::endl;
    }
}

LocalObjectStore::LocalObjectStore(const Config& config) : config_(config) {}

fs::path LocalObjectStore::resolve(const std::string& bucket, const std::string& key) const {
    if (bucket.empty() || bucket.find('/') != std::string::npos || bucket == "." || bucket == "..") {
        throw ExecutionError("invalid bucket name: " + bucket);
    }

    fs::path keyPath(key);
    if (key.empty() || keyPath.is_absolute()) {
        throw ExecutionError("invalid key name: " + key);
    }
    for (const auto& part : keyPath) {
        if (part == "..") {
            throw ExecutionError("invalid key name: " + key);
        }
    }
    return config_.root / bucket / keyPath;
}

StagedObject LocalObjectStore::fetch(const std::string& bucket, const std::string& key) {
    const fs::path source = resolve(bucket, key);

    std::error_code ec;
    if (!fs::is_regular_file(source, ec)) {
        throw ExecutionError("object not found: " + bucket + "/" + key);
    }

    if (!config_.stageObjects) {
        if (config_.verbose) {
            std::cerr << "Debug: reading object in place from " << source << std::endl;
        }
        return StagedObject(source, false);
    }

    const fs::path target = config_.stagingDir / source.filename();
    fs::create_directories(config_.stagingDir, ec);
    if (!fs::copy_file(source, target, fs::copy_options::overwrite_existing, ec)) {
        throw ExecutionError("could not stage " + bucket + "/" + key + " to " +
                             target.string() + ": " + ec.message());
    }
    if (config_.verbose) {
        std::cerr << "Debug: staged " << bucket << "/" << key << " at " << target << std::endl;
    }
    return StagedObject(target, true);
}

} // namespace noisedet
