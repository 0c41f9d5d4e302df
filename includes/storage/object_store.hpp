#pragma once

#include <filesystem>
#include <string>

namespace noisedet {

// Local handle on a stored object for the length of one invocation. When the
// handle owns a staged copy, the copy is deleted on destruction.
class StagedObject {
public:
    StagedObject(std::filesystem::path path, bool owned);
    ~StagedObject();

    StagedObject(StagedObject&& other) noexcept;
    StagedObject& operator=(StagedObject&& other) noexcept;
    StagedObject(const StagedObject&) = delete;
    StagedObject& operator=(const StagedObject&) = delete;

    const std::filesystem::path& path() const { return path_; }
    bool owned() const { return owned_; }

private:
    void release();

    std::filesystem::path path_;
    bool owned_{false};
};

class ObjectStore {
public:
    virtual ~ObjectStore() = default;

    // Throws ExecutionError when the object cannot be made available.
    virtual StagedObject fetch(const std::string& bucket, const std::string& key) = 0;
};

// Buckets mounted as directories: (bucket, key) -> <root>/<bucket>/<key>.
class LocalObjectStore : public ObjectStore {
public:
    struct Config {
        std::filesystem::path root = "/mnt/objects";
        std::filesystem::path stagingDir = "/tmp";
        bool stageObjects = true;   // copy to stagingDir instead of reading in place
        bool verbose = false;
    };

    explicit LocalObjectStore(const Config& config);

    StagedObject fetch(const std::string& bucket, const std::string& key) override;

    // Location of an object under the root, after rejecting names that would
    // escape it.
    std::filesystem::path resolve(const std::string& bucket, const std::string& key) const;

private:
    Config config_;
};

} // namespace noisedet
