#include "detect/errors.hpp"
#include "storage/object_store.hpp"
#include "TestSupport.h"

#include <gtest/gtest.h>
#include <fstream>
#include <iterator>
#include <string>

namespace noisedet_test {

using noisedet::ExecutionError;
using noisedet::LocalObjectStore;
using noisedet::StagedObject;

class ObjectStoreTest : public TempDirTest {
  protected:
    LocalObjectStore makeStore(bool stage) {
        LocalObjectStore::Config cfg;
        cfg.root = dir / "objects";
        cfg.stagingDir = dir / "staging";
        cfg.stageObjects = stage;
        return LocalObjectStore(cfg);
    }

    static std::string slurp(const fs::path& p) {
        std::ifstream in(p, std::ios::binary);
        return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    }
};

TEST_F(ObjectStoreTest, ResolvesBucketAndNestedKey) {
    auto store = makeStore(false);
    EXPECT_EQ(store.resolve("b", "calls/2024/a.wav"), dir / "objects" / "b" / "calls/2024/a.wav");
}

TEST_F(ObjectStoreTest, RejectsNamesThatEscapeTheRoot) {
    auto store = makeStore(false);
    EXPECT_THROW(store.resolve("b", "../other/a.wav"), ExecutionError);
    EXPECT_THROW(store.resolve("b", "x/../../a.wav"), ExecutionError);
    EXPECT_THROW(store.resolve("b", "/etc/passwd"), ExecutionError);
    EXPECT_THROW(store.resolve("..", "a.wav"), ExecutionError);
    EXPECT_THROW(store.resolve("a/b", "a.wav"), ExecutionError);
    EXPECT_THROW(store.resolve("", "a.wav"), ExecutionError);
}

TEST_F(ObjectStoreTest, MissingObjectIsAnError) {
    auto store = makeStore(true);
    try {
        store.fetch("b", "nope.wav");
        FAIL() << "expected ExecutionError";
    } catch (const ExecutionError& e) {
        EXPECT_EQ(std::string(e.what()), "object not found: b/nope.wav");
    }
}

TEST_F(ObjectStoreTest, DirectoryIsNotAnObject) {
    fs::create_directories(dir / "objects" / "b" / "folder");
    auto store = makeStore(false);
    EXPECT_THROW(store.fetch("b", "folder"), ExecutionError);
}

TEST_F(ObjectStoreTest, InPlaceFetchLeavesSourceAlone) {
    const auto source = writeFile("objects/b/in/place.wav", "RIFF");
    auto store = makeStore(false);
    {
        StagedObject obj = store.fetch("b", "in/place.wav");
        EXPECT_FALSE(obj.owned());
        EXPECT_EQ(obj.path(), source);
    }
    EXPECT_TRUE(fs::exists(source));
}

TEST_F(ObjectStoreTest, StagedCopyIsRemovedWithHandle) {
    const auto source = writeFile("objects/b/calls/silent.wav", "RIFF....WAVE");
    auto store = makeStore(true);
    fs::path staged;
    {
        StagedObject obj = store.fetch("b", "calls/silent.wav");
        staged = obj.path();
        EXPECT_TRUE(obj.owned());
        EXPECT_EQ(staged, dir / "staging" / "silent.wav");
        EXPECT_EQ(slurp(staged), "RIFF....WAVE");
    }
    EXPECT_FALSE(fs::exists(staged));
    EXPECT_TRUE(fs::exists(source));
}

TEST_F(ObjectStoreTest, MovedHandleOwnsCleanup) {
    writeFile("objects/b/a.wav", "data");
    auto store = makeStore(true);
    fs::path staged;
    {
        StagedObject outer(fs::path(), false);
        {
            StagedObject inner = store.fetch("b", "a.wav");
            staged = inner.path();
            outer = std::move(inner);
        }
        EXPECT_TRUE(fs::exists(staged));
    }
    EXPECT_FALSE(fs::exists(staged));
}

} // namespace noisedet_test
