#include <gtest/gtest.h>
#include "../src/entry_processor.hpp"
#include "../src/archive.hpp"
#include "../src/exception.hpp"
#include "../src/localization.hpp"
#include "test_support.hpp"

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using namespace test_support;

class EntryProcessorTest : public ::testing::Test {
protected:
    fs::path work_dir;
    fs::path root;
    fs::path package;

    const std::string values_json = R"({"values":[1,2.5,"three"],"nested":{"ok":true}})";
    const std::string mesh_bytes = std::string("\x00\x01\x02\xff\xfe", 5) + std::string(3000, '\x7f');

    void SetUp() override {
        init_localization();
        work_dir = fs::absolute("tmp_entry_processor_test");
        if (fs::exists(work_dir)) fs::remove_all(work_dir);
        root = work_dir / "out";
        fs::create_directories(root);
        package = work_dir / "entries.slpk";
    }

    void TearDown() override {
        if (fs::exists(work_dir)) fs::remove_all(work_dir);
    }

    // Packs a single entry and runs it through unpack_entry.
    EntryOutcome unpack_single(const PackageEntry& item, bool verbose = false) {
        write_zip(package, {item});
        PackageArchive archive(package);
        ArchiveEntry entry = archive.entry_at(0);
        return unpack_entry(entry, root, verbose);
    }

    UnpackErrc failure_for(const PackageEntry& item) {
        try {
            unpack_single(item);
        } catch (const UnpackException& e) {
            return e.code();
        }
        ADD_FAILURE() << "Expected UnpackException for " << item.name;
        return UnpackErrc::EntryWrite;
    }
};

TEST_F(EntryProcessorTest, CopiesPlainEntry) {
    EXPECT_EQ(unpack_single({"readme.txt", "plain text\n"}), EntryOutcome::Copied);
    EXPECT_EQ(read_file(root / "readme.txt"), "plain text\n");
}

TEST_F(EntryProcessorTest, CopiesNestedEntryAndCreatesParents) {
    EXPECT_EQ(unpack_single({"nodes/12/textures/0.jpg", "jpegdata"}), EntryOutcome::Copied);
    EXPECT_EQ(read_file(root / "nodes" / "12" / "textures" / "0.jpg"), "jpegdata");
}

TEST_F(EntryProcessorTest, ExistingParentDirectoryIsFine) {
    fs::create_directories(root / "data");
    EXPECT_EQ(unpack_single({"data/readme.txt", "x"}, true), EntryOutcome::Copied);
    EXPECT_EQ(read_file(root / "data" / "readme.txt"), "x");
}

TEST_F(EntryProcessorTest, DecompressesGzipEntry) {
    EXPECT_EQ(unpack_single({"data/mesh.bin.gz", gzip(mesh_bytes)}), EntryOutcome::Decompressed);
    EXPECT_FALSE(fs::exists(root / "data" / "mesh.bin.gz"));
    EXPECT_EQ(read_file(root / "data" / "mesh.bin"), mesh_bytes);
}

TEST_F(EntryProcessorTest, PrettyPrintsGzippedJson) {
    EXPECT_EQ(unpack_single({"data/values.json.gz", gzip(values_json)}, true), EntryOutcome::FormattedJson);

    std::string written = read_file(root / "data" / "values.json");
    EXPECT_EQ(strip_whitespace(written), values_json);
    EXPECT_NE(written.find("{\n  \"values\": [\n    1,"), std::string::npos);
    EXPECT_NE(written.find("\n  \"nested\": {\n    \"ok\": true\n  }\n}"), std::string::npos);
}

TEST_F(EntryProcessorTest, PlainJsonIsCopiedVerbatim) {
    EXPECT_EQ(unpack_single({"metadata.json", values_json}), EntryOutcome::Copied);
    EXPECT_EQ(read_file(root / "metadata.json"), values_json);
}

TEST_F(EntryProcessorTest, CreatesDirectoryEntries) {
    EXPECT_EQ(unpack_single({"statistics/", "", true}), EntryOutcome::Directory);
    EXPECT_TRUE(fs::is_directory(root / "statistics"));
}

TEST_F(EntryProcessorTest, RejectsAbsoluteEntryPath) {
    EXPECT_EQ(failure_for({"/tmp/slpk_absolute_entry_test.txt", "owned"}), UnpackErrc::AbsoluteEntryPath);
    EXPECT_FALSE(fs::exists("/tmp/slpk_absolute_entry_test.txt"));
    EXPECT_TRUE(fs::is_empty(root));
}

TEST_F(EntryProcessorTest, RejectsTraversal) {
    EXPECT_EQ(failure_for({"../escaped.txt", "owned"}), UnpackErrc::PathTraversal);
    EXPECT_EQ(failure_for({"nodes/../../escaped.txt", "owned"}), UnpackErrc::PathTraversal);
    EXPECT_FALSE(fs::exists(work_dir / "escaped.txt"));
}

TEST_F(EntryProcessorTest, CorruptGzipFails) {
    EXPECT_EQ(failure_for({"nodes/0/geometry.bin.gz", "this was never compressed"}), UnpackErrc::Decompress);
}

TEST_F(EntryProcessorTest, MalformedGzippedJsonFails) {
    EXPECT_EQ(failure_for({"nodes/0/features.json.gz", gzip("{\"broken\": ")}), UnpackErrc::JsonFormat);
}

TEST_F(EntryProcessorTest, FileInTheWayOfParentFails) {
    write_file(root / "blocker", "I am a file");
    EXPECT_EQ(failure_for({"blocker/inner.txt", "x"}), UnpackErrc::EntryWrite);
}

TEST_F(EntryProcessorTest, SkipsNamelessEntry) {
    ArchiveEntry entry;
    entry.data = std::make_unique<StringStream>("orphaned bytes");
    EXPECT_EQ(unpack_entry(entry, root, true), EntryOutcome::Skipped);
    EXPECT_TRUE(fs::is_empty(root));
}

TEST_F(EntryProcessorTest, SkipsCurrentDirectoryEntry) {
    ArchiveEntry entry;
    entry.name = ".";
    entry.path = ".";
    entry.data = std::make_unique<StringStream>("orphaned bytes");
    EXPECT_EQ(unpack_entry(entry, root), EntryOutcome::Skipped);
    EXPECT_TRUE(fs::is_empty(root));
}

TEST_F(EntryProcessorTest, GzippedJsonKeepsNumbersAndDuplicateKeys) {
    const std::string document = R"({"big":123456789012345678901234567890,"k":1,"k":2,"f":1.10,"e":1E5,"huge":1e400})";
    EXPECT_EQ(unpack_single({"nodes/0/features/0.json.gz", gzip(document)}), EntryOutcome::FormattedJson);
    EXPECT_EQ(read_file(root / "nodes" / "0" / "features" / "0.json"),
        "{\n"
        "  \"big\": 123456789012345678901234567890,\n"
        "  \"k\": 1,\n"
        "  \"k\": 2,\n"
        "  \"f\": 1.10,\n"
        "  \"e\": 1E5,\n"
        "  \"huge\": 1e400\n"
        "}\n");
}
