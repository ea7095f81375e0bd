#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <dcarchive/archive/archive_manager.h>
#include <dcarchive/archive/tar_packer.h>
#include <dcarchive/upload/upload_local.h>
#include <doctest/doctest.h>

#include "testing_utilities.h"

using namespace dcarchive;
using namespace dcarchive_test;

namespace {

PartitionKey key_of(ArchiveType type, const std::string &complex = "1290105") {
    return PartitionKey{2024, "29", "9", complex, type};
}

// Archive two records the way a local-only run does
void archive_locally(const fs::path &local_dir, const std::string &complex) {
    ArchiveConfig config;
    config.local_dir = local_dir;
    config.local_only = true;
    ArchiveManager manager(config, nullptr);
    manager.put(key_of(ArchiveType::METADATA, complex), "A.json", "{}");
    manager.put(key_of(ArchiveType::DOCUMENT, complex), "A.pdf", "%PDF");
    manager.close();
}

UploadLocalOptions options_for(const TestEnvironment &env) {
    UploadLocalOptions options;
    options.prefix = "p/";
    options.local_dir = env.path("local");
    return options;
}

}  // namespace

TEST_CASE("classify_container") {
    std::vector<std::string> with_orders{"orders.tar", "part-1.tar"};
    std::vector<std::string> metadata_only{"metadata.tar", "part-1.tar"};

    CHECK(classify_container("orders-part-20240601T100000-0000abcd.tar", {}) ==
          ArchiveType::DOCUMENT);
    CHECK(classify_container("metadata.tar", {}) == ArchiveType::METADATA);
    CHECK(classify_container("part-1.tar", with_orders) ==
          ArchiveType::DOCUMENT);
    CHECK(classify_container("part-1.tar", metadata_only) ==
          ArchiveType::METADATA);
    CHECK_FALSE(classify_container("backup.tar", with_orders).has_value());
}

TEST_CASE("upload_local_files - publishes Parts and then Indexes") {
    TestEnvironment env;
    REQUIRE(env.is_valid());
    archive_locally(env.path("local"), "1290105");
    LocalObjectStore store(env.path("remote"));

    auto report = upload_local_files(store, options_for(env));
    CHECK(report.ok());
    CHECK(report.found == 2);
    CHECK(report.uploaded == 2);
    CHECK(report.indexes_uploaded == 2);

    for (auto type : {ArchiveType::METADATA, ArchiveType::DOCUMENT}) {
        auto key = key_of(type);
        auto text = store.get(key.remote_index_key("p/"));
        REQUIRE(text.has_value());
        auto index = PartitionIndex::from_json(key, *text);
        REQUIRE(index.parts().size() == 1);
        CHECK(store.exists(
            key.remote_part_key("p/", index.parts()[0].name)));
    }

    SUBCASE("A second run finds everything in place") {
        auto again = upload_local_files(store, options_for(env));
        CHECK(again.found == 2);
        CHECK(again.skipped == 2);
        CHECK(again.uploaded == 0);
        CHECK(again.indexes_uploaded == 0);
    }

    SUBCASE("A missing remote Index is republished") {
        auto key = key_of(ArchiveType::METADATA);
        fs::remove(env.path("remote") / key.remote_index_key("p/"));
        auto again = upload_local_files(store, options_for(env));
        CHECK(again.uploaded == 0);
        CHECK(again.indexes_uploaded == 1);
        CHECK(store.exists(key.remote_index_key("p/")));
    }
}

TEST_CASE("upload_local_files - dry run writes nothing") {
    TestEnvironment env;
    REQUIRE(env.is_valid());
    archive_locally(env.path("local"), "1290105");
    LocalObjectStore store(env.path("remote"));

    auto options = options_for(env);
    options.dry_run = true;
    auto report = upload_local_files(store, options);
    CHECK(report.found == 2);
    CHECK(report.uploaded == 0);
    CHECK(store.list("").empty());
}

TEST_CASE("upload_local_files - filter by complex") {
    TestEnvironment env;
    REQUIRE(env.is_valid());
    archive_locally(env.path("local"), "1290105");
    archive_locally(env.path("local"), "1290106");
    LocalObjectStore store(env.path("remote"));

    auto options = options_for(env);
    options.filter.complex_code = "1290106";
    auto report = upload_local_files(store, options);
    CHECK(report.uploaded == 2);
    CHECK(store.list("p/metadata/tar/year=2024/state=29/district=9/"
                     "complex=1290105/")
              .empty());
    CHECK_FALSE(store.list("p/metadata/tar/year=2024/state=29/district=9/"
                           "complex=1290106/")
                    .empty());
}

TEST_CASE("upload_local_files - legacy container gets an Index") {
    TestEnvironment env;
    REQUIRE(env.is_valid());
    TarPacker packer(0);
    packer.add("2024/29/9/1290105/A.pdf", "%PDF-A");
    packer.add("2024/29/9/1290105/B.pdf", "%PDF-B");
    env.write_file("local/2024/29/9/1290105/orders.tar", packer.finish());
    LocalObjectStore store(env.path("remote"));

    auto report = upload_local_files(store, options_for(env));
    CHECK(report.ok());
    CHECK(report.uploaded == 1);
    CHECK(report.indexes_uploaded == 1);

    auto key = key_of(ArchiveType::DOCUMENT);
    auto text = store.get(key.remote_index_key("p/"));
    REQUIRE(text.has_value());
    auto index = PartitionIndex::from_json(key, *text);
    CHECK(index.file_count() == 2);
    CHECK(index.contains("A.pdf"));
    CHECK(index.has_part("orders.tar"));
    CHECK(fs::exists(key.local_index_path(env.path("local"))));
}

TEST_CASE("upload_local_files - failed Part holds back its Index") {
    TestEnvironment env;
    REQUIRE(env.is_valid());
    archive_locally(env.path("local"), "1290105");
    auto inner = std::make_shared<LocalObjectStore>(env.path("remote"));
    FaultyObjectStore store(inner);
    store.fail_puts_where([](const std::string &key) {
        return key.find("/data/") != std::string::npos && ends_with(key, ".tar");
    });

    auto report = upload_local_files(store, options_for(env));
    CHECK_FALSE(report.ok());
    CHECK(report.failed == 1);
    CHECK_FALSE(inner->exists(
        key_of(ArchiveType::DOCUMENT).remote_index_key("p/")));
    CHECK(inner->exists(key_of(ArchiveType::METADATA).remote_index_key("p/")));

    store.heal();
    auto retry = upload_local_files(store, options_for(env));
    CHECK(retry.ok());
    CHECK(retry.uploaded == 1);
    CHECK(inner->exists(
        key_of(ArchiveType::DOCUMENT).remote_index_key("p/")));
}
