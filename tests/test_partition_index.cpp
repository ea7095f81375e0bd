#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <dcarchive/archive/partition_index.h>
#include <dcarchive/common/error.h>
#include <doctest/doctest.h>

#include <string>

using namespace dcarchive;

namespace {

PartitionKey metadata_key() {
    return PartitionKey{2024, "29", "9", "1290105", ArchiveType::METADATA};
}

PartDescriptor make_part(const std::string &name,
                         std::vector<std::string> files, std::uint64_t size,
                         const std::string &created_at) {
    PartDescriptor part;
    part.name = name;
    part.files = std::move(files);
    part.size = size;
    part.created_at = *Timestamp::parse(created_at);
    return part;
}

}  // namespace

TEST_CASE("PartitionIndex - sums follow the Part list") {
    PartitionIndex index(metadata_key());
    CHECK(index.empty());
    CHECK_FALSE(index.updated_at().has_value());

    index.append_part(make_part("metadata-part-a.tar", {"A.json", "B.json"},
                                10240, "2024-06-01T10:00:00+05:30"));
    index.append_part(make_part("metadata-part-b.tar", {"C.json"}, 20480,
                                "2024-06-02T09:00:00+05:30"));

    CHECK(index.file_count() == 3);
    CHECK(index.total_size() == 30720);
    CHECK(index.contains("B.json"));
    CHECK(index.contains("C.json"));
    CHECK_FALSE(index.contains("D.json"));
    CHECK(index.has_part("metadata-part-a.tar"));

    REQUIRE(index.created_at().has_value());
    REQUIRE(index.updated_at().has_value());
    CHECK(index.created_at()->to_iso_string() == "2024-06-01T10:00:00+05:30");
    CHECK(index.updated_at()->to_iso_string() == "2024-06-02T09:00:00+05:30");
}

TEST_CASE("PartitionIndex - a Part is indexed once") {
    PartitionIndex index(metadata_key());
    index.append_part(make_part("metadata-part-a.tar", {"A.json"}, 10240,
                                "2024-06-01T10:00:00+05:30"));
    CHECK_THROWS_AS(index.append_part(make_part("metadata-part-a.tar",
                                                {"Z.json"}, 10240,
                                                "2024-06-03T10:00:00+05:30")),
                    ArchiveError);
    CHECK(index.file_count() == 1);
    CHECK_FALSE(index.contains("Z.json"));
}

TEST_CASE("PartitionIndex - JSON document") {
    PartitionIndex index(metadata_key());

    SUBCASE("Empty index has null timestamps") {
        std::string text = index.to_json();
        CHECK(text.find("\"created_at\": null") != std::string::npos);
        CHECK(text.find("\"updated_at\": null") != std::string::npos);
        CHECK(text.find("\"parts\": []") != std::string::npos);

        auto parsed = PartitionIndex::from_json(metadata_key(), text);
        CHECK(parsed.empty());
    }

    SUBCASE("Parsed document matches the writer") {
        index.append_part(make_part("metadata-part-a.tar",
                                    {"A.json", "B \"quoted\".json"}, 10240,
                                    "2024-06-01T10:00:00+05:30"));
        std::string text = index.to_json();
        CHECK(text.find("\"archive_type\": \"metadata\"") != std::string::npos);
        CHECK(text.find("\"file_count\": 2") != std::string::npos);

        auto parsed = PartitionIndex::from_json(metadata_key(), text);
        CHECK(parsed.file_count() == 2);
        CHECK(parsed.total_size() == 10240);
        CHECK(parsed.contains("B \"quoted\".json"));
        CHECK(parsed.to_json() == text);
    }

    SUBCASE("Names that are not UTF-8 are never written") {
        index.append_part(make_part("metadata-part-b.tar",
                                    {"CNR\xff\xfe.json"}, 10240,
                                    "2024-06-01T10:00:00+05:30"));
        CHECK_THROWS_AS(index.to_json(), ArchiveError);
    }

    SUBCASE("Archive type must match the partition") {
        PartitionKey orders = metadata_key();
        orders.archive_type = ArchiveType::DOCUMENT;
        CHECK_THROWS_AS(PartitionIndex::from_json(orders, index.to_json()),
                        ArchiveError);
    }

    SUBCASE("Garbage is rejected") {
        CHECK_THROWS_AS(PartitionIndex::from_json(metadata_key(), "{not json"),
                        ArchiveError);
        CHECK_THROWS_AS(
            PartitionIndex::from_json(
                metadata_key(),
                R"({"parts": [{"name": "p.tar", "files": [], "size": 1}]})"),
            ArchiveError);
    }
}
