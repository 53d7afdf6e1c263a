#include <sstream>
#include <catch2/catch.hpp>
#include "dir_tree/render.hpp"

using namespace dir_tree;

namespace {
    DirEntry file_entry(const std::string& name, FileMetadata metadata) {
        DirEntry entry;
        entry.name = name;
        entry.file = std::move(metadata);
        return entry;
    }

    DirEntry dir_entry(const std::string& name, DirTree children = {}) {
        DirEntry entry;
        entry.name = name;
        entry.is_directory = true;
        entry.children = std::move(children);
        return entry;
    }

    FileMetadata raw(uintmax_t size, double modified) {
        FileMetadata metadata;
        metadata.size = size;
        metadata.modified_time = modified;
        return metadata;
    }
}

TEST_CASE("Empty tree renders as an empty object", "[render]") {
    REQUIRE(dir_tree_to_json(DirTree{}) == "{}");
}

TEST_CASE("Nested tree uses four-space indentation", "[render]") {
    DirTree utils;
    utils.entries.push_back(file_entry("helpers.py", raw(1024, 1731277500.0)));
    utils.entries.push_back(dir_entry("empty_dir"));

    DirTree src;
    src.entries.push_back(dir_entry("utils", std::move(utils)));

    DirTree tree;
    tree.entries.push_back(file_entry("README.md", raw(512, 1731277800.25)));
    tree.entries.push_back(dir_entry("src", std::move(src)));
    tree.entries.push_back(dir_entry("docs"));

    const std::string expected =
        "{\n"
        "    \"README.md\": {\n"
        "        \"size\": 512,\n"
        "        \"modified_time\": 1731277800.25\n"
        "    },\n"
        "    \"src\": {\n"
        "        \"utils\": {\n"
        "            \"helpers.py\": {\n"
        "                \"size\": 1024,\n"
        "                \"modified_time\": 1731277500.0\n"
        "            },\n"
        "            \"empty_dir\": {}\n"
        "        }\n"
        "    },\n"
        "    \"docs\": {}\n"
        "}";

    REQUIRE(dir_tree_to_json(tree) == expected);
}

TEST_CASE("Human-readable and missing metadata", "[render]") {
    FileMetadata human;
    human.size = std::string("1.5 KB");
    human.modified_time = std::string("2025-11-10 22:30");

    DirTree tree;
    tree.entries.push_back(file_entry("a.bin", human));
    tree.entries.push_back(file_entry("gone.bin", FileMetadata{}));

    const std::string expected =
        "{\n"
        "    \"a.bin\": {\n"
        "        \"size\": \"1.5 KB\",\n"
        "        \"modified_time\": \"2025-11-10 22:30\"\n"
        "    },\n"
        "    \"gone.bin\": {}\n"
        "}";

    REQUIRE(dir_tree_to_json(tree) == expected);
}

TEST_CASE("Names are escaped but not ASCII-folded", "[render]") {
    DirTree tree;
    tree.entries.push_back(dir_entry("quote\"d"));
    tree.entries.push_back(dir_entry("caf\xC3\xA9"));

    const std::string json = dir_tree_to_json(tree);
    REQUIRE(json.find("\"quote\\\"d\": {}") != std::string::npos);
    REQUIRE(json.find("\"caf\xC3\xA9\": {}") != std::string::npos);
}

TEST_CASE("render_json terminates the document with a newline", "[render]") {
    TreeReport report;
    report.tree.entries.push_back(dir_entry("only"));

    std::ostringstream out;
    render_json(report, out);

    REQUIRE(out.str() == "{\n    \"only\": {}\n}\n");
}

TEST_CASE("Whole-second timestamps print in fixed notation", "[render]") {
    DirTree tree;
    tree.entries.push_back(file_entry("a.txt", raw(2, 1700000000.0)));
    tree.entries.push_back(file_entry("b.txt", raw(0, 1000000000.0)));

    const std::string json = dir_tree_to_json(tree);

    REQUIRE(json.find("\"modified_time\": 1700000000.0\n") != std::string::npos);
    REQUIRE(json.find("\"modified_time\": 1000000000.0\n") != std::string::npos);
    REQUIRE(json.find("e+") == std::string::npos);
}
