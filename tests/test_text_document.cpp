#include <catch2/catch.hpp>
#include "files/text_document.hpp"
#include "temp_dir.hpp"

using namespace tman;

TEST_CASE("TextDocument: new document is untitled and clean", "[files][document]") {
    TextDocument doc;
    REQUIRE(doc.title() == "Untitled");
    REQUIRE_FALSE(doc.has_path());
    REQUIRE_FALSE(doc.is_dirty());

    doc.set_content("draft");
    REQUIRE(doc.is_dirty());
    REQUIRE(doc.title() == "Untitled *");

    doc.new_document();
    REQUIRE(doc.content().empty());
    REQUIRE_FALSE(doc.is_dirty());
}

TEST_CASE("TextDocument: load, edit, save", "[files][document]") {
    TempDir dir;
    const std::string path = dir.write("notes.txt", "line 1\n");

    TextDocument doc;
    auto loaded = doc.load(path);
    REQUIRE(loaded.success);
    REQUIRE(loaded.message == "Opened: " + path);
    REQUIRE(doc.title() == "notes.txt");

    // Setting identical content is not a modification
    doc.set_content("line 1\n");
    REQUIRE_FALSE(doc.is_dirty());

    doc.set_content("line 1\nline 2\n");
    REQUIRE(doc.title() == "notes.txt *");

    auto saved = doc.save();
    REQUIRE(saved.success);
    REQUIRE(saved.message == "Saved: " + path);
    REQUIRE_FALSE(doc.is_dirty());
    REQUIRE(read_file(path) == "line 1\nline 2\n");
}

TEST_CASE("TextDocument: save needs a path, save_as provides one", "[files][document]") {
    TempDir dir;
    TextDocument doc;
    doc.set_content("fresh");

    auto no_path = doc.save();
    REQUIRE_FALSE(no_path.success);
    REQUIRE(no_path.message == "No file name yet, use Save As");

    const std::string target = dir.file("sub/fresh.txt");
    auto saved = doc.save_as(target);
    REQUIRE(saved.success);
    REQUIRE(saved.message == "Saved as: " + target);
    REQUIRE(doc.path() == target);
    REQUIRE(read_file(target) == "fresh");

    REQUIRE(doc.save_as("  ").message == "No path given");
}

TEST_CASE("TextDocument: failed load leaves the document untouched", "[files][document]") {
    TempDir dir;
    TextDocument doc;
    doc.set_content("keep me");

    auto missing = doc.load(dir.file("nope.txt"));
    REQUIRE_FALSE(missing.success);
    REQUIRE(missing.message.ends_with("not a regular file"));

    REQUIRE_FALSE(doc.load(dir.path()).success);

    const std::string binary = dir.write("blob.bin", std::string("ab\0cd", 5));
    auto not_text = doc.load(binary);
    REQUIRE_FALSE(not_text.success);
    REQUIRE(not_text.message.ends_with("not a text file"));

    REQUIRE(doc.content() == "keep me");
    REQUIRE(doc.is_dirty());
}

TEST_CASE("TextDocument: only well-formed UTF-8 loads", "[files][document]") {
    TempDir dir;
    TextDocument doc;

    const std::string utf8 = dir.write("utf8.txt", "caf\xc3\xa9 \xe2\x82\xac \xf0\x9f\x98\x80\n");
    REQUIRE(doc.load(utf8).success);
    REQUIRE(doc.content() == "caf\xc3\xa9 \xe2\x82\xac \xf0\x9f\x98\x80\n");

    for (const std::string bad : {std::string("latin1 caf\xe9\n"),   // lone lead byte
                                  std::string("\xc0\xaf"),            // overlong '/'
                                  std::string("\xed\xa0\x80"),        // surrogate
                                  std::string("\xf4\x90\x80\x80"),    // past U+10FFFF
                                  std::string("cut \xe2\x82")}) {     // truncated
        const auto result = doc.load(dir.write("bad.txt", bad));
        REQUIRE_FALSE(result.success);
        REQUIRE(result.message.ends_with("not a text file"));
    }
    REQUIRE(doc.path() == utf8);
}
