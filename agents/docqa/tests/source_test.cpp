#include <catch2/catch.hpp>

#include "../include/source.hpp"
#include "../include/errors.hpp"
#include "test_support.hpp"
#include <memory>

namespace fs = std::filesystem;

TEST_CASE("split_pages follows converter page breaks", "[source]") {
    CHECK(split_pages("one\ftwo\fthree") == std::vector<std::string>{"one", "two", "three"});
    CHECK(split_pages("one\ftwo\f") == std::vector<std::string>{"one", "two"});
    CHECK(split_pages("one\f\fthree") == std::vector<std::string>{"one", "", "three"});
    CHECK(split_pages("only") == std::vector<std::string>{"only"});
    CHECK(split_pages("") == std::vector<std::string>{""});
}

TEST_CASE("shell_quote survives quotes and spaces", "[source]") {
    CHECK(shell_quote("plain.pdf") == "'plain.pdf'");
    CHECK(shell_quote("my file.pdf") == "'my file.pdf'");
    CHECK(shell_quote("it's.pdf") == "'it'\\''s.pdf'");
}

TEST_CASE("DocumentSource scans supported files only", "[source]") {
    TempDir dir;
    write_doc(dir.path(), "b.pdf", {"Beta"});
    write_doc(dir.path(), "a.docx", {"Alpha"});
    write_doc(dir.path(), "UPPER.PDF", {"Upper"});
    write_doc(dir.path(), "notes.txt", {"ignored"});
    fs::create_directories(dir / "sub");
    write_doc(dir / "sub", "nested.pdf", {"not scanned"});

    auto extractor = std::make_shared<FormFeedExtractor>();
    DocumentSource source(dir.path(), {".pdf", ".docx"}, extractor);
    auto scan = source.scan();
    REQUIRE(scan.documents.size() == 3);
    CHECK(scan.unreadable.empty());
    std::vector<std::string> names;
    for (const auto& d : scan.documents) {
        names.push_back(d.filename);
        CHECK(fs::path(d.id).is_absolute());
        CHECK(d.content_hash.size() == 40);
    }
    CHECK(names == std::vector<std::string>{"UPPER.PDF", "a.docx", "b.pdf"});
    CHECK(extractor->calls.load() == 0);

    SECTION("content hash follows the bytes") {
        auto before = source.resolve("b.pdf").content_hash;
        write_doc(dir.path(), "b.pdf", {"Beta", "revised"});
        CHECK(source.resolve("b.pdf").content_hash != before);
    }
}

TEST_CASE("DocumentSource requires the watched folder", "[source]") {
    TempDir dir;
    DocumentSource source(dir / "missing", {".pdf"}, std::make_shared<FormFeedExtractor>());
    CHECK_THROWS_AS(source.scan(), SourceReadError);
}

TEST_CASE("DocumentSource pages are numbered and cached", "[source]") {
    TempDir dir;
    write_doc(dir.path(), "doc.pdf", {"Alpha text on page 1", "Beta text on page 2"});
    auto extractor = std::make_shared<FormFeedExtractor>();
    DocumentSource source(dir.path(), {".pdf"}, extractor);

    auto doc = source.resolve("doc.pdf");
    auto pages = source.pages(doc);
    REQUIRE(pages.size() == 2);
    CHECK(pages[0].number == 1);
    CHECK(pages[0].text == "Alpha text on page 1");
    CHECK(pages[1].number == 2);
    CHECK(pages[1].text == "Beta text on page 2");

    source.pages(doc);
    CHECK(extractor->calls.load() == 1);

    write_doc(dir.path(), "doc.pdf", {"Gamma"});
    auto fresh = source.pages(source.resolve("doc.pdf"));
    REQUIRE(fresh.size() == 1);
    CHECK(fresh[0].text == "Gamma");
    CHECK(extractor->calls.load() == 2);
}

TEST_CASE("DocumentSource resolves names and paths", "[source]") {
    TempDir dir;
    auto path = write_doc(dir.path(), "report.pdf", {"x"});
    DocumentSource source(dir.path(), {".pdf"}, std::make_shared<FormFeedExtractor>());

    auto by_name = source.resolve("report.pdf");
    auto by_path = source.resolve(fs::absolute(path).string());
    CHECK(by_name.id == by_path.id);
    CHECK(by_name.filename == "report.pdf");

    CHECK_THROWS_AS(source.resolve("missing.pdf"), DocumentNotFound);
    CHECK_THROWS_AS(source.resolve((dir / "missing.pdf").string()), DocumentNotFound);

    SECTION("the resolved document matches its scan entry") {
        write_doc(dir.path(), "other.pdf", {"y"});
        write_doc(dir.path(), "third.pdf", {"z"});
        auto scanned = source.scan();
        REQUIRE(scanned.documents.size() == 3);
        auto other = source.resolve("other.pdf");
        bool found = false;
        for (const auto& d : scanned.documents) {
            if (d.id != other.id) continue;
            found = true;
            CHECK(d.content_hash == other.content_hash);
            CHECK(d.mtime == other.mtime);
        }
        CHECK(found);
    }

    SECTION("only files the folder indexes resolve") {
        write_file(dir / "notes.txt", "not a document");
        CHECK_THROWS_AS(source.resolve("notes.txt"), DocumentNotFound);
        TempDir elsewhere;
        auto outside = write_doc(elsewhere.path(), "report.pdf", {"x"});
        CHECK_THROWS_AS(source.resolve(fs::absolute(outside).string()), DocumentNotFound);
    }

    SECTION("a missing folder is a read error") {
        DocumentSource gone(dir / "gone", {".pdf"}, std::make_shared<FormFeedExtractor>());
        CHECK_THROWS_AS(gone.resolve("report.pdf"), SourceReadError);
    }
}

TEST_CASE("CommandTextExtractor runs the configured converter", "[source]") {
    TempDir dir;
    auto path = write_doc(dir.path(), "it's here.pdf", {"page one", "page two"});

    ExtractorConfig cfg;
    cfg.commands = {{".pdf", "cat {path}"}, {".docx", "false {path}"}, {".odt", "cat"}};
    CommandTextExtractor extractor(cfg);

    auto pages = extractor.extract_pages(path);
    CHECK(pages == std::vector<std::string>{"page one", "page two"});

    SECTION("a failing converter is a read error") {
        auto docx = write_doc(dir.path(), "a.docx", {"x"});
        CHECK_THROWS_AS(extractor.extract_pages(docx), SourceReadError);
    }

    SECTION("unknown extensions and commands without {path} are read errors") {
        CHECK_THROWS_AS(extractor.extract_pages(dir / "a.rtf"), SourceReadError);
        CHECK_THROWS_AS(extractor.extract_pages(dir / "a.odt"), SourceReadError);
    }
}
