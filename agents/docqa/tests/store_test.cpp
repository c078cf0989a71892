#include <catch2/catch.hpp>

#include "../include/store.hpp"
#include "../include/errors.hpp"
#include "test_support.hpp"
#include <atomic>
#include <set>
#include <thread>

using Catch::Matchers::WithinAbs;

namespace {

Chunk make_chunk(const std::string& id, const std::string& doc, int page = 1, const std::string& text = "text") {
    Chunk c;
    c.id = id;
    c.document_id = doc;
    c.page = page;
    c.start = 0;
    c.end = text.size();
    c.text = text;
    return c;
}

ManifestEntry entry_for(const std::string& doc, const std::string& hash, const std::vector<EmbeddedChunk>& chunks) {
    ManifestEntry e;
    e.document_id = doc;
    e.content_hash = hash;
    e.mtime = 1700000000;
    for (const auto& c : chunks) e.chunk_ids.push_back(c.chunk.id);
    return e;
}

std::vector<std::string> ids_of(const std::vector<ScoredChunk>& hits) {
    std::vector<std::string> out;
    for (const auto& h : hits) out.push_back(h.chunk.id);
    return out;
}

} // namespace

TEST_CASE("VectorIndex search on an empty index", "[store]") {
    TempDir dir;
    VectorIndex index((dir / "idx.db").string());
    CHECK(index.search({1.0f, 0.0f}, 3).empty());
    CHECK(index.chunk_count() == 0);
    CHECK(index.document_count() == 0);
    CHECK(index.dimension() == 0);
    CHECK_THROWS_AS(index.search({1.0f}, 0), std::invalid_argument);
}

TEST_CASE("VectorIndex ranks by cosine similarity", "[store]") {
    TempDir dir;
    VectorIndex index((dir / "idx.db").string());
    index.upsert(make_chunk("x", "/d/a.pdf"), {10.0f, 0.0f});
    index.upsert(make_chunk("y", "/d/a.pdf"), {0.0f, 3.0f});
    index.upsert(make_chunk("xy", "/d/a.pdf"), {1.0f, 1.0f});
    CHECK(index.dimension() == 2);

    auto hits = index.search({2.0f, 0.2f}, 3);
    REQUIRE(hits.size() == 3);
    CHECK(ids_of(hits) == std::vector<std::string>{"x", "xy", "y"});
    // stored vectors are unit length, so the best score is a cosine
    CHECK_THAT(hits[0].score, WithinAbs(0.995, 0.001));
    CHECK(hits[0].score >= hits[1].score);
    CHECK(hits[1].score >= hits[2].score);

    SECTION("k limits the result") {
        CHECK(index.search({2.0f, 0.2f}, 1).size() == 1);
        CHECK(index.search({2.0f, 0.2f}, 10).size() == 3);
    }

    SECTION("query of another dimension is rejected") {
        CHECK_THROWS_AS(index.search({1.0f, 0.0f, 0.0f}, 3), std::invalid_argument);
    }
}

TEST_CASE("VectorIndex breaks score ties by chunk id", "[store]") {
    TempDir dir;
    VectorIndex index((dir / "idx.db").string());
    index.upsert(make_chunk("b", "/d/a.pdf"), {1.0f, 0.0f});
    index.upsert(make_chunk("c", "/d/a.pdf"), {2.0f, 0.0f});
    index.upsert(make_chunk("a", "/d/a.pdf"), {3.0f, 0.0f});
    CHECK(ids_of(index.search({1.0f, 0.0f}, 3)) == std::vector<std::string>{"a", "b", "c"});
    CHECK(ids_of(index.search({1.0f, 0.0f}, 2)) == std::vector<std::string>{"a", "b"});
}

TEST_CASE("VectorIndex enforces one dimension", "[store]") {
    TempDir dir;
    VectorIndex index((dir / "idx.db").string());
    index.upsert(make_chunk("a", "/d/a.pdf"), {1.0f, 0.0f, 0.0f});
    CHECK_THROWS_AS(index.upsert(make_chunk("b", "/d/a.pdf"), {1.0f, 0.0f}), std::invalid_argument);
    CHECK_THROWS_AS(index.upsert(make_chunk("c", "/d/a.pdf"), {}), std::invalid_argument);
    CHECK(index.chunk_count() == 1);
    CHECK(index.dimension() == 3);
}

TEST_CASE("VectorIndex commit_document replaces a document atomically", "[store]") {
    TempDir dir;
    VectorIndex index((dir / "idx.db").string());

    std::vector<EmbeddedChunk> v1{{make_chunk("v1-a", "/d/a.pdf"), {1.0f, 0.0f}},
                                  {make_chunk("v1-b", "/d/a.pdf", 2), {0.0f, 1.0f}}};
    index.commit_document(entry_for("/d/a.pdf", "h1", v1), v1);
    CHECK(index.chunk_ids_for("/d/a.pdf") == std::vector<std::string>{"v1-a", "v1-b"});
    auto e = index.manifest_entry("/d/a.pdf");
    REQUIRE(e);
    CHECK(e->content_hash == "h1");
    CHECK(e->mtime == 1700000000);
    CHECK(e->chunk_ids == std::vector<std::string>{"v1-a", "v1-b"});

    SECTION("a new version drops every old chunk") {
        std::vector<EmbeddedChunk> v2{{make_chunk("v2-a", "/d/a.pdf"), {1.0f, 1.0f}}};
        index.commit_document(entry_for("/d/a.pdf", "h2", v2), v2);
        CHECK(index.chunk_ids_for("/d/a.pdf") == std::vector<std::string>{"v2-a"});
        CHECK(index.manifest_entry("/d/a.pdf")->content_hash == "h2");
        CHECK_FALSE(index.get_chunk("v1-a"));
    }

    SECTION("a failing commit leaves the previous version") {
        std::vector<EmbeddedChunk> bad{{make_chunk("v2-a", "/d/a.pdf"), {1.0f, 1.0f}},
                                       {make_chunk("v2-b", "/d/a.pdf"), {1.0f, 1.0f, 1.0f}}};
        CHECK_THROWS_AS(index.commit_document(entry_for("/d/a.pdf", "h2", bad), bad), std::invalid_argument);
        CHECK(index.chunk_ids_for("/d/a.pdf") == std::vector<std::string>{"v1-a", "v1-b"});
        CHECK(index.manifest_entry("/d/a.pdf")->content_hash == "h1");
        CHECK(index.dimension() == 2);
    }

    SECTION("chunks of another document are refused") {
        std::vector<EmbeddedChunk> stray{{make_chunk("s", "/d/other.pdf"), {1.0f, 0.0f}}};
        CHECK_THROWS_AS(index.commit_document(entry_for("/d/a.pdf", "h3", stray), stray), std::invalid_argument);
    }

    SECTION("remove_document drops chunks and manifest together") {
        index.remove_document("/d/a.pdf");
        CHECK(index.chunk_ids_for("/d/a.pdf").empty());
        CHECK_FALSE(index.manifest_entry("/d/a.pdf"));
        CHECK(index.search({1.0f, 0.0f}, 5).empty());
    }
}

TEST_CASE("VectorIndex persists across reopen", "[store]") {
    TempDir dir;
    auto path = (dir / "idx.db").string();
    std::vector<EmbeddedChunk> chunks{{make_chunk("a1", "/d/a.pdf", 1, "Alpha text"), {1.0f, 0.0f}},
                                      {make_chunk("a2", "/d/a.pdf", 2, "Beta text"), {0.0f, 1.0f}}};
    {
        VectorIndex index(path);
        index.commit_document(entry_for("/d/a.pdf", "h1", chunks), chunks);
        index.meta_set("embed_model", "bow");
    }
    VectorIndex index(path);
    CHECK(index.dimension() == 2);
    CHECK(index.document_count() == 1);
    CHECK(index.chunk_count() == 2);
    CHECK(index.meta_get("embed_model") == std::optional<std::string>("bow"));
    auto m = index.manifest_get();
    REQUIRE(m.count("/d/a.pdf") == 1);
    CHECK(m["/d/a.pdf"].chunk_ids == std::vector<std::string>{"a1", "a2"});
    auto hits = index.search({0.0f, 1.0f}, 1);
    REQUIRE(hits.size() == 1);
    CHECK(hits[0].chunk.id == "a2");
    CHECK(hits[0].chunk.page == 2);
    CHECK(hits[0].chunk.text == "Beta text");
    CHECK_NOTHROW(index.check_integrity());
}

TEST_CASE("VectorIndex clear empties everything", "[store]") {
    TempDir dir;
    VectorIndex index((dir / "idx.db").string());
    std::vector<EmbeddedChunk> chunks{{make_chunk("a1", "/d/a.pdf"), {1.0f, 0.0f}}};
    index.commit_document(entry_for("/d/a.pdf", "h1", chunks), chunks);
    index.meta_set("embed_model", "bow");
    index.clear();
    CHECK(index.chunk_count() == 0);
    CHECK(index.manifest_get().empty());
    CHECK_FALSE(index.meta_get("embed_model"));
    CHECK(index.dimension() == 0);
    // any dimension is accepted again
    index.upsert(make_chunk("z", "/d/z.pdf"), {1.0f, 0.0f, 0.0f});
    CHECK(index.dimension() == 3);
}

TEST_CASE("VectorIndex prune_orphans repairs half-written state", "[store]") {
    TempDir dir;
    VectorIndex index((dir / "idx.db").string());
    std::vector<EmbeddedChunk> chunks{{make_chunk("a1", "/d/a.pdf"), {1.0f, 0.0f}}};
    index.commit_document(entry_for("/d/a.pdf", "h1", chunks), chunks);

    CHECK(index.prune_orphans() == 0);

    // chunk with no manifest entry
    index.upsert(make_chunk("o1", "/d/orphan.pdf"), {0.0f, 1.0f});
    // manifest entry whose chunks never landed
    ManifestEntry phantom;
    phantom.document_id = "/d/phantom.pdf";
    phantom.content_hash = "h9";
    phantom.chunk_ids = {"p1", "p2"};
    index.manifest_set(phantom);

    CHECK(index.prune_orphans() == 2);
    CHECK_FALSE(index.get_chunk("o1"));
    CHECK_FALSE(index.manifest_entry("/d/phantom.pdf"));
    CHECK(index.chunk_ids_for("/d/a.pdf") == std::vector<std::string>{"a1"});

    int writes = index.write_count();
    CHECK(index.prune_orphans() == 0);
    CHECK(index.write_count() == writes);
}

TEST_CASE("VectorIndex reports a damaged file as corruption", "[store]") {
    TempDir dir;
    auto path = dir / "idx.db";
    write_file(path, std::string(4096, 'Z'));
    CHECK_THROWS_AS(VectorIndex(path.string()), IndexCorruption);
}

TEST_CASE("VectorIndex readers see whole documents during writes", "[store]") {
    TempDir dir;
    VectorIndex index((dir / "idx.db").string());
    auto version = [](int v) {
        std::string p = "v" + std::to_string(v) + "-";
        return std::vector<EmbeddedChunk>{{make_chunk(p + "a", "/d/a.pdf"), {1.0f, 0.0f}},
                                          {make_chunk(p + "b", "/d/a.pdf", 2), {1.0f, 0.5f}}};
    };
    auto v1 = version(1);
    index.commit_document(entry_for("/d/a.pdf", "h1", v1), v1);

    std::atomic<bool> stop{false};
    std::atomic<int> torn{0};
    std::atomic<int> reads{0};
    std::vector<std::thread> readers;
    for (int t = 0; t < 3; ++t) {
        readers.emplace_back([&] {
            while (!stop.load()) {
                auto hits = index.search({1.0f, 0.2f}, 10);
                std::set<char> versions;
                for (const auto& h : hits) versions.insert(h.chunk.id[1]);
                if (hits.size() != 2 || versions.size() != 1) ++torn;
                ++reads;
            }
        });
    }
    for (int i = 0; i < 40; ++i) {
        auto v = version(1 + i % 2);
        index.commit_document(entry_for("/d/a.pdf", "h" + std::to_string(i), v), v);
    }
    while (reads.load() < 10) std::this_thread::yield();
    stop = true;
    for (auto& r : readers) r.join();
    CHECK(torn.load() == 0);
}
