#define CATCH_CONFIG_MAIN
#include <catch2/catch_all.hpp>

#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "../include/codec.hpp"

using namespace metacat::link;
using namespace metacat::logger;

// ---------------- Helpers ----------------

class CaptureSink : public ILoggerSink 
{
public:
    void write(const LogRecord& rec) override { records.push_back(rec); }
    std::vector<LogRecord> records;
};

static Address mustMake(std::string type, std::string fqn,
                        std::optional<std::string> field = std::nullopt,
                        std::optional<std::string> arrayName = std::nullopt,
                        std::optional<std::string> arrayValue = std::nullopt) {
    auto r = Address::make(std::move(type), std::move(fqn), std::move(field), std::move(arrayName), std::move(arrayValue));
    REQUIRE(r.has_value());
    return r.get();
}

// ---------------- parseOne ----------------

TEST_CASE("parseOne: end-to-end array field with value") {
    auto r = parseOne("<#E/table/bigquery_gcp.shopify.raw_product_catalog/columns/comment/description>");
    REQUIRE(r.has_value());

    const auto& a = r.get();
    CHECK(a.entityType() == "table");
    CHECK(a.entityFqn() == "bigquery_gcp.shopify.raw_product_catalog");
    CHECK(*a.fieldName() == "columns");
    CHECK(*a.arrayFieldName() == "comment");
    CHECK(*a.arrayFieldValue() == "description");
    CHECK(a.kind() == LinkKind::arrayField);
    CHECK(a.qualifiedType() == "table.columns.member");
    CHECK(a.qualifiedValue() == "bigquery_gcp.shopify.raw_product_catalog.comment.description");
}

TEST_CASE("parseOne: kinds follow the number of segments") {
    CHECK(parseOne("<#E/table/db.t1>").get().kind() == LinkKind::entity);
    CHECK(parseOne("<#E/table/db.t1/description>").get().kind() == LinkKind::field);
    CHECK(parseOne("<#E/table/db.t1/columns/comment>").get().kind() == LinkKind::arrayField);
    CHECK(parseOne("<#E/table/db.t1/columns/comment/tags>").get().kind() == LinkKind::arrayField);
}

TEST_CASE("parseOne: fallback display text is ignored") {
    auto withFallback = parseOne("<#E/user/user1|[@User One](http://x)>");
    auto plain = parseOne("<#E/user/user1>");
    REQUIRE(withFallback.has_value());
    REQUIRE(plain.has_value());
    CHECK(withFallback.get() == plain.get());
    CHECK(withFallback.get() == mustMake("user", "user1"));
}

TEST_CASE("parseOne: surrounding text is tolerated") {
    auto r = parseOne("ping <#E/table/db.t1/description> please");
    REQUIRE(r.has_value());
    CHECK(r.get() == mustMake("table", "db.t1", "description"));
}

TEST_CASE("parseOne: two links are ambiguous") {
    auto r = parseOne("<#E/a/b> <#E/c/d>");
    REQUIRE_FALSE(r.has_value());
    CHECK(r.error->code == ErrorCode::ambiguousAddress);
}

TEST_CASE("parseOne: no link is malformed") {
    for (const char* text : {"", "no links here", "<#E/table>", "<#E/table/db.t1", "<#E/table//x>"}) {
        INFO(text);
        auto r = parseOne(text);
        REQUIRE_FALSE(r.has_value());
        CHECK(r.error->code == ErrorCode::malformedAddress);
    }
}

TEST_CASE("parseOne: fallback text hides anything after the first pipe") {
    // second link sits inside the discarded fallback text
    auto r = parseOne("<#E/a/b|see <#E/c/d>>");
    REQUIRE(r.has_value());
    CHECK(r.get() == mustMake("a", "b"));
}

TEST_CASE("parseOne: strict fallback rejects delimiters in the display text") {
    LinkCodec strict(LinkCodecConfig{ .strictFallbackDisplay = true });

    CHECK(strict.parseOne("<#E/user/user1|[@User One](http://x)>").has_value());
    CHECK(strict.parseOne("<#E/user/user1>").has_value());

    auto r = strict.parseOne("<#E/user/user1|a>b>");
    REQUIRE_FALSE(r.has_value());
    CHECK(r.error->code == ErrorCode::malformedAddress);

    // lenient default keeps the documented truncation
    CHECK(parseOne("<#E/user/user1|a>b>").has_value());
}

// ---------------- extractAll ----------------

TEST_CASE("extractAll: returns links in order") {
    auto r = extractAll("see <#E/table/db.t1> and <#E/table/db.t2/description>");
    REQUIRE(r.has_value());
    REQUIRE(r.get().size() == 2);
    CHECK(r.get()[0] == mustMake("table", "db.t1"));
    CHECK(r.get()[0].kind() == LinkKind::entity);
    CHECK(r.get()[1] == mustMake("table", "db.t2", "description"));
    CHECK(r.get()[1].kind() == LinkKind::field);
}

TEST_CASE("extractAll: plain text yields nothing") {
    auto r = extractAll("no links here");
    REQUIRE(r.has_value());
    CHECK(r.get().empty());
}

TEST_CASE("extractAll: mentions with fallback text and broken candidates") {
    const std::string msg =
        "<#E/user/alice|[@Alice](http://localhost:8585/user/alice)> can you check "
        "<#E/table/db.orders/columns/amount/description>? <#E/broken and <#E/table>";
    auto r = extractAll(msg);
    REQUIRE(r.has_value());
    REQUIRE(r.get().size() == 2);
    CHECK(r.get()[0] == mustMake("user", "alice"));
    CHECK(r.get()[1] == mustMake("table", "db.orders", "columns", "amount", "description"));
}

TEST_CASE("extractAll: is restartable on the same input") {
    const std::string msg = "<#E/a/b> <#E/c/d/e>";
    auto first = extractAll(msg);
    auto second = extractAll(msg);
    REQUIRE(first.has_value());
    REQUIRE(second.has_value());
    CHECK(first.get() == second.get());
}

TEST_CASE("extractAll: maxLinksPerMessage keeps the first links and warns") {
    auto sink = std::make_shared<CaptureSink>();
    auto log = std::make_shared<Logger>(sink);
    log->setLevel(LogLevel::warn);

    LinkCodec codec(LinkCodecConfig{ .maxLinksPerMessage = 2 }, log);
    auto r = codec.extractAll("<#E/a/1> <#E/a/2> <#E/a/3>");
    REQUIRE(r.has_value());
    REQUIRE(r.get().size() == 2);
    CHECK(r.get()[1] == mustMake("a", "2"));

    REQUIRE(sink->records.size() == 1);
    CHECK(sink->records[0].level == LogLevel::warn);
    CHECK(sink->records[0].count == 3);
}

TEST_CASE("extractAll: safe to call from several threads") {
    const LinkCodec codec;
    const std::string msg = "<#E/table/db.t1> <#E/table/db.t1/columns/c1> <#E/user/u|x>";

    std::vector<std::thread> workers;
    std::vector<std::size_t> counts(8, 0);
    for (std::size_t i = 0; i < counts.size(); ++i) {
        workers.emplace_back([&, i] {
            for (int n = 0; n < 200; ++n) {
                auto r = codec.extractAll(msg);
                if (r.has_value()) counts[i] += r.get().size();
            }
        });
    }
    for (auto& t : workers) t.join();

    for (auto c : counts) CHECK(c == 600);
}

// ---------------- render ----------------

TEST_CASE("render: canonical form for every kind") {
    CHECK(render(mustMake("table", "db.t1")) == "<#E/table/db.t1>");
    CHECK(render(mustMake("table", "db.t1", "description")) == "<#E/table/db.t1/description>");
    CHECK(render(mustMake("table", "db.t1", "columns", "comment")) == "<#E/table/db.t1/columns/comment>");
    CHECK(render(mustMake("table", "db.t1", "columns", "comment", "tags")) == "<#E/table/db.t1/columns/comment/tags>");
}

TEST_CASE("render: parses back to the same address") {
    const std::vector<Address> samples = {
        mustMake("table", "bigquery_gcp.shopify.raw_product_catalog"),
        mustMake("pipeline", "airflow.daily_load", "tasks"),
        mustMake("table", "db.t1", "columns", "comment"),
        mustMake("table", "db.t1", "columns", "comment", "a/b"),
    };

    for (auto const& a : samples) {
        INFO(a.toString());
        auto back = parseOne(render(a));
        REQUIRE(back.has_value());
        CHECK(back.get() == a);
        CHECK(render(back.get()) == render(a));
    }

    // a '|' would be cut off as fallback text on the way back, so it never gets rendered
    for (auto const& bad : {Address::make("table", "db|t1"),
                            Address::make("table", "db.t1", "a|b"),
                            Address::make("table", "db.t1", "columns", "comment", "x|y")}) {
        REQUIRE_FALSE(bad.has_value());
        CHECK(bad.error->code == ErrorCode::malformedAddress);
    }
}

TEST_CASE("renderWithFallback: appends display text that parsing drops") {
    const LinkCodec codec;
    auto a = mustMake("user", "user1");

    auto link = codec.renderWithFallback(a, "[@User One](http://x)");
    REQUIRE(link.has_value());
    CHECK(link.get() == "<#E/user/user1|[@User One](http://x)>");
    CHECK(codec.parseOne(link.get()).get() == a);

    auto plain = codec.renderWithFallback(a, "");
    REQUIRE(plain.has_value());
    CHECK(plain.get() == "<#E/user/user1>");
}

TEST_CASE("renderWithFallback: rendered mentions are found again in a message") {
    const LinkCodec codec;
    auto a = mustMake("user", "u1");

    auto link = codec.renderWithFallback(a, "[@User One](http://localhost:8585/user/u1)");
    REQUIRE(link.has_value());

    auto found = codec.extractAll("hi " + link.get() + " please review");
    REQUIRE(found.has_value());
    REQUIRE(found.get().size() == 1);
    CHECK(found.get()[0] == a);
}

TEST_CASE("renderWithFallback: display text with link delimiters is rejected") {
    const LinkCodec codec;
    auto a = mustMake("user", "u1");

    for (const char* display : {"<b>bold</b>", "a > b", "<"}) {
        INFO(display);
        auto r = codec.renderWithFallback(a, display);
        REQUIRE_FALSE(r.has_value());
        CHECK(r.error->code == ErrorCode::malformedAddress);
    }
}

// ---------------- logging ----------------

TEST_CASE("LinkCodec: logs parse outcome with structured fields") {
    auto sink = std::make_shared<CaptureSink>();
    auto log = std::make_shared<Logger>(sink);
    log->setLevel(LogLevel::trace);

    LinkCodec codec({}, log);
    REQUIRE(codec.parseOne("x <#E/table/db.t1/description>").has_value());

    REQUIRE_FALSE(sink->records.empty());
    const auto& rec = sink->records.back();
    CHECK(rec.logger == "LinkCodec");
    CHECK(rec.token == "<#E/table/db.t1/description>");
    CHECK(rec.kind == "FIELD");
    CHECK(rec.offset == 2);
}

TEST_CASE("LinkCodec: no parse record below the trace threshold") {
    auto sink = std::make_shared<CaptureSink>();
    auto log = std::make_shared<Logger>(sink);
    log->setLevel(LogLevel::debug);

    LinkCodec codec({}, log);
    REQUIRE(codec.parseOne("x <#E/table/db.t1/description>").has_value());
    CHECK(sink->records.empty());
}

TEST_CASE("LinkCodec: silent when the logger threshold is above debug") {
    auto sink = std::make_shared<CaptureSink>();
    auto log = std::make_shared<Logger>(sink);
    log->setLevel(LogLevel::info);

    LinkCodec codec({}, log);
    CHECK_FALSE(codec.parseOne("nothing").has_value());
    REQUIRE(codec.extractAll("<#E/a/b>").has_value());
    CHECK(sink->records.empty());
}
