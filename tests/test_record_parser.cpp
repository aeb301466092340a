#include <gtest/gtest.h>
#include <parser/decoder.hpp>
#include <parser/record_parser.hpp>

namespace {

struct NodeName {
    std::string name;
    std::string state;

    void decode(const FieldReader& r) {
        r.field("NodeName", name);
        r.field("State", state);
    }
};

struct WithOptional {
    std::string name;
    std::optional<std::string> reason;
    std::optional<int> count;

    void decode(const FieldReader& r) {
        r.field("Name", name);
        r.field("Reason", reason);
        r.field("Count", count);
    }
};

struct Typed {
    int cpus = 0;
    bool shared = false;
    double load = 0;
    std::vector<std::string> features;
    std::map<std::string, ResourceQuantity> tres;

    void decode(const FieldReader& r) {
        r.field("CPUTot", cpus);
        r.field("Shared", shared);
        r.field("CPULoad", load);
        r.field("Features", features);
        r.field("CfgTRES", tres);
    }
};

} // namespace

// ── Tokenizer ───────────────────────────────────────────────

TEST(RecordParser, SimpleFields) {
    auto rec = tokenize_block("NodeName=x State=IDLE");
    EXPECT_EQ(rec.size(), 2u);
    EXPECT_EQ(rec.get("NodeName"), "x");
    EXPECT_EQ(rec.get("State"), "IDLE");
}

TEST(RecordParser, DecodesIntoStructure) {
    auto n = parse_record<NodeName>("NodeName=x State=IDLE");
    EXPECT_EQ(n.name, "x");
    EXPECT_EQ(n.state, "IDLE");
}

TEST(RecordParser, ValueRunsToNextKey) {
    auto rec = tokenize_block("Reason=Not responding [slurm@2024-01-01] Weight=1");
    EXPECT_EQ(rec.get("Reason"), "Not responding [slurm@2024-01-01]");
    EXPECT_EQ(rec.get("Weight"), "1");
}

TEST(RecordParser, MultilineBlock) {
    auto rec = tokenize_block(
        "NodeName=node4504 Arch=x86_64 CoresPerSocket=32\n"
        "   CPUAlloc=0 CPUTot=64 CPULoad=0.04\n"
        "   CfgTRES=cpu=64,mem=1031314M,billing=64\n");
    EXPECT_EQ(rec.get("NodeName"), "node4504");
    EXPECT_EQ(rec.get("CPUTot"), "64");
    EXPECT_EQ(rec.get("CfgTRES"), "cpu=64,mem=1031314M,billing=64");
    EXPECT_EQ(rec.keys().front(), "NodeName");
}

TEST(RecordParser, TrimsCommasAndWhitespace) {
    EXPECT_EQ(trim_value("  a,b, \n"), "a,b");
    EXPECT_EQ(trim_value(",,"), "");
}

TEST(RecordParser, SentinelsAreAbsent) {
    auto rec = tokenize_block("Name=a Reason=(null) Comment=None Extra=");
    EXPECT_TRUE(rec.has("Name"));
    EXPECT_FALSE(rec.has("Reason"));
    EXPECT_FALSE(rec.has("Comment"));
    EXPECT_FALSE(rec.has("Extra"));
}

TEST(RecordParser, SentinelResolvesToEmptyOptional) {
    auto w = parse_record<WithOptional>("Name=a Reason=(null) Count=None");
    EXPECT_EQ(w.name, "a");
    EXPECT_FALSE(w.reason.has_value());
    EXPECT_FALSE(w.count.has_value());

    auto v = parse_record<WithOptional>("Name=b Reason=None Count=3");
    EXPECT_FALSE(v.reason.has_value());
    ASSERT_TRUE(v.count.has_value());
    EXPECT_EQ(*v.count, 3);
}

TEST(RecordParser, SentinelForRequiredFieldFails) {
    EXPECT_THROW(parse_record<NodeName>("NodeName=x State=(null)"), ParseError);
}

TEST(RecordParser, TwoBlocksInDocumentOrder) {
    auto nodes = parse_records<NodeName>(
        "NodeName=a State=IDLE\n"
        "\n"
        "NodeName=b State=MIXED\n");
    ASSERT_EQ(nodes.size(), 2u);
    EXPECT_EQ(nodes[0].name, "a");
    EXPECT_EQ(nodes[1].name, "b");
    EXPECT_EQ(nodes[1].state, "MIXED");
}

TEST(RecordParser, BlankLinesWithSpacesSeparateBlocks) {
    auto blocks = split_blocks("A=1\n   \n\nB=2\n\n");
    ASSERT_EQ(blocks.size(), 2u);
    EXPECT_EQ(blocks[0], "A=1");
    EXPECT_EQ(blocks[1], "B=2");
}

TEST(RecordParser, RepeatedKeysAccumulate) {
    auto rec = tokenize_block("Nodes=a Mem=1 Nodes=b Mem=2");
    const FieldValue* v = rec.find("Nodes");
    ASSERT_NE(v, nullptr);
    ASSERT_TRUE(v->repeated());
    EXPECT_EQ(v->values[0], "a");
    EXPECT_EQ(v->values[1], "b");

    FieldReader r(rec);
    std::vector<std::string> nodes;
    r.field("Nodes", nodes);
    EXPECT_EQ(nodes, (std::vector<std::string>{"a", "b"}));

    std::string single;
    EXPECT_THROW(r.field("Mem", single), ParseError);
}

TEST(RecordParser, NoKeyIsAnError) {
    EXPECT_THROW(tokenize_block("just some words"), ParseError);
    EXPECT_THROW(parse_record<NodeName>(""), ParseError);
}

TEST(RecordParser, BadBlockCanBeSkipped) {
    std::vector<ParseError> skipped;
    auto nodes = parse_records<NodeName>("NodeName=a State=IDLE\n\ngarbage\n\nNodeName=c State=DOWN",
                                         &skipped);
    ASSERT_EQ(nodes.size(), 2u);
    EXPECT_EQ(nodes[1].name, "c");
    EXPECT_EQ(skipped.size(), 1u);
}

// ── Target-typed decoding ───────────────────────────────────

TEST(Decoder, TypedFields) {
    auto t = parse_record<Typed>(
        "CPUTot=64 Shared=TRUE CPULoad=0.25 Features=avx2,ib CfgTRES=cpu=64,mem=1031314M");
    EXPECT_EQ(t.cpus, 64);
    EXPECT_TRUE(t.shared);
    EXPECT_DOUBLE_EQ(t.load, 0.25);
    EXPECT_EQ(t.features, (std::vector<std::string>{"avx2", "ib"}));
    ASSERT_EQ(t.tres.size(), 2u);
    EXPECT_EQ(t.tres["cpu"].value, 64u);
    EXPECT_EQ(t.tres["mem"].value, 1031314000000ull);
}

TEST(Decoder, NonNumericFailsWithKey) {
    try {
        parse_record<Typed>("CPUTot=lots Shared=0 CPULoad=0 Features=a CfgTRES=cpu=1");
        FAIL() << "expected ParseError";
    } catch (const ParseError& e) {
        EXPECT_EQ(e.key(), "CPUTot");
        EXPECT_EQ(e.value(), "lots");
    }
}

TEST(Decoder, Bools) {
    EXPECT_TRUE(decode_text<bool>("1"));
    EXPECT_FALSE(decode_text<bool>("0"));
    EXPECT_TRUE(decode_text<bool>("True"));
    EXPECT_FALSE(decode_text<bool>("FALSE"));
    EXPECT_THROW(decode_text<bool>("yes"), ParseError);
}

TEST(Decoder, UnsignedRejectsNegative) {
    EXPECT_EQ(decode_text<uint32_t>("42"), 42u);
    EXPECT_THROW(decode_text<uint32_t>("-1"), ParseError);
    EXPECT_THROW(decode_text<uint8_t>("300"), ParseError);
}

TEST(Decoder, MappingSplitsOnFirstEquals) {
    auto m = decode_text<std::map<std::string, std::string>>("a=1,b=x=y");
    EXPECT_EQ(m["a"], "1");
    EXPECT_EQ(m["b"], "x=y");
    EXPECT_THROW((decode_text<std::map<std::string, std::string>>("novalue")), ParseError);
}

TEST(Decoder, MissingRequiredField) {
    Record rec = tokenize_block("Other=1");
    FieldReader r(rec);
    int n = 0;
    EXPECT_THROW(r.field("CPUTot", n), ParseError);
    r.field_or("CPUTot", n, 7);
    EXPECT_EQ(n, 7);
}
