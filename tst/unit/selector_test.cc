#include <cstdlib>
#include <cstddef>
#include <cstring>
#include <cstdio>
#include <cstdint>
#include <memory>
#include <vector>
#include <string>
#include <gtest/gtest.h>
#include "jqr/dom.h"
#include "jqr/jqr.h"
#include "jqr/selector.h"
#include "test_env.h"

class SelectorTest : public ::testing::Test {
 protected:
    const char *store = "{\n"
                        "  \"budget\": 10.00,\n"
                        "  \"favorite\": \"Sword of Honour\",\n"
                        "  \"store\": {\n"
                        "    \"books\": [\n"
                        "      {\n"
                        "        \"category\": \"reference\",\n"
                        "        \"author\": \"Nigel Rees\",\n"
                        "        \"title\": \"Sayings of the Century\",\n"
                        "        \"price\": 8.95\n"
                        "      },\n"
                        "      {\n"
                        "        \"category\": \"fiction\",\n"
                        "        \"author\": \"Evelyn Waugh\",\n"
                        "        \"title\": \"Sword of Honour\",\n"
                        "        \"price\": 12.99,\n"
                        "        \"movies\": [\n"
                        "          {\n"
                        "            \"title\": \"Sword of Honour\",\n"
                        "            \"realisator\": {\n"
                        "              \"first_name\": \"Bill\",\n"
                        "              \"last_name\": \"Anderson\"\n"
                        "            }\n"
                        "          }\n"
                        "        ]\n"
                        "      },\n"
                        "      {\n"
                        "        \"category\": \"fiction\",\n"
                        "        \"author\": \"Herman Melville\",\n"
                        "        \"title\": \"Moby Dick\",\n"
                        "        \"isbn\": \"0-553-21311-3\",\n"
                        "        \"price\": 9\n"
                        "      },\n"
                        "      {\n"
                        "        \"category\": \"fiction\",\n"
                        "        \"author\": \"J. R. R. Tolkien\",\n"
                        "        \"title\": \"The Lord of the Rings\",\n"
                        "        \"isbn\": \"0-395-19395-8\",\n"
                        "        \"price\": 22.99\n"
                        "      }\n"
                        "    ],\n"
                        "    \"bicycle\": {\n"
                        "      \"color\": \"red\",\n"
                        "      \"price\": 19.95\n"
                        "    }\n"
                        "  }\n"
                        "}";

    const char *node_accounts = "{\n"
                                "  \"clientName\": \"jim\",\n"
                                "  \"nameSpace\": \"BobSpace\",\n"
                                "  \"codeName\": \"codeName\",\n"
                                "  \"codeId\": 5555,\n"
                                "  \"codeData\": {\n"
                                "    \"uTaskQueue_CodeData\": [\n"
                                "      {\n"
                                "        \"stuff\": 99\n"
                                "      }\n"
                                "    ]\n"
                                "  },\n"
                                "  \"nodeData\": [\n"
                                "    {\n"
                                "      \"selfNodeId\": 1,\n"
                                "      \"selfAndChildNodeIds\": [\n"
                                "        1,\n"
                                "        2,\n"
                                "        3\n"
                                "      ],\n"
                                "      \"uTaskQueue_NodeData\": [\n"
                                "        {\n"
                                "          \"hidden\": \"1+2+3\",\n"
                                "          \"usercreate\": -1000\n"
                                "        }\n"
                                "      ]\n"
                                "    },\n"
                                "    {\n"
                                "      \"selfNodeId\": 10,\n"
                                "      \"selfAndChildNodeIds\": [\n"
                                "        10,\n"
                                "        11,\n"
                                "        12\n"
                                "      ],\n"
                                "      \"uTaskQueue_NodeData\": [\n"
                                "        {\n"
                                "         \"hidden\": \"10+11+12\",\n"
                                "         \"other_stuff\": 1000\n"
                                "        }\n"
                                "      ]\n"
                                "    }\n"
                                "  ]\n"
                                "}";

    PathExpression expr;
    Selector selector;

    void SetUp() override {
        setupTestEnv();
    }

    // Compile the path and, if it compiles, evaluate it against doc.
    JqrUtilCode select(const JDocument *doc, const char *path) {
        JqrUtilCode rc = PathCompiler().compile(path, expr);
        if (rc != JQRUTIL_SUCCESS) return rc;
        selector.getValues(*doc, expr);
        return JQRUTIL_SUCCESS;
    }

    JDocument *parse(const char *json) {
        JDocument *doc;
        JqrUtilCode rc = dom_parse(json, strlen(json), &doc);
        EXPECT_EQ(rc, JQRUTIL_SUCCESS);
        return doc;
    }
};

TEST_F(SelectorTest, test_filterExpr_attributeFilter) {
    JDocument *d1 = parse(store);

    JqrUtilCode rc = select(d1, "$.store.books[?(@.isbn)]");
    EXPECT_EQ(rc, JQRUTIL_SUCCESS);
    auto &rs = selector.getResultSet();
    EXPECT_EQ(rs.size(), 2);
    EXPECT_EQ(rs[0].path, "/store/books/2");
    EXPECT_EQ(rs[1].path, "/store/books/3");

    dom_free_doc(d1);
}

TEST_F(SelectorTest, test_filterExpr_expression_part1) {
    JDocument *d1 = parse(store);

    JqrUtilCode rc = select(d1, "$.store.books[?(@.price<10.0)]");
    EXPECT_EQ(rc, JQRUTIL_SUCCESS);
    EXPECT_EQ(selector.getResultSet().size(), 2);

    rc = select(d1, "$.store.books[?(@.price<=8.95)]");
    EXPECT_EQ(rc, JQRUTIL_SUCCESS);
    EXPECT_EQ(selector.getResultSet().size(), 1);

    rc = select(d1, "$.store.books[?(@.price<=1.299e+1)]");
    EXPECT_EQ(rc, JQRUTIL_SUCCESS);
    EXPECT_EQ(selector.getResultSet().size(), 3);

    rc = select(d1, "$.store.books[?(@.price==9)]");
    EXPECT_EQ(rc, JQRUTIL_SUCCESS);
    EXPECT_EQ(selector.getResultSet().size(), 1);

    rc = select(d1, "$.store.books[?(@.category==\"fiction\")]");
    EXPECT_EQ(rc, JQRUTIL_SUCCESS);
    EXPECT_EQ(selector.getResultSet().size(), 3);

    rc = select(d1, "$.store.books[?(@.category=='fiction')]");
    EXPECT_EQ(rc, JQRUTIL_SUCCESS);
    EXPECT_EQ(selector.getResultSet().size(), 3);

    dom_free_doc(d1);
}

TEST_F(SelectorTest, test_filterExpr_expression_part2) {
    JDocument *d1 = parse(store);

    JqrUtilCode rc = select(d1, "$.store.books[?(@.price<9||@.price>10&&@.isbn)].price");
    EXPECT_EQ(rc, JQRUTIL_SUCCESS);
    auto &rs = selector.getResultSet();
    EXPECT_EQ(rs.size(), 2);
    EXPECT_EQ(rs[0].value->GetDouble(), 8.95);
    EXPECT_EQ(rs[1].value->GetDouble(), 22.99);

    rc = select(d1, "$.store.books[?((@.price<9||@.price>10)&&@.isbn)].price");
    EXPECT_EQ(rc, JQRUTIL_SUCCESS);
    auto &rs2 = selector.getResultSet();
    EXPECT_EQ(rs2.size(), 1);
    EXPECT_EQ(rs2[0].value->GetDouble(), 22.99);

    dom_free_doc(d1);
}

TEST_F(SelectorTest, test_filterExpr_expression_part3) {
    JDocument *d1 = parse(store);

    JqrUtilCode rc = select(d1, "$[\"budget\"]");
    EXPECT_EQ(rc, JQRUTIL_SUCCESS);
    auto &rs = selector.getResultSet();
    EXPECT_EQ(rs.size(), 1);
    EXPECT_EQ(rs[0].value->GetDouble(), 10.00);

    rc = select(d1, "$.store.books[?(@.price<$[\"budget\"])]");
    EXPECT_EQ(rc, JQRUTIL_SUCCESS);
    EXPECT_EQ(selector.getResultSet().size(), 2);

    rc = select(d1, "$.store.books[?(@.price<$.store.books[1].price)]");
    EXPECT_EQ(rc, JQRUTIL_SUCCESS);
    EXPECT_EQ(selector.getResultSet().size(), 2);

    rc = select(d1, "$.store.books[?(@.price<$.store.books[-3].price)]");
    EXPECT_EQ(rc, JQRUTIL_SUCCESS);
    EXPECT_EQ(selector.getResultSet().size(), 2);

    rc = select(d1, "$.store.books[?(@.price<$.store.books[+1].price)]");
    EXPECT_EQ(rc, JQRUTIL_SUCCESS);
    EXPECT_EQ(selector.getResultSet().size(), 2);

    rc = select(d1, "$.store.books[?(@.price<$['store'][\"books\"][1].price)]");
    EXPECT_EQ(rc, JQRUTIL_SUCCESS);
    EXPECT_EQ(selector.getResultSet().size(), 2);

    rc = select(d1, "$.store.books[?(@.price<$.store.[\"books\"][1].price)]");
    EXPECT_EQ(rc, JQRUTIL_SUCCESS);
    EXPECT_EQ(selector.getResultSet().size(), 2);

    rc = select(d1, "$.store.books[?($['store']..books[1].price>@.price)]");
    EXPECT_EQ(rc, JQRUTIL_SUCCESS);
    EXPECT_EQ(selector.getResultSet().size(), 2);

    rc = select(d1, "$.store.books[?(@.title==$.favorite)].title");
    EXPECT_EQ(rc, JQRUTIL_SUCCESS);
    auto &rs2 = selector.getResultSet();
    EXPECT_EQ(rs2.size(), 1);
    EXPECT_STREQ(rs2[0].value->GetString(), "Sword of Honour");

    rc = select(d1, "$.store.books[?(@.title==$.[\"favorite\"])].title");
    EXPECT_EQ(rc, JQRUTIL_SUCCESS);
    EXPECT_EQ(selector.getResultSet().size(), 1);

    // a "$" path that selects a container, or nothing, never compares equal
    rc = select(d1, "$.store.books[?(@.title==$[\"store\"])]");
    EXPECT_EQ(rc, JQRUTIL_SUCCESS);
    EXPECT_TRUE(selector.getResultSet().empty());

    rc = select(d1, "$.store.books[?(@.title==$[\"nothing\"])]");
    EXPECT_EQ(rc, JQRUTIL_SUCCESS);
    EXPECT_TRUE(selector.getResultSet().empty());

    // more than one value
    rc = select(d1, "$.store.books[?(@.title==$..title)]");
    EXPECT_EQ(rc, JQRUTIL_SUCCESS);
    EXPECT_TRUE(selector.getResultSet().empty());

    dom_free_doc(d1);
}

TEST_F(SelectorTest, test_filterExpr_expression_part4) {
    JDocument *d1 = parse(store);

    JqrUtilCode rc = select(d1, "$.store.books[?(10.0>@.price)]");
    EXPECT_EQ(rc, JQRUTIL_SUCCESS);
    EXPECT_EQ(selector.getResultSet().size(), 2);

    rc = select(d1, "$.store.books[?($.favorite==@.title)].title");
    EXPECT_EQ(rc, JQRUTIL_SUCCESS);
    EXPECT_EQ(selector.getResultSet().size(), 1);

    rc = select(d1, "$.store.books[?(9>@.price || 10<@.price && @.isbn)].price");
    EXPECT_EQ(rc, JQRUTIL_SUCCESS);
    auto &rs = selector.getResultSet();
    EXPECT_EQ(rs.size(), 2);
    EXPECT_EQ(rs[0].value->GetDouble(), 8.95);
    EXPECT_EQ(rs[1].value->GetDouble(), 22.99);

    rc = select(d1, "$.store.books[?((9>@.price||10<@.price)&&@.isbn)].price");
    EXPECT_EQ(rc, JQRUTIL_SUCCESS);
    auto &rs2 = selector.getResultSet();
    EXPECT_EQ(rs2.size(), 1);
    EXPECT_EQ(rs2[0].value->GetDouble(), 22.99);

    rc = select(d1, "$.store.books[?($[\"budget\"]>=@.price)]");
    EXPECT_EQ(rc, JQRUTIL_SUCCESS);
    EXPECT_EQ(selector.getResultSet().size(), 2);

    rc = select(d1, "$.store.books[?(8.95==@.price)]");
    EXPECT_EQ(rc, JQRUTIL_SUCCESS);
    EXPECT_EQ(selector.getResultSet().size(), 1);

    dom_free_doc(d1);
}

TEST_F(SelectorTest, test_filterExpr_expression_part5) {
    JDocument *d1 = parse("[1,2,3,4,5]");

    JqrUtilCode rc = select(d1, "$.*.[?(@>2)]");
    EXPECT_EQ(rc, JQRUTIL_SUCCESS);
    auto &rs = selector.getResultSet();
    EXPECT_EQ(rs.size(), 3);
    EXPECT_EQ(rs[0].value->GetInt(), 3);
    EXPECT_EQ(rs[1].value->GetInt(), 4);
    EXPECT_EQ(rs[2].value->GetInt(), 5);

    rc = select(d1, "$.*.[?(2<@)]");
    EXPECT_EQ(rc, JQRUTIL_SUCCESS);
    EXPECT_EQ(selector.getResultSet().size(), 3);

    rc = select(d1, "$.*.[?(2<@&&@<5)]");
    EXPECT_EQ(rc, JQRUTIL_SUCCESS);
    auto &rs3 = selector.getResultSet();
    EXPECT_EQ(rs3.size(), 2);
    EXPECT_EQ(rs3[0].value->GetInt(), 3);
    EXPECT_EQ(rs3[1].value->GetInt(), 4);

    JDocument *d2 = parse("[true,false,true]");

    rc = select(d2, "$..[?(@==true)]");
    EXPECT_EQ(rc, JQRUTIL_SUCCESS);
    auto &rs4 = selector.getResultSet();
    EXPECT_EQ(rs4.size(), 2);
    EXPECT_EQ(rs4[0].value->GetBool(), true);
    EXPECT_EQ(rs4[1].value->GetBool(), true);

    rc = select(d2, "$..[?(@==false)]");
    EXPECT_EQ(rc, JQRUTIL_SUCCESS);
    auto &rs5 = selector.getResultSet();
    EXPECT_EQ(rs5.size(), 1);
    EXPECT_EQ(rs5[0].value->GetBool(), false);

    rc = select(d2, "$.*.[?(@!=true)]");
    EXPECT_EQ(rc, JQRUTIL_SUCCESS);
    auto &rs6 = selector.getResultSet();
    EXPECT_EQ(rs6.size(), 1);
    EXPECT_EQ(rs6[0].value->GetBool(), false);

    rc = select(d2, "$..[?(@ <= true)]");
    EXPECT_EQ(rc, JQRUTIL_SUCCESS);
    auto &rs7 = selector.getResultSet();
    EXPECT_EQ(rs7.size(), 3);
    EXPECT_EQ(rs7[0].value->GetBool(), true);
    EXPECT_EQ(rs7[1].value->GetBool(), false);
    EXPECT_EQ(rs7[2].value->GetBool(), true);

    rc = select(d2, "$..[?(@<true)]");
    EXPECT_EQ(rc, JQRUTIL_SUCCESS);
    auto &rs8 = selector.getResultSet();
    EXPECT_EQ(rs8.size(), 1);
    EXPECT_EQ(rs8[0].value->GetBool(), false);

    dom_free_doc(d1);
    dom_free_doc(d2);
}

TEST_F(SelectorTest, test_filterExpr_expression_part6) {
    JDocument *d1 = parse("[{\"NumEntry\":1},{\"NumEntry\":2},{\"NumEntry\":3},"
                          "{\"NumEntry\":4},{\"NumEntry\":5},{\"NumEntry\":6}]");

    JqrUtilCode rc = select(d1, "$..[?(@.NumEntry>4)].NumEntry");
    EXPECT_EQ(rc, JQRUTIL_SUCCESS);
    auto &rs0 = selector.getResultSet();
    EXPECT_EQ(rs0.size(), 2);
    EXPECT_EQ(rs0[0].value->GetInt(), 5);
    EXPECT_EQ(rs0[1].value->GetInt(), 6);

    rc = select(d1, "$..[?(4<@.NumEntry||@.NumEntry<3)].NumEntry");
    EXPECT_EQ(rc, JQRUTIL_SUCCESS);
    auto &rs1 = selector.getResultSet();
    EXPECT_EQ(rs1.size(), 4);
    EXPECT_EQ(rs1[0].value->GetInt(), 1);
    EXPECT_EQ(rs1[1].value->GetInt(), 2);
    EXPECT_EQ(rs1[2].value->GetInt(), 5);
    EXPECT_EQ(rs1[3].value->GetInt(), 6);

    rc = select(d1, "$..NumEntry[?(@>4)]");
    EXPECT_EQ(rc, JQRUTIL_SUCCESS);
    auto &rs2 = selector.getResultSet();
    EXPECT_EQ(rs2.size(), 2);
    EXPECT_EQ(rs2[0].value->GetInt(), 5);
    EXPECT_EQ(rs2[1].value->GetInt(), 6);

    rc = select(d1, "$..[\"NumEntry\"][?(6>@&&@>3)]");
    EXPECT_EQ(rc, JQRUTIL_SUCCESS);
    auto &rs3 = selector.getResultSet();
    EXPECT_EQ(rs3.size(), 2);
    EXPECT_EQ(rs3[0].value->GetInt(), 4);
    EXPECT_EQ(rs3[1].value->GetInt(), 5);

    // a number has no members
    rc = select(d1, "$..NumEntry[?(@.NumEntry)]");
    EXPECT_EQ(rc, JQRUTIL_SUCCESS);
    EXPECT_TRUE(selector.getResultSet().empty());

    dom_free_doc(d1);
}

TEST_F(SelectorTest, test_filterExpr_expression_part7) {
    const char *input = "{"
                        "  \"key for key\"     : \"key inside here\","
                        "  \"key$for$key\"     : \"key inside here\","
                        "  \"key'for'key\"     : \"key inside here\","
                        "  \"key\\\"for\\\"key\"     : \"key inside here\","
                        "  \"an object\"       : {"
                        "    \"weight\"   : 300,"
                        "    \"a value\"  : 300,"
                        "    \"poquo value\"  : \"\\\"\","
                        "    \"my key\"   : \"key inside here\""
                        "  },"
                        "  \"anonther object\" : {"
                        "    \"weight\"   : 400,"
                        "    \"a value\"  : 400,"
                        "    \"poquo value\"  : \"'\","
                        "    \"my key\"   : \"key inside there\""
                        "  }"
                        "}";
    JDocument *d1 = parse(input);

    JqrUtilCode rc = select(d1, "$..[?(@[\"my key\"]==\"key inside here\")]");
    EXPECT_EQ(rc, JQRUTIL_SUCCESS);
    EXPECT_EQ(selector.getResultSet().size(), 1);

    rc = select(d1, "$[\"key for key\"]");
    EXPECT_EQ(rc, JQRUTIL_SUCCESS);
    EXPECT_EQ(selector.getResultSet().size(), 1);

    rc = select(d1, "$..[?(@[\"my key\"]==$[\"key$for$key\"])].weight");
    EXPECT_EQ(rc, JQRUTIL_SUCCESS);
    auto &rs = selector.getResultSet();
    EXPECT_EQ(rs.size(), 1);
    EXPECT_EQ(rs[0].value->GetInt(), 300);

    rc = select(d1, "$..[?(@[\"my key\"]==$[\"key'for'key\"])].weight");
    EXPECT_EQ(rc, JQRUTIL_SUCCESS);
    auto &rs2 = selector.getResultSet();
    EXPECT_EQ(rs2.size(), 1);
    EXPECT_EQ(rs2[0].value->GetInt(), 300);

    rc = select(d1, "$..[?(@[\"my key\"]==$[\"key\\\"for\\\"key\"])].weight");
    EXPECT_EQ(rc, JQRUTIL_SUCCESS);
    auto &rs3 = selector.getResultSet();
    EXPECT_EQ(rs3.size(), 1);
    EXPECT_EQ(rs3[0].value->GetInt(), 300);

    rc = select(d1, "$..[?($[\"key for key\"]==@[\"my key\"])].weight");
    EXPECT_EQ(rc, JQRUTIL_SUCCESS);
    auto &rs4 = selector.getResultSet();
    EXPECT_EQ(rs4.size(), 1);
    EXPECT_EQ(rs4[0].value->GetInt(), 300);

    rc = select(d1, "$..[?(@[\"poquo value\"]=='\"')].weight");
    EXPECT_EQ(rc, JQRUTIL_SUCCESS);
    auto &rs5 = selector.getResultSet();
    EXPECT_EQ(rs5.size(), 1);
    EXPECT_EQ(rs5[0].value->GetInt(), 300);

    rc = select(d1, "$..[?(@[\"poquo value\"]==\"'\")].weight");
    EXPECT_EQ(rc, JQRUTIL_SUCCESS);
    auto &rs6 = selector.getResultSet();
    EXPECT_EQ(rs6.size(), 1);
    EXPECT_EQ(rs6[0].value->GetInt(), 400);

    rc = select(d1, "$..[?(@[\"my key\"]==$.\"key'for'key\")].weight");
    EXPECT_NE(rc, JQRUTIL_SUCCESS);

    dom_free_doc(d1);
}

TEST_F(SelectorTest, test_filterExpr_single_recursion_array) {
    JDocument *d1 = parse(node_accounts);

    JqrUtilCode rc = select(d1, "$..nodeData[?(@.selfAndChildNodeIds[?(@==10)])]..hidden");
    EXPECT_EQ(rc, JQRUTIL_SUCCESS);
    auto &rs0 = selector.getResultSet();
    EXPECT_EQ(rs0.size(), 1);
    EXPECT_STREQ(rs0[0].value->GetString(), "10+11+12");

    rc = select(d1, "$..nodeData[?(@.selfAndChildNodeIds[?(2==@)])]..hidden");
    EXPECT_EQ(rc, JQRUTIL_SUCCESS);
    auto &rs1 = selector.getResultSet();
    EXPECT_EQ(rs1.size(), 1);
    EXPECT_STREQ(rs1[0].value->GetString(), "1+2+3");

    rc = select(d1, "$..nodeData[?(@.selfAndChildNodeIds[?(100>=@)])]..hidden");
    EXPECT_EQ(rc, JQRUTIL_SUCCESS);
    auto &rs2 = selector.getResultSet();
    EXPECT_EQ(rs2.size(), 2);
    EXPECT_STREQ(rs2[0].value->GetString(), "1+2+3");
    EXPECT_STREQ(rs2[1].value->GetString(), "10+11+12");

    rc = select(d1, "$..nodeData[?(@.selfAndChildNodeIds[?(100<=@)])]..hidden");
    EXPECT_EQ(rc, JQRUTIL_SUCCESS);
    EXPECT_EQ(selector.getResultSet().size(), 0);

    rc = select(d1, "$..nodeData[?(@.selfAndChildNodeIds[?(@<11)])]..hidden");
    EXPECT_EQ(rc, JQRUTIL_SUCCESS);
    EXPECT_EQ(selector.getResultSet().size(), 2);

    dom_free_doc(d1);
}

TEST_F(SelectorTest, test_filterExpr_array_index_single_recursion) {
    JDocument *d1 = parse(node_accounts);

    JqrUtilCode rc = select(d1, "$..nodeData[?(@.selfAndChildNodeIds[0]==10)]..hidden");
    EXPECT_EQ(rc, JQRUTIL_SUCCESS);
    auto &rs0 = selector.getResultSet();
    EXPECT_EQ(rs0.size(), 1);
    EXPECT_STREQ(rs0[0].value->GetString(), "10+11+12");

    rc = select(d1, "$..nodeData[?(2==@.selfAndChildNodeIds[1])]..hidden");
    EXPECT_EQ(rc, JQRUTIL_SUCCESS);
    auto &rs1 = selector.getResultSet();
    EXPECT_EQ(rs1.size(), 1);
    EXPECT_STREQ(rs1[0].value->GetString(), "1+2+3");

    rc = select(d1, "$..nodeData[?(-5>=@.selfAndChildNodeIds[0])]..hidden");
    EXPECT_EQ(rc, JQRUTIL_SUCCESS);
    EXPECT_EQ(selector.getResultSet().size(), 0);

    rc = select(d1, "$..nodeData[?(@.selfAndChildNodeIds[-1]==3)]..hidden");
    EXPECT_EQ(rc, JQRUTIL_SUCCESS);
    auto &rs3 = selector.getResultSet();
    EXPECT_EQ(rs3.size(), 1);
    EXPECT_STREQ(rs3[0].value->GetString(), "1+2+3");

    rc = select(d1, "$..nodeData[?(@.selfAndChildNodeIds[2]!=17)]..hidden");
    EXPECT_EQ(rc, JQRUTIL_SUCCESS);
    EXPECT_EQ(selector.getResultSet().size(), 2);

    dom_free_doc(d1);
}

TEST_F(SelectorTest, test_member_and_index) {
    JDocument *d1 = parse("{\"user\":{\"name\":\"Alice\",\"age\":30},\"users\":[{\"name\":\"Alice\"},{\"name\":\"Bob\"}]}");

    JqrUtilCode rc = select(d1, "$.user.name");
    EXPECT_EQ(rc, JQRUTIL_SUCCESS);
    auto &rs = selector.getResultSet();
    EXPECT_EQ(rs.size(), 1);
    EXPECT_EQ(rs[0].origin, Selector::DOCUMENT);
    EXPECT_EQ(rs[0].path, "/user/name");
    EXPECT_STREQ(rs[0].value->GetString(), "Alice");

    rc = select(d1, "$.users[*].name");
    EXPECT_EQ(rc, JQRUTIL_SUCCESS);
    EXPECT_EQ(rs.size(), 2);
    EXPECT_STREQ(rs[0].value->GetString(), "Alice");
    EXPECT_STREQ(rs[1].value->GetString(), "Bob");
    EXPECT_EQ(rs[1].path, "/users/1/name");

    rc = select(d1, "$.users[-1].name");
    EXPECT_EQ(rc, JQRUTIL_SUCCESS);
    EXPECT_EQ(rs.size(), 1);
    EXPECT_STREQ(rs[0].value->GetString(), "Bob");
    EXPECT_EQ(rs[0].path, "/users/1/name");

    rc = select(d1, "$");
    EXPECT_EQ(rc, JQRUTIL_SUCCESS);
    EXPECT_EQ(rs.size(), 1);
    EXPECT_EQ(rs[0].value, d1);
    EXPECT_EQ(rs[0].path, "");

    dom_free_doc(d1);
}

TEST_F(SelectorTest, test_definite_path_unresolved) {
    JDocument *d1 = parse("{\"user\":{\"name\":\"Alice\"},\"list\":[1,2]}");

    JqrUtilCode rc = select(d1, "$.user.age");
    EXPECT_EQ(rc, JQRUTIL_SUCCESS);
    auto &rs = selector.getResultSet();
    EXPECT_EQ(rs.size(), 1);
    EXPECT_EQ(rs[0].origin, Selector::UNRESOLVED);
    EXPECT_EQ(rs[0].value, nullptr);
    EXPECT_EQ(rs[0].path, "/user/age");

    rc = select(d1, "$.list[5]");
    EXPECT_EQ(rc, JQRUTIL_SUCCESS);
    EXPECT_EQ(rs.size(), 1);
    EXPECT_EQ(rs[0].origin, Selector::UNRESOLVED);
    EXPECT_EQ(rs[0].path, "/list/5");

    // an indefinite path that selects nothing selects nothing
    rc = select(d1, "$.user.*.first");
    EXPECT_EQ(rc, JQRUTIL_SUCCESS);
    EXPECT_TRUE(rs.empty());

    rc = select(d1, "$..age");
    EXPECT_EQ(rc, JQRUTIL_SUCCESS);
    EXPECT_TRUE(rs.empty());

    dom_free_doc(d1);
}

TEST_F(SelectorTest, test_array_slice) {
    JDocument *d1 = parse("{\"a\":[], \"b\":[1], \"e\":[1,2,3,4,5]}");

    JqrUtilCode rc = select(d1, "$.e[1:4]");
    EXPECT_EQ(rc, JQRUTIL_SUCCESS);
    auto &rs = selector.getResultSet();
    EXPECT_EQ(rs.size(), 3);
    EXPECT_EQ(rs[0].value->GetInt(), 2);
    EXPECT_EQ(rs[2].value->GetInt(), 4);

    rc = select(d1, "$.e[2:]");
    EXPECT_EQ(rc, JQRUTIL_SUCCESS);
    EXPECT_EQ(rs.size(), 3);
    EXPECT_EQ(rs[2].value->GetInt(), 5);

    rc = select(d1, "$.e[:4]");
    EXPECT_EQ(rc, JQRUTIL_SUCCESS);
    EXPECT_EQ(rs.size(), 4);
    EXPECT_EQ(rs[3].value->GetInt(), 4);

    rc = select(d1, "$.e[0:5:2]");
    EXPECT_EQ(rc, JQRUTIL_SUCCESS);
    EXPECT_EQ(rs.size(), 3);
    EXPECT_EQ(rs[1].value->GetInt(), 3);

    rc = select(d1, "$.e[::2]");
    EXPECT_EQ(rc, JQRUTIL_SUCCESS);
    EXPECT_EQ(rs.size(), 3);
    EXPECT_EQ(rs[2].value->GetInt(), 5);

    rc = select(d1, "$.e[4:0:-2]");
    EXPECT_EQ(rc, JQRUTIL_SUCCESS);
    EXPECT_EQ(rs.size(), 2);
    EXPECT_EQ(rs[0].value->GetInt(), 5);
    EXPECT_EQ(rs[1].value->GetInt(), 3);

    rc = select(d1, "$.e[::-1]");
    EXPECT_EQ(rc, JQRUTIL_SUCCESS);
    EXPECT_EQ(rs.size(), 5);
    EXPECT_EQ(rs[0].value->GetInt(), 5);
    EXPECT_EQ(rs[4].value->GetInt(), 1);

    rc = select(d1, "$.e[-2:]");
    EXPECT_EQ(rc, JQRUTIL_SUCCESS);
    EXPECT_EQ(rs.size(), 2);
    EXPECT_EQ(rs[0].value->GetInt(), 4);

    // out of bounds slices are clamped
    rc = select(d1, "$.e[-100:100]");
    EXPECT_EQ(rc, JQRUTIL_SUCCESS);
    EXPECT_EQ(rs.size(), 5);

    rc = select(d1, "$.e[3:1]");
    EXPECT_EQ(rc, JQRUTIL_SUCCESS);
    EXPECT_TRUE(rs.empty());

    rc = select(d1, "$.a[0:2]");
    EXPECT_EQ(rc, JQRUTIL_SUCCESS);
    EXPECT_TRUE(rs.empty());

    rc = select(d1, "$.e[0:4:0]");
    EXPECT_EQ(rc, JQRUTIL_STEP_CANNOT_NOT_BE_ZERO);

    dom_free_doc(d1);
}

TEST_F(SelectorTest, test_array_slice_large_step) {
    JDocument *d1 = parse("[\"a\",\"b\",\"c\"]");

    JqrUtilCode rc = select(d1, "$[1:3:9223372036854775807]");
    EXPECT_EQ(rc, JQRUTIL_SUCCESS);
    auto &rs = selector.getResultSet();
    EXPECT_EQ(rs.size(), 1);
    EXPECT_STREQ(rs[0].value->GetString(), "b");

    rc = select(d1, "$[::9223372036854775807]");
    EXPECT_EQ(rc, JQRUTIL_SUCCESS);
    EXPECT_EQ(rs.size(), 1);
    EXPECT_STREQ(rs[0].value->GetString(), "a");

    rc = select(d1, "$[1::-9223372036854775807]");
    EXPECT_EQ(rc, JQRUTIL_SUCCESS);
    EXPECT_EQ(rs.size(), 1);
    EXPECT_STREQ(rs[0].value->GetString(), "b");

    rc = select(d1, "$[::-9223372036854775807]");
    EXPECT_EQ(rc, JQRUTIL_SUCCESS);
    EXPECT_EQ(rs.size(), 1);
    EXPECT_STREQ(rs[0].value->GetString(), "c");

    // the step lands exactly on the last element
    rc = select(d1, "$[0:3:2]");
    EXPECT_EQ(rc, JQRUTIL_SUCCESS);
    EXPECT_EQ(rs.size(), 2);
    EXPECT_STREQ(rs[1].value->GetString(), "c");

    rc = select(d1, "$[2::-2]");
    EXPECT_EQ(rc, JQRUTIL_SUCCESS);
    EXPECT_EQ(rs.size(), 2);
    EXPECT_STREQ(rs[1].value->GetString(), "a");

    dom_free_doc(d1);
}

TEST_F(SelectorTest, test_union_of_indexes) {
    JDocument *d1 = parse("{\"e\":[1,2,3,4,5]}");

    JqrUtilCode rc = select(d1, "$.e[0,2]");
    EXPECT_EQ(rc, JQRUTIL_SUCCESS);
    auto &rs = selector.getResultSet();
    EXPECT_EQ(rs.size(), 2);
    EXPECT_EQ(rs[0].value->GetInt(), 1);
    EXPECT_EQ(rs[1].value->GetInt(), 3);

    rc = select(d1, "$.e[ 4 , -5, 9 ]");
    EXPECT_EQ(rc, JQRUTIL_SUCCESS);
    EXPECT_EQ(rs.size(), 2);
    EXPECT_EQ(rs[0].value->GetInt(), 5);
    EXPECT_EQ(rs[1].value->GetInt(), 1);

    EXPECT_EQ(select(d1, "$.e[0,]"), JQRUTIL_INVALID_JSON_PATH);
    EXPECT_EQ(select(d1, "$.e[,0]"), JQRUTIL_INVALID_JSON_PATH);
    EXPECT_EQ(select(d1, "$.e[0,,1]"), JQRUTIL_INVALID_JSON_PATH);

    dom_free_doc(d1);
}

TEST_F(SelectorTest, test_union_member_names) {
    JDocument *d1 = parse("{\"a\":1, \"b\": 2, \"c\":3}");

    JqrUtilCode rc = select(d1, "$.[\"a\",\"b\",\"c\"]");
    EXPECT_EQ(rc, JQRUTIL_SUCCESS);
    auto &rs = selector.getResultSet();
    EXPECT_EQ(rs.size(), 3);
    EXPECT_EQ(rs[0].value->GetInt(), 1);
    EXPECT_EQ(rs[1].value->GetInt(), 2);
    EXPECT_EQ(rs[2].value->GetInt(), 3);

    // listed order, missing names are skipped
    rc = select(d1, "$['c', 'x', 'a']");
    EXPECT_EQ(rc, JQRUTIL_SUCCESS);
    EXPECT_EQ(rs.size(), 2);
    EXPECT_EQ(rs[0].value->GetInt(), 3);
    EXPECT_EQ(rs[1].value->GetInt(), 1);

    dom_free_doc(d1);
}

TEST_F(SelectorTest, test_wildcard) {
    JDocument *d1 = parse("{\"z\":1, \"a\":[true,null], \"m\":{\"k\":\"v\"}}");

    JqrUtilCode rc = select(d1, "$.*");
    EXPECT_EQ(rc, JQRUTIL_SUCCESS);
    auto &rs = selector.getResultSet();
    EXPECT_EQ(rs.size(), 3);
    EXPECT_EQ(rs[0].path, "/z");
    EXPECT_EQ(rs[1].path, "/a");
    EXPECT_EQ(rs[2].path, "/m");

    rc = select(d1, "$[*][*]");
    EXPECT_EQ(rc, JQRUTIL_SUCCESS);
    EXPECT_EQ(rs.size(), 3);
    EXPECT_TRUE(rs[0].value->IsTrue());
    EXPECT_TRUE(rs[1].value->IsNull());
    EXPECT_STREQ(rs[2].value->GetString(), "v");

    // a scalar has no children
    rc = select(d1, "$.z.*");
    EXPECT_EQ(rc, JQRUTIL_SUCCESS);
    EXPECT_TRUE(rs.empty());

    dom_free_doc(d1);
}

TEST_F(SelectorTest, test_recursiveDescent_get_part1) {
    JDocument *d1 = parse("{\"x\": {}, \"y\": {\"a\":\"a\"}, \"z\": {\"a\":\"\", \"b\":\"b\"}}");

    JqrUtilCode rc = select(d1, "$..a");
    EXPECT_EQ(rc, JQRUTIL_SUCCESS);
    auto &rs = selector.getResultSet();
    EXPECT_EQ(rs.size(), 2);
    EXPECT_STREQ(rs[0].value->GetString(), "a");
    EXPECT_STREQ(rs[1].value->GetString(), "");

    JDocument *d2 = parse("{\"a\":{\"b\":{\"z\":{\"y\":1}}, \"c\":{\"z\":{\"y\":2}}, \"z\":{\"y\":3}}}");

    rc = select(d2, "$.a..z.y");
    EXPECT_EQ(rc, JQRUTIL_SUCCESS);
    EXPECT_EQ(rs.size(), 3);
    EXPECT_EQ(rs[0].value->GetInt(), 3);
    EXPECT_EQ(rs[1].value->GetInt(), 1);
    EXPECT_EQ(rs[2].value->GetInt(), 2);

    EXPECT_EQ(select(d1, "$...a"), JQRUTIL_INVALID_DOT_SEQUENCE);
    // note explicit check for odd number of dots
    EXPECT_EQ(select(d2, "$.a...z.y"), JQRUTIL_INVALID_DOT_SEQUENCE);
    // note explicit check for even number of dots
    EXPECT_EQ(select(d2, "$.a.z....y"), JQRUTIL_INVALID_DOT_SEQUENCE);
    EXPECT_EQ(select(d1, "$........a"), JQRUTIL_INVALID_DOT_SEQUENCE);
    EXPECT_EQ(select(d2, "$.a........z.y"), JQRUTIL_INVALID_DOT_SEQUENCE);
    EXPECT_EQ(select(d1, "$.."), JQRUTIL_INVALID_JSON_PATH);

    dom_free_doc(d1);
    dom_free_doc(d2);
}

TEST_F(SelectorTest, test_recursiveDescent_get_part2) {
    JDocument *d1 = parse("{\"a\":1, \"b\": {\"e\":[0,1,2]}, \"c\":{\"e\":[10,11,12]}}");

    const char *wildcards[] = {"$..e.[*]", "$..e[*]", "$..[\"e\"][*]"};
    for (const char *path : wildcards) {
        JqrUtilCode rc = select(d1, path);
        EXPECT_EQ(rc, JQRUTIL_SUCCESS);
        auto &rs = selector.getResultSet();
        EXPECT_EQ(rs.size(), 6);
        EXPECT_EQ(rs[0].value->GetInt(), 0);
        EXPECT_EQ(rs[1].value->GetInt(), 1);
        EXPECT_EQ(rs[2].value->GetInt(), 2);
        EXPECT_EQ(rs[3].value->GetInt(), 10);
        EXPECT_EQ(rs[4].value->GetInt(), 11);
        EXPECT_EQ(rs[5].value->GetInt(), 12);
    }

    const char *indexes[] = {"$..e.[1]", "$..e[1]", "$..[\"e\"][1]"};
    for (const char *path : indexes) {
        JqrUtilCode rc = select(d1, path);
        EXPECT_EQ(rc, JQRUTIL_SUCCESS);
        auto &rs = selector.getResultSet();
        EXPECT_EQ(rs.size(), 2);
        EXPECT_EQ(rs[0].value->GetInt(), 1);
        EXPECT_EQ(rs[1].value->GetInt(), 11);
    }

    const char *slices[] = {"$..e.[0:2]", "$..e[0:2]", "$..[\"e\"][0:2]"};
    for (const char *path : slices) {
        JqrUtilCode rc = select(d1, path);
        EXPECT_EQ(rc, JQRUTIL_SUCCESS);
        auto &rs = selector.getResultSet();
        EXPECT_EQ(rs.size(), 4);
        EXPECT_EQ(rs[0].value->GetInt(), 0);
        EXPECT_EQ(rs[1].value->GetInt(), 1);
        EXPECT_EQ(rs[2].value->GetInt(), 10);
        EXPECT_EQ(rs[3].value->GetInt(), 11);
    }

    dom_free_doc(d1);
}

TEST_F(SelectorTest, test_recursiveDescent_get_part3) {
    JDocument *d1 = parse("{\"a\":{\"a\":{\"a\":{\"a\":1}}}}");

    JqrUtilCode rc = select(d1, "$..a");
    EXPECT_EQ(rc, JQRUTIL_SUCCESS);
    auto &rs = selector.getResultSet();
    EXPECT_EQ(rs.size(), 4);

    rapidjson::StringBuffer sb;
    EXPECT_EQ(dom_serialize_value(*rs[0].value, nullptr, sb), JQRUTIL_SUCCESS);
    EXPECT_STREQ(sb.GetString(), "{\"a\":{\"a\":{\"a\":1}}}");
    sb.Clear();
    dom_serialize_value(*rs[1].value, nullptr, sb);
    EXPECT_STREQ(sb.GetString(), "{\"a\":{\"a\":1}}");
    sb.Clear();
    dom_serialize_value(*rs[2].value, nullptr, sb);
    EXPECT_STREQ(sb.GetString(), "{\"a\":1}");
    sb.Clear();
    dom_serialize_value(*rs[3].value, nullptr, sb);
    EXPECT_STREQ(sb.GetString(), "1");

    dom_free_doc(d1);
}

TEST_F(SelectorTest, test_recursiveDescent_no_duplicates) {
    JDocument *d1 = parse("{\"a\":[{\"b\":1},{\"b\":2}]}");

    // a node reached from more than one descent path is selected once
    JqrUtilCode rc = select(d1, "$..[?(@.b)].b");
    EXPECT_EQ(rc, JQRUTIL_SUCCESS);
    auto &rs = selector.getResultSet();
    EXPECT_EQ(rs.size(), 2);
    EXPECT_EQ(rs[0].path, "/a/0/b");
    EXPECT_EQ(rs[1].path, "/a/1/b");

    rc = select(d1, "$..*");
    EXPECT_EQ(rc, JQRUTIL_SUCCESS);
    EXPECT_EQ(rs.size(), 5);
    EXPECT_EQ(rs[0].path, "/a");
    EXPECT_EQ(rs[1].path, "/a/0");
    EXPECT_EQ(rs[2].path, "/a/1");
    EXPECT_EQ(rs[3].path, "/a/0/b");
    EXPECT_EQ(rs[4].path, "/a/1/b");

    dom_free_doc(d1);
}

TEST_F(SelectorTest, test_length) {
    JDocument *d1 = parse("{\"list\":[1,2,3], \"obj\":{\"a\":1,\"b\":2}, \"name\":\"h\\u00e9llo\", \"n\":5}");

    JqrUtilCode rc = select(d1, "$.list.length()");
    EXPECT_EQ(rc, JQRUTIL_SUCCESS);
    auto &rs = selector.getResultSet();
    EXPECT_EQ(rs.size(), 1);
    EXPECT_EQ(rs[0].origin, Selector::COMPUTED);
    EXPECT_EQ(rs[0].path, "/list");
    EXPECT_EQ(selector.getComputedValue(rs[0].computedIndex).GetUint64(), 3);

    rc = select(d1, "$.obj.length()");
    EXPECT_EQ(rc, JQRUTIL_SUCCESS);
    EXPECT_EQ(rs.size(), 1);
    EXPECT_EQ(selector.getComputedValue(rs[0].computedIndex).GetUint64(), 2);

    // code points, not bytes
    rc = select(d1, "$.name.length()");
    EXPECT_EQ(rc, JQRUTIL_SUCCESS);
    EXPECT_EQ(rs.size(), 1);
    EXPECT_EQ(selector.getComputedValue(rs[0].computedIndex).GetUint64(), 5);

    rc = select(d1, "$.*.length()");
    EXPECT_EQ(rc, JQRUTIL_SUCCESS);
    EXPECT_EQ(rs.size(), 3);

    // a number has no length
    rc = select(d1, "$.n.length()");
    EXPECT_EQ(rc, JQRUTIL_SUCCESS);
    EXPECT_EQ(rs.size(), 1);
    EXPECT_EQ(rs[0].origin, Selector::UNRESOLVED);

    EXPECT_EQ(select(d1, "$.list.length().x"), JQRUTIL_INVALID_FUNCTION_CALL);
    EXPECT_EQ(select(d1, "$.list.size()"), JQRUTIL_INVALID_FUNCTION_CALL);
    EXPECT_EQ(select(d1, "$.list.length(1)"), JQRUTIL_INVALID_FUNCTION_CALL);

    dom_free_doc(d1);
}

TEST_F(SelectorTest, test_filter_on_object) {
    JDocument *d1 = parse("{\"an object\" : {\n"
                          "  \"weight\"  : 300,\n"
                          "  \"a value\" : 300,\n"
                          "  \"my key\"  : \"key inside here\"\n"
                          "}}");

    JqrUtilCode rc = select(d1, "$.[\"an object\"].[?(@.weight > 200)].[\"a value\"]");
    EXPECT_EQ(rc, JQRUTIL_SUCCESS);
    EXPECT_EQ(selector.getResultSet().size(), 1);
    EXPECT_EQ(selector.getResultSet()[0].value->GetInt(), 300);

    rc = select(d1, "$.[\"an object\"].[?(@.weight > 300)].[\"a value\"]");
    EXPECT_EQ(rc, JQRUTIL_SUCCESS);
    EXPECT_EQ(selector.getResultSet().size(), 0);

    dom_free_doc(d1);
}

TEST_F(SelectorTest, test_filter_string_comparison) {
    JDocument *d1 = parse("{\"objects\": ["
                          "    {\"weight\": 100, \"my key\": \"key inside here\"},"
                          "    {\"weight\": 200, \"my key\": \"key inside there\"},"
                          "    {\"weight\": 300, \"my key\": \"key inside here\"},"
                          "    {\"weight\": 400, \"my key\": \"key inside there\"}"
                          "]}");

    JqrUtilCode rc = select(d1, "$.[\"objects\"].[?(@.[\"my key\"] == \"key inside there\")].weight");
    EXPECT_EQ(rc, JQRUTIL_SUCCESS);
    auto &rs = selector.getResultSet();
    EXPECT_EQ(rs.size(), 2);
    EXPECT_EQ(rs[0].value->GetInt(), 200);
    EXPECT_EQ(rs[1].value->GetInt(), 400);

    rc = select(d1, "$.[ \"objects\" ].[?(@.[ \"my key\" ] < \"key inside herf\")].weight");
    EXPECT_EQ(rc, JQRUTIL_SUCCESS);
    EXPECT_EQ(rs.size(), 2);
    EXPECT_EQ(rs[0].value->GetInt(), 100);
    EXPECT_EQ(rs[1].value->GetInt(), 300);

    dom_free_doc(d1);
}

TEST_F(SelectorTest, test_filter_type_mismatch) {
    JDocument *d1 = parse("[{\"v\":1},{\"v\":\"1\"},{\"v\":null},{\"v\":true},{\"v\":[1]}]");

    JqrUtilCode rc = select(d1, "$[?(@.v==1)]");
    EXPECT_EQ(rc, JQRUTIL_SUCCESS);
    auto &rs = selector.getResultSet();
    EXPECT_EQ(rs.size(), 1);
    EXPECT_EQ(rs[0].path, "/0");

    rc = select(d1, "$[?(@.v=='1')]");
    EXPECT_EQ(rc, JQRUTIL_SUCCESS);
    EXPECT_EQ(rs.size(), 1);
    EXPECT_EQ(rs[0].path, "/1");

    rc = select(d1, "$[?(@.v==null)]");
    EXPECT_EQ(rc, JQRUTIL_SUCCESS);
    EXPECT_EQ(rs.size(), 1);
    EXPECT_EQ(rs[0].path, "/2");

    rc = select(d1, "$[?(@.v)]");
    EXPECT_EQ(rc, JQRUTIL_SUCCESS);
    EXPECT_EQ(rs.size(), 5);

    dom_free_doc(d1);
}

TEST_F(SelectorTest, test_malformed_jsonpath) {
    JDocument *d1 = parse(store);

    EXPECT_EQ(select(d1, "$[0:2]$[0:1]$[0:2]$[0:2]$[0<2065>:2]$[0:2]"), JQRUTIL_INVALID_JSON_PATH);
    EXPECT_TRUE(expr.steps.empty());
    EXPECT_EQ(select(d1, ".[0:2].[0:1].[0:2].[0:2].[0<2065>:2].[0:2]"), JQRUTIL_PATH_MUST_START_WITH_DOLLAR);
    EXPECT_EQ(select(d1, ""), JQRUTIL_PATH_MUST_START_WITH_DOLLAR);
    EXPECT_EQ(select(d1, "store"), JQRUTIL_PATH_MUST_START_WITH_DOLLAR);
    EXPECT_EQ(select(d1, "$."), JQRUTIL_INVALID_MEMBER_NAME);
    EXPECT_EQ(select(d1, "$[]"), JQRUTIL_EMPTY_EXPR_TOKEN);
    EXPECT_EQ(select(d1, "$[abc]"), JQRUTIL_ARRAY_INDEX_NOT_NUMBER);
    EXPECT_EQ(select(d1, "$.store["), JQRUTIL_EMPTY_EXPR_TOKEN);
    EXPECT_EQ(select(d1, "$.store.books[0"), JQRUTIL_INVALID_JSON_PATH);
    EXPECT_EQ(select(d1, "$['store'"), JQRUTIL_INVALID_JSON_PATH);
    EXPECT_EQ(select(d1, "$[99999999999999999999]"), JQRUTIL_INVALID_NUMBER);
    EXPECT_EQ(select(d1, "$.store.books[?(@.price<1.2.3)]"), JQRUTIL_INVALID_NUMBER);
    EXPECT_EQ(select(d1, "$.store.books[?(@.price==nul)]"), JQRUTIL_INVALID_IDENTIFIER);
    EXPECT_EQ(select(d1, "$.store.books[?(@)]"), JQRUTIL_INVALID_JSON_PATH);

    // a well-formed path against the wrong type selects nothing
    EXPECT_EQ(select(d1, "$[0,1]"), JQRUTIL_SUCCESS);
    EXPECT_TRUE(selector.getResultSet().empty());

    dom_free_doc(d1);
}

TEST_F(SelectorTest, test_escaped_controlCharacters) {
    // escaped backslashes, quotes and control characters
    JDocument *d1 = parse("{\"a\\\\a\":1, \"b\\tb\":2, \"c\\nc\":3, \"d\\rd\":4, \"e\\be\":5,"
                          " \"f\\\"f\": 6, \"g g\": 7, \"\": 8, \"\'\":9}");

    JqrUtilCode rc = select(d1, "$.[\"a\\\\a\",\"b\\tb\",\"c\\nc\",\"d\\rd\","
                                "\"e\\be\",\"f\\\"f\",\"g g\",\"\",\"\'\"]");
    EXPECT_EQ(rc, JQRUTIL_SUCCESS);
    auto &rs = selector.getResultSet();
    EXPECT_EQ(rs.size(), 9);
    for (size_t i = 0; i < rs.size(); i++) {
        EXPECT_EQ(rs[i].value->GetInt(), static_cast<int>(i + 1));
    }

    JDocument *d2 = parse("{\"value_1\": {\"value\" : 10, \"key\": \"linebreak\\n\"}, \"value_2\" : "
                          "{\"value\" : 20, \"key\" : \"nolinebreak\"}}");

    rc = select(d2, "$..[?(@.key==\"nolinebreak\")].value");
    EXPECT_EQ(rc, JQRUTIL_SUCCESS);
    EXPECT_EQ(rs.size(), 1);
    EXPECT_EQ(rs[0].value->GetInt(), 20);

    rc = select(d2, "$..[?(@.key=='nolinebreak')].value");
    EXPECT_EQ(rc, JQRUTIL_SUCCESS);
    EXPECT_EQ(rs.size(), 1);
    EXPECT_EQ(rs[0].value->GetInt(), 20);

    rc = select(d2, "$..[?(@.key==\"linebreak\\n\")].value");
    EXPECT_EQ(rc, JQRUTIL_SUCCESS);
    EXPECT_EQ(rs.size(), 1);
    EXPECT_EQ(rs[0].value->GetInt(), 10);

    rc = select(d2, "$..[?(@.key=='linebreak\\n')].value");
    EXPECT_EQ(rc, JQRUTIL_SUCCESS);
    EXPECT_EQ(rs.size(), 1);
    EXPECT_EQ(rs[0].value->GetInt(), 10);

    dom_free_doc(d2);
    dom_free_doc(d1);
}

TEST_F(SelectorTest, test_escaped_unicode) {
    JDocument *d1 = parse("{\"key\\u0000\":\"value\\\\u0000\", \"key\\u001F\":\"value\\\\u001F\"}");

    JqrUtilCode rc = select(d1, "$.[\"key\\u0000\",\"key\\u001F\"]");
    EXPECT_EQ(rc, JQRUTIL_SUCCESS);
    auto &rs = selector.getResultSet();
    EXPECT_EQ(rs.size(), 2);
    EXPECT_STREQ(rs[0].value->GetString(), "value\\u0000");
    EXPECT_STREQ(rs[1].value->GetString(), "value\\u001F");

    dom_free_doc(d1);
}

TEST_F(SelectorTest, test_quoted_name_ending_in_backslash) {
    JDocument *d1 = parse("{\"a\\\\\":1, \"b\\\\\\\"c\":2}");

    JqrUtilCode rc = select(d1, "$[\"a\\\\\"]");
    EXPECT_EQ(rc, JQRUTIL_SUCCESS);
    auto &rs = selector.getResultSet();
    ASSERT_EQ(rs.size(), 1);
    EXPECT_EQ(rs[0].value->GetInt(), 1);

    rc = select(d1, "$['a\\\\']");
    EXPECT_EQ(rc, JQRUTIL_SUCCESS);
    ASSERT_EQ(rs.size(), 1);
    EXPECT_EQ(rs[0].value->GetInt(), 1);

    rc = select(d1, "$[\"a\\\\\", \"b\\\\\\\"c\"]");
    EXPECT_EQ(rc, JQRUTIL_SUCCESS);
    ASSERT_EQ(rs.size(), 2);
    EXPECT_EQ(rs[1].value->GetInt(), 2);

    // a backslash before the closing quote still escapes it
    EXPECT_NE(select(d1, "$[\"a\\\"]"), JQRUTIL_SUCCESS);
    EXPECT_NE(select(d1, "$['a\\']"), JQRUTIL_SUCCESS);

    dom_free_doc(d1);
}

TEST_F(SelectorTest, test_pointer_escaping) {
    JDocument *d1 = parse("{\"a/b\":{\"c~d\":1}}");

    JqrUtilCode rc = select(d1, "$['a/b']['c~d']");
    EXPECT_EQ(rc, JQRUTIL_SUCCESS);
    auto &rs = selector.getResultSet();
    EXPECT_EQ(rs.size(), 1);
    EXPECT_EQ(rs[0].path, "/a~1b/c~0d");

    dom_free_doc(d1);
}

TEST_F(SelectorTest, test_malformed_query) {
    JDocument *d1 = parse(store);

    EXPECT_EQ(select(d1, "&&$.store..price"), JQRUTIL_PATH_MUST_START_WITH_DOLLAR);
    EXPECT_TRUE(expr.steps.empty());

    dom_free_doc(d1);
}

TEST_F(SelectorTest, test_query_limits) {
    JDocument *d1 = parse(store);

    ASSERT_EQ(jqr_config_set("max-recursive-descent-tokens", "2"), JQRUTIL_SUCCESS);
    EXPECT_EQ(select(d1, "$..store..price"), JQRUTIL_SUCCESS);
    EXPECT_EQ(select(d1, "$..store..books..price"), JQRUTIL_RECURSIVE_DESCENT_TOKEN_LIMIT_EXCEEDED);

    ASSERT_EQ(jqr_config_set("max-query-string-size", "10"), JQRUTIL_SUCCESS);
    EXPECT_EQ(select(d1, "$.store"), JQRUTIL_SUCCESS);
    EXPECT_EQ(select(d1, "$.store.bicycle"), JQRUTIL_QUERY_STRING_SIZE_LIMIT_EXCEEDED);
    jqr_config_reset();

    ASSERT_EQ(jqr_config_set("max-parser-recursion-depth", "10"), JQRUTIL_SUCCESS);
    std::string path = "$.store.books[?(";
    for (int i = 0; i < 20; i++) path += "(";
    path += "@.price<10";
    for (int i = 0; i < 20; i++) path += ")";
    path += ")]";
    EXPECT_EQ(select(d1, path.c_str()), JQRUTIL_PARSER_RECURSION_DEPTH_LIMIT_EXCEEDED);
    jqr_config_reset();
    EXPECT_EQ(select(d1, path.c_str()), JQRUTIL_SUCCESS);
    EXPECT_EQ(selector.getResultSet().size(), 2);

    dom_free_doc(d1);
}
