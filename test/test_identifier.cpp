#include <gtest/gtest.h>

#include <kvorm/id/IdHandler.h>
#include <kvorm/id/IdConverter.h>
#include <kvorm/parser/json.h>
#include "fixtures.h"

using namespace kvorm;
using namespace kvorm::test;

TEST(Identifier, Empty) {
    EXPECT_TRUE(Identifier{}.is_empty());
    EXPECT_TRUE(Identifier{Record{}}.is_empty());
    EXPECT_FALSE(Identifier{Value{0}}.is_empty());
}

TEST(Identifier, First) {
    EXPECT_EQ(Identifier{Value{7}}.first(), Value{7});
    EXPECT_EQ(Identifier{"{'x': 1, 'y': 2}"_json}.first(), Value{1});
    EXPECT_TRUE(Identifier{}.first().is_nil());
}

TEST(SingleIdHandler, NormalizeScalar) {
    SingleIdHandler handler;
    auto p_meta = item_metadata();
    EXPECT_EQ(handler.normalize_id(*p_meta, 42), Identifier{Value{42}});
    EXPECT_EQ(handler.normalize_id(*p_meta, "k"), Identifier{Value{"k"}});
}

TEST(SingleIdHandler, NormalizeMap) {
    SingleIdHandler handler;
    auto p_meta = item_metadata();
    EXPECT_EQ(handler.normalize_id(*p_meta, "{'id': 42, 'other': 1}"_json), Identifier{Value{42}});
    EXPECT_THROW(handler.normalize_id(*p_meta, "{'other': 1}"_json), InvalidIdentifier);
    EXPECT_THROW(handler.normalize_id(*p_meta, nil), InvalidIdentifier);
}

TEST(SingleIdHandler, GetAndSetIdentifier) {
    SingleIdHandler handler;
    auto p_meta = item_metadata();
    auto p_entity = p_meta->new_instance();
    EXPECT_TRUE(handler.get_identifier(*p_meta, *p_entity).is_empty());

    handler.set_identifier(*p_meta, *p_entity, Identifier{Value{9}});
    EXPECT_EQ(p_entity->get("id"), Value{9});
    EXPECT_EQ(handler.get_identifier(*p_meta, *p_entity), Identifier{Value{9}});
}

TEST(SingleIdHandler, HashIsTypeTagged) {
    SingleIdHandler handler;
    auto h_int = handler.hash(Identifier{Value{1}});
    EXPECT_NE(h_int, handler.hash(Identifier{Value{1UL}}));
    EXPECT_NE(h_int, handler.hash(Identifier{Value{1.0}}));
    EXPECT_NE(h_int, handler.hash(Identifier{Value{"1"}}));
    EXPECT_EQ(h_int, handler.hash(Identifier{Value{1}}));
}

TEST(CompositeIdHandler, NormalizeMap) {
    CompositeIdHandler handler;
    auto p_meta = point_metadata();
    auto id = handler.normalize_id(*p_meta, "{'label': 'a', 'y': 2, 'x': 1}"_json);
    ASSERT_TRUE(id.is_composite());
    EXPECT_EQ(id.value().to_json(), R"({"x": 1, "y": 2})");
}

TEST(CompositeIdHandler, NormalizeMissingField) {
    CompositeIdHandler handler;
    auto p_meta = point_metadata();
    EXPECT_THROW(handler.normalize_id(*p_meta, "{'x': 1}"_json), InvalidIdentifier);
    EXPECT_THROW(handler.normalize_id(*p_meta, "{'x': 1, 'y': null}"_json), InvalidIdentifier);
}

TEST(CompositeIdHandler, NormalizeScalar) {
    CompositeIdHandler handler;
    auto p_item = item_metadata();
    EXPECT_EQ(handler.normalize_id(*p_item, 42).value().to_json(), R"({"id": 42})");

    auto p_point = point_metadata();
    EXPECT_THROW(handler.normalize_id(*p_point, 42), InvalidIdentifier);
}

TEST(CompositeIdHandler, GetIdentifier) {
    CompositeIdHandler handler;
    auto p_meta = point_metadata();
    auto p_entity = p_meta->new_instance();
    p_entity->set("x", 1);
    EXPECT_TRUE(handler.get_identifier(*p_meta, *p_entity).is_empty());
    p_entity->set("y", 2);
    EXPECT_EQ(handler.get_identifier(*p_meta, *p_entity).value().to_json(), R"({"x": 1, "y": 2})");
}

TEST(CompositeIdHandler, HashEqualForIndependentComposites) {
    CompositeIdHandler handler;
    auto p_meta = point_metadata();
    auto a = handler.normalize_id(*p_meta, "{'x': 1, 'y': 2}"_json);
    auto b = handler.normalize_id(*p_meta, "{'y': 2, 'x': 1}"_json);
    EXPECT_EQ(handler.hash(a), handler.hash(b));
}

TEST(CompositeIdHandler, HashDependsOnDeclaredOrder) {
    CompositeIdHandler handler;
    auto p_xy = point_metadata();

    auto p_yx = std::make_shared<ClassMetadata>("Point");
    p_yx->map_identifier("y");
    p_yx->map_identifier("x");

    auto raw = "{'x': 1, 'y': 2}"_json;
    EXPECT_NE(handler.hash(handler.normalize_id(*p_xy, raw)), handler.hash(handler.normalize_id(*p_yx, raw)));
}

TEST(CompositeIdHandler, HashIsTypeTagged) {
    CompositeIdHandler handler;
    auto p_meta = point_metadata();
    auto a = handler.normalize_id(*p_meta, "{'x': 1, 'y': 2}"_json);
    auto b = handler.normalize_id(*p_meta, "{'x': '1', 'y': 2}"_json);
    EXPECT_NE(handler.hash(a), handler.hash(b));
}

TEST(CompositeIdHandler, HashSeparatorInValues) {
    CompositeIdHandler handler;
    auto p_meta = point_metadata();
    auto a = handler.normalize_id(*p_meta, "{'x': 'a__##__6b', 'y': 'c'}"_json);
    auto b = handler.normalize_id(*p_meta, "{'x': 'a', 'y': 'b__##__6c'}"_json);
    EXPECT_NE(handler.hash(a), handler.hash(b));

    auto c = handler.normalize_id(*p_meta, R"({'x': 'a\\', 'y': '#b'})"_json);
    auto d = handler.normalize_id(*p_meta, R"({'x': 'a\\#', 'y': 'b'})"_json);
    EXPECT_NE(handler.hash(c), handler.hash(d));
}

TEST(CompositeIdHandler, RequireRecords) {
    CompositeIdHandler handler{true};
    auto p_meta = item_metadata();
    EXPECT_THROW(handler.normalize_id(*p_meta, 42), InvalidIdentifier);
    EXPECT_EQ(handler.normalize_id(*p_meta, "{'id': 42}"_json).value().to_json(), R"({"id": 42})");
}

TEST(NullIdConverter, Identity) {
    NullIdConverter converter;
    auto p_meta = item_metadata();
    Identifier id{Value{42}};
    EXPECT_EQ(converter.serialize(*p_meta, id), id);

    auto data = json::parse_record("{'a': 1}");
    auto result = converter.unserialize(*p_meta, data);
    EXPECT_TRUE(identical(result, data));
}

TEST(EncodedIdConverter, SerializeScalar) {
    EncodedIdConverter converter;
    auto p_meta = item_metadata();
    EXPECT_EQ(converter.serialize(*p_meta, Identifier{Value{42}}), Identifier{Value{"342"}});
    EXPECT_EQ(converter.serialize(*p_meta, Identifier{Value{"a:b"}}), Identifier{Value{"6a\\:b"}});
}

TEST(EncodedIdConverter, SerializeComposite) {
    EncodedIdConverter converter;
    auto p_meta = point_metadata();
    auto id = Identifier{"{'x': 1, 'y': 'two'}"_json};
    EXPECT_EQ(converter.serialize(*p_meta, id), Identifier{Value{"#31:6two"}});
}

TEST(EncodedIdConverter, DecodeInvertsSerialize) {
    EncodedIdConverter converter;
    auto p_point = point_metadata();
    auto p_item = item_metadata();

    std::vector<std::pair<std::shared_ptr<ClassMetadata>, Identifier>> cases = {
        {p_item, Identifier{Value{42}}},
        {p_item, Identifier{Value{7UL}}},
        {p_item, Identifier{Value{"a:b\\c"}}},
        {p_item, Identifier{Value{2.5}}},
        {p_point, Identifier{"{'x': 'a:1', 'y': -3}"_json}},
    };

    for (auto& [p_meta, id] : cases) {
        auto encoded = converter.serialize(*p_meta, id);
        ASSERT_TRUE(encoded.value().is_str());
        EXPECT_EQ(converter.decode(*p_meta, encoded.value().as_str()), id);
    }
}

TEST(EncodedIdConverter, DecodeInvalid) {
    EncodedIdConverter converter;
    auto p_meta = point_metadata();
    EXPECT_THROW(converter.decode(*p_meta, ""), InvalidIdentifier);
    EXPECT_THROW(converter.decode(*p_meta, "#31"), InvalidIdentifier);
    EXPECT_THROW(converter.decode(*p_meta, "9x"), InvalidIdentifier);
}

TEST(EncodedIdConverter, UnserializeRestoresIdentifier) {
    EncodedIdConverter converter;
    auto p_meta = point_metadata();
    auto data = json::parse_record("{'$key': '#31:32', 'label': 'a'}");
    auto result = converter.unserialize(*p_meta, data);

    EXPECT_EQ(Value{result}.to_json(), R"({"label": "a", "x": 1, "y": 2})");
    EXPECT_TRUE(data.find("$key") != data.end());
}

TEST(EncodedIdConverter, UnserializeKeepsPresentFields) {
    EncodedIdConverter converter;
    auto p_meta = item_metadata();
    auto data = json::parse_record("{'id': 5, '$key': '342'}");
    auto result = converter.unserialize(*p_meta, data);
    EXPECT_EQ(Value{result}.to_json(), R"({"id": 5})");
}
