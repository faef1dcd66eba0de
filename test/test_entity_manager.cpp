#include <gtest/gtest.h>

#include <kvorm/kvorm.h>
#include "RecordingStorage.h"
#include "fixtures.h"

using namespace kvorm;
using namespace kvorm::test;

namespace {

const char* mapping = R"({
    'User':    {'storage': 'users',
                'fields': {'id': {'id': true},
                           'name': {},
                           'address': {'embedded': 'Address'},
                           'session': {'transient': true}}},
    'Address': {'embeddable': true,
                'fields': {'street': {}, 'city': {}}}
})";

class User : public Entity
{
  public:
    using Entity::Entity;
    String name() const { return get("name").to_str(); }
};

Configuration json_config() {
    Configuration config;
    config.set_mapping_driver(std::make_shared<JsonMappingDriver>(JsonMappingDriver::from_json(mapping)));
    return config;
}

} // namespace

TEST(EntityManager, FindMissingReturnsNull) {
    auto p_storage = std::make_shared<RecordingStorage>(true, false);
    EntityManager em{p_storage, nullptr, json_config()};
    EXPECT_TRUE(em.find("User", 1) == nullptr);
    EXPECT_EQ(p_storage->count("find"), 1UL);
}

TEST(EntityManager, FindInvalidKeyThrows) {
    EntityManager em{std::make_shared<ArrayStorage>(), nullptr, json_config()};
    EXPECT_THROW(em.find("User", nil), InvalidIdentifier);
    EXPECT_THROW(em.find("Nope", 1), MappingError);
}

TEST(EntityManager, MetadataFromMappingDriver) {
    EntityManager em{std::make_shared<ArrayStorage>(), nullptr, json_config()};
    auto p_meta = em.get_class_metadata("User");
    EXPECT_EQ(p_meta->storage_name(), "users");
    EXPECT_TRUE(p_meta->is_transient("session"));
    EXPECT_TRUE(em.metadata_factory().has_metadata_for("User"));
    EXPECT_EQ(em.unwrap().name(), "array");
}

TEST(EntityManager, PersistFlushFind) {
    auto p_storage = std::make_shared<RecordingStorage>(true, false);
    EntityManager em{p_storage, nullptr, json_config()};

    auto p_user = em.create("User");
    p_user->set("id", 1);
    p_user->set("name", "Ann");
    auto p_address = em.create("Address");
    p_address->set("city", "Paris");
    p_user->set_embedded("address", p_address);

    em.persist(p_user);
    EXPECT_EQ(p_storage->count("insert"), 0UL);
    em.flush();
    ASSERT_EQ(p_storage->count("insert"), 1UL);
    EXPECT_EQ(Value{p_storage->calls.back().data}.to_json(),
              R"({"name": "Ann", "address": {"street": null, "city": "Paris"}})");

    EXPECT_EQ(em.find("User", 1), p_user);
    EXPECT_EQ(p_storage->count("find"), 0UL);

    em.clear();
    auto p_found = em.find("User", 1);
    ASSERT_TRUE(p_found != nullptr);
    EXPECT_NE(p_found, p_user);
    EXPECT_EQ(p_found->get("name"), Value{"Ann"});
    EXPECT_EQ(p_found->get_embedded("address")->get("city"), Value{"Paris"});
}

TEST(EntityManager, UpdateAndRemove) {
    auto p_storage = std::make_shared<RecordingStorage>(false, false);
    p_storage->put("users", Identifier{Value{1}}, json::parse_record("{'name': 'Ann', 'address': null}"));
    EntityManager em{p_storage, nullptr, json_config()};

    auto p_user = em.find("User", 1);
    ASSERT_TRUE(p_user != nullptr);
    p_user->set("name", "Bob");
    em.flush();
    ASSERT_EQ(p_storage->count("update"), 1UL);
    EXPECT_EQ(Value{p_storage->calls.back().data}.to_json(), R"({"name": "Bob", "address": null})");

    em.remove(p_user);
    em.flush();
    EXPECT_EQ(p_storage->count("remove"), 1UL);
    EXPECT_TRUE(em.find("User", 1) == nullptr);
    EXPECT_THROW(em.remove(p_user), NotManaged);
}

TEST(EntityManager, ProgrammaticMetadata) {
    auto p_factory = std::make_shared<ClassMetadataFactory>();
    register_all(*p_factory);
    EntityManager em{std::make_shared<ArrayStorage>(), p_factory};

    auto p_item = em.create("Item");
    p_item->set("id", 3);
    p_item->set("a", 1);
    em.persist(p_item);
    em.flush();
    em.clear();

    auto p_found = em.find("Item", 3);
    ASSERT_TRUE(p_found != nullptr);
    EXPECT_EQ(p_found->get("a"), Value{1});
    EXPECT_TRUE(p_found->get("b").is_nil());
    EXPECT_TRUE(em.unit_of_work().is_managed(*p_found));
}

TEST(EntityManager, TypedInstances) {
    auto p_factory = std::make_shared<ClassMetadataFactory>(json_config().mapping_driver());
    p_factory->set_instantiator("User", [] (std::shared_ptr<const ClassMetadata> p_meta) -> std::shared_ptr<Entity> {
        return std::make_shared<User>(p_meta);
    });
    EntityManager em{std::make_shared<ArrayStorage>(), p_factory};

    auto p_user = em.create<User>("User");
    ASSERT_TRUE(p_user != nullptr);
    p_user->set("id", 1);
    p_user->set("name", "Ann");
    em.persist(p_user);
    em.flush();
    em.clear();

    auto p_found = em.find<User>("User", 1);
    ASSERT_TRUE(p_found != nullptr);
    EXPECT_EQ(p_found->name(), "Ann");
    EXPECT_TRUE(em.find<User>("User", 2) == nullptr);
}

TEST(EntityManager, EncodedIdConverter) {
    auto p_storage = std::make_shared<RecordingStorage>(true, false);
    auto config = json_config();
    config.set_id_converter(std::make_shared<EncodedIdConverter>());
    EntityManager em{p_storage, nullptr, config};

    auto p_user = em.create("User");
    p_user->set("id", 7);
    em.persist(p_user);
    em.flush();
    EXPECT_EQ(p_storage->calls.back().id, Identifier{Value{"37"}});

    em.clear();
    auto p_found = em.find("User", 7);
    ASSERT_TRUE(p_found != nullptr);
    EXPECT_EQ(p_found->get("id"), Value{7});
}
