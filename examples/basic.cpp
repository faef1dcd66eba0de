#include <kvorm/kvorm.h>
#include <iostream>

using namespace kvorm;

int main(int argc, char** argv) {
    Configuration config;
    config.set_mapping_driver(std::make_shared<JsonMappingDriver>(JsonMappingDriver::from_json(R"({
        "User":    {"storage": "users",
                    "fields": {"id": {"id": true},
                               "name": {},
                               "address": {"embedded": "Address"},
                               "session": {"transient": true}}},
        "Address": {"embeddable": true,
                    "fields": {"street": {}, "city": {}}}
    })")));

    auto p_storage = std::make_shared<ArrayStorage>();
    EntityManager em{p_storage, nullptr, config};

    // create and persist
    auto user = em.create("User");
    user->set("id", 1);
    user->set("name", "Ada");
    user->set("session", "transient");
    auto address = em.create("Address");
    address->set("street", "12 Analytical Row");
    address->set("city", "London");
    user->set_embedded("address", address);
    em.persist(user);
    em.flush();

    // reload in a fresh scope
    em.clear();
    auto loaded = em.find("User", 1);
    std::cout << "name=" << loaded->get("name") << std::endl;
    std::cout << "city=" << loaded->get_embedded("address")->get("city") << std::endl;
    std::cout << "session=" << loaded->get("session") << std::endl;

    // update only what changed
    loaded->set("name", "Ada Lovelace");
    em.flush();

    em.remove(loaded);
    em.flush();
    std::cout << "users=" << p_storage->size("users") << std::endl;
}
