/// @b License: @n Apache License v2.0
/// @copyright Robert Dunnagan
#include <kvorm/rocksdb.h>
#include <iostream>

using namespace kvorm;

int main(int argc, char** argv) {
    std::filesystem::remove_all("kvorm_example.rocksdb");

    auto p_meta = std::make_shared<ClassMetadata>("Point");
    p_meta->set_storage_name("points");
    p_meta->map_identifier("x");
    p_meta->map_identifier("y");
    p_meta->map_field("label");

    {
        auto em = kvorm::rocksdb::open("kvorm_example.rocksdb", {});
        em->metadata_factory().set_metadata_for(p_meta);

        for (Int x=0; x<10; ++x) {
            for (Int y=0; y<10; ++y) {
                auto point = em->create("Point");
                point->set("x", x);
                point->set("y", y);
                point->set("label", fmt::format("({}, {})", x, y));
                em->persist(point);
            }
        }
        em->flush();
    }

    auto em = kvorm::rocksdb::open("kvorm_example.rocksdb", {});
    em->metadata_factory().set_metadata_for(p_meta);

    auto point = em->find("Point", "{'x': 3, 'y': 7}"_json);
    std::cout << "label=" << point->get("label") << std::endl;

    point->set("label", "moved");
    em->flush();  // writes only the label

    em->clear();
    std::cout << "label=" << em->find("Point", "{'x': 3, 'y': 7}"_json)->get("label") << std::endl;
}
